#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include "dynargs.hpp"
#include <charconv>
#include <filesystem>
#include <format>
#include <set>
#include <sstream>
#include <utility>

using namespace dynargs;

//=============================================================================
// Test struct definitions
//=============================================================================

struct FlagArgs {
    Field<bool, "boolean"> boolean;
    Field<std::optional<bool>, "optional_boolean"> optionalBoolean = std::nullopt;
    Field<bool, "flag_a"> flagA = false;
    Field<bool, "flag_b"> flagB = true;
};

struct Flags {
    Field<bool, "flag_a"> flagA = false;
    Field<bool, "flag_b"> flagB = true;
};

struct Foo {
    Field<int, "x"> x;
};

struct Bar {
    Field<std::string, "y"> y;
};

struct Point {
    Field<float, "x"> x = 0.0f;
    Field<float, "y"> y = 0.0f;
};

struct Line {
    static constexpr std::string_view kHelp = "A line between two points";

    Field<Point, "start"> start;
    Field<Point, "finish"> finish;
    Field<std::string, "label"> label = "line";
};

struct Inner {
    Field<int, "depth"> depth;
};

struct Required {
    Field<int, "count"> count;
    Field<Inner, "inner"> inner;
};

struct Commit {
    static constexpr std::string_view kCommandName = "commit";
    static constexpr std::string_view kHelp = "Record changes";

    Field<std::string, "message"> message;
    Field<bool, "all"> all = false;
};

struct Checkout {
    Field<std::string, "branch"> branch;
};

struct BarCommand {
    Field<int, "level"> level = 1;
};

struct Git {
    Field<std::variant<Commit, Checkout>, "command"> command;
    Field<bool, "verbose"> verbose = false;
};

struct GitWithDefault {
    Field<std::variant<Commit, Checkout>, "command"> command = Checkout { "main" };
};

struct GitWithoutSubcommands {
    Field<std::variant<Commit, Checkout>, "command", conf::AvoidSubcommands> command = Checkout { "main" };
};

struct WithOrigin {
    Field<std::optional<Point>, "origin"> origin = std::nullopt;
};

enum class Color { red, green, blue };

namespace dynargs
{
template <>
struct EnumTraits<Color>
{
    static constexpr std::array kEnumerators = {
        std::pair { Color::red,   std::string_view("red") },
        std::pair { Color::green, std::string_view("green") },
        std::pair { Color::blue,  std::string_view("blue") }
    };
};
} // namespace dynargs

struct Style {
    Field<Literal<"fast", "accurate">, "mode"> mode = "fast";
    Field<Color, "color"> color = Color::red;
};

struct Collections {
    Field<std::vector<int>, "numbers"> numbers = std::vector<int> { 1, 2 };
    Field<std::tuple<int, std::string>, "pair"> pair = std::tuple<int, std::string> { 1, "a" };
    Field<std::map<std::string, int>, "weights"> weights = std::map<std::string, int> {};
    Field<std::variant<int, std::string>, "id"> id = 0;
    Field<std::optional<int>, "limit"> limit = std::nullopt;
    Field<double, "rate"> rate = 0.1;
    Field<std::filesystem::path, "output"> output = std::filesystem::path("out.txt");
    Field<std::array<float, 2>, "scale"> scale = std::array<float, 2> { 1.0f, 2.5f };
    Field<std::set<std::string>, "tags"> tags = std::set<std::string> { "a", "b" };
};

struct Markers {
    Field<int, "seed", conf::Fixed> seed = 42;
    Field<int, "secret", conf::Suppress> secret = 7;
    Field<bool, "strict", conf::FlagConversionOff> strict = false;
    Field<float, "learning_rate", conf::Name<"lr">, conf::Help<"Step size">> learningRate = 0.5f;
    Field<Annotated<std::string, conf::Positional>, "input"> input;
};

struct Positionals {
    Field<std::string, "input", conf::Positional> input;
    Field<std::vector<int>, "numbers", conf::Positional> numbers = std::vector<int> {};
    Field<int, "level"> level = 0;
};

struct Range {
    Field<int, "low"> low = 0;
    Field<int, "high"> high = 10;

    std::expected<void, std::string> validate() const
    {
        if (low() > high())
            return std::unexpected("low must not exceed high");

        return {};
    }
};

struct WithStatic {
    static inline int counter = 0;
    int plain = 3;
    Field<int, "x"> x = 1;
};

struct Opaque {
    int handle = 0;
};

struct WithOpaque {
    Field<Opaque, "opaque"> opaque = Opaque { 5 };
    Field<int, "x"> x = 1;
};

struct WithRequiredOpaque {
    Field<Opaque, "opaque"> opaque;
};

struct Merged {
    Field<Foo, ""> foo;
    Field<int, "x"> x = 0;
};

struct MergedDistinct {
    Field<Foo, ""> foo;
    Field<int, "z"> z = 0;
};

struct Renamed {
    Field<int, "a"> a = 0;
    Field<int, "b", conf::Name<"a">> b = 0;
};

struct DashCollision {
    Field<int, "flag_a"> first = 0;
    Field<int, "flag-a"> second = 0;
};

struct NegatedCollision {
    Field<bool, "x"> x = false;
    Field<int, "no_x"> noX = 0;
};

struct BadFixed {
    Field<int, "seed", conf::Fixed> seed;
};

struct TreeNode {
    Field<std::string, "label"> label;
    Field<std::vector<TreeNode>, "children"> children;
};

struct Mixed {
    Field<std::variant<Foo, int>, "value"> value;
};

template <typename T = int>
struct Box {
    Field<T, "value"> value;
};

template <typename T>
struct NoDefaultBox {
    Field<T, "value"> value;
};

using JsonDict = std::map<std::string, nlohmann::json>;

ConstructorSpec jsonSpec()
{
    return makeSpec<JsonDict>(1, "JSON",
        [] (std::span<std::string const> tokens) -> std::expected<JsonDict, std::string>
        {
            auto parsed = nlohmann::json::parse(tokens.front(), nullptr, false);

            if (parsed.is_discarded() || (! parsed.is_object()))
                return std::unexpected(std::string("expected a JSON object"));

            return parsed.get<JsonDict>();
        },
        [] (JsonDict const& dict) { return std::vector<std::string> { nlohmann::json(dict).dump() }; });
}

ConstructorSpec hexSpec()
{
    return makeSpec<int>(1, "HEX",
        [] (std::span<std::string const> tokens) -> std::expected<int, std::string>
        {
            auto const& token = tokens.front();
            int value = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value, 16);

            if (ec != std::errc() || ptr != token.data() + token.size())
                return std::unexpected(std::format("not a hex number: '{}'", token));

            return value;
        },
        [] (int value) { return std::vector<std::string> { std::format("{:x}", value) }; });
}

struct JsonArgs {
    Field<JsonDict, "x"> x;
};

struct AnnotatedJsonArgs {
    Field<JsonDict, "x", conf::Constructor<&jsonSpec>> x;
};

struct HexArgs {
    Field<int, "address", conf::Constructor<&hexSpec>> address = 255;
    Field<int, "count"> count = 1;
};

template <typename T>
std::unique_ptr<GroupNode const> schemaOf(ConstructorRegistry const& registry = ConstructorRegistry())
{
    Resolver resolver;
    return SchemaBuilder(registry).build(resolver.resolve(metaTypeOf<T>()), nullptr);
}

std::map<std::string, LeafNode const*> leavesOf(ParserNode const& root)
{
    std::map<std::string, LeafNode const*> result;
    forEachLeaf(root, [&result] (LeafNode const& leaf) { result[leaf.key()] = &leaf; });
    return result;
}

//=============================================================================
// Path tests
//=============================================================================

TEST_SUITE("Path") {

TEST_CASE("default construction") {
    Path path;
    CHECK(path.empty());
    CHECK(path.toString() == "");
    CHECK(path.flagName() == "--");
}

TEST_CASE("child and toString") {
    auto path = Path().child("start").child("x");
    CHECK(path.size() == 2);
    CHECK(path.toString() == "start.x");
    CHECK(path.flagName() == "--start.x");
}

TEST_CASE("variant segments appear in the key but not in the flag") {
    auto path = Path().child("command").variant("commit").child("message");
    CHECK(path.toString() == "command.(commit).message");
    CHECK(path.prefix() == "command.message");
    CHECK(path.flagName() == "--command.message");
}

TEST_CASE("underscores become dashes in flags") {
    auto path = Path().child("optional_boolean");
    CHECK(path.toString() == "optional_boolean");
    CHECK(path.flagName() == "--optional-boolean");
}

TEST_CASE("empty segments are skipped") {
    auto path = Path().child("").variant("bar").child("y");
    CHECK(path.toString() == "(bar).y");
    CHECK(path.flagName() == "--y");
}

TEST_CASE("fromString") {
    auto path = Path::fromString("command.(commit).message");
    REQUIRE(path.size() == 3);
    CHECK(path[0] == PathSegment { "command", false });
    CHECK(path[1] == PathSegment { "commit", true });
    CHECK(path[2] == PathSegment { "message", false });
    CHECK(path.toString() == "command.(commit).message");
    CHECK(Path::fromString("").empty());
}

TEST_CASE("stream output") {
    std::ostringstream ss;
    ss << Path().child("a").child("b");
    CHECK(ss.str() == "a.b");
}

} // TEST_SUITE("Path")

//=============================================================================
// Field tests
//=============================================================================

TEST_SUITE("Field") {

TEST_CASE("default construction holds no value") {
    Field<int, "x"> fld;
    CHECK_FALSE(fld.hasValue());
    CHECK(fld() == 0);
    CHECK(fld.fieldname() == "x");
}

TEST_CASE("initialised field holds a value") {
    Field<std::string, "name"> fld = "hello";
    CHECK(fld.hasValue());
    CHECK(fld() == "hello");
    CHECK(fld->size() == 5);
}

TEST_CASE("assignment marks the field as set") {
    Field<int, "x"> fld;
    fld = 3;
    CHECK(fld.hasValue());
    CHECK(fld() == 3);
}

TEST_CASE("modification through the accessors marks the field as set") {
    Field<int, "x"> count;
    count() = 5;
    CHECK(count.hasValue());
    CHECK(count() == 5);

    Field<Point, "start"> start;
    start->x = 2.0f;
    CHECK(start.hasValue());
    CHECK(start().x.hasValue());

    Field<Point, "finish"> finish;
    CHECK(std::as_const(finish)().x() == 0.0f);
    CHECK_FALSE(finish.hasValue());
}

TEST_CASE("record defaults") {
    FlagArgs args;
    CHECK_FALSE(args.boolean.hasValue());
    CHECK(args.optionalBoolean.hasValue());
    CHECK(args.flagA.hasValue());
    CHECK(args.flagB() == true);
}

TEST_CASE("annotated fields store the plain type") {
    Markers markers;
    markers.input = std::string("file.txt");
    CHECK(markers.input() == "file.txt");
    static_assert(std::is_same_v<decltype(markers.input)::ValueType, std::string>);
}

TEST_CASE("markers") {
    auto const a = decltype(Markers::learningRate)::annotations();
    CHECK(a.name == "lr");
    CHECK(a.help == "Step size");
    CHECK_FALSE(a.fixed);
    CHECK(decltype(Markers::seed)::annotations().fixed);
    CHECK(decltype(Markers::secret)::annotations().suppress);
}

TEST_CASE("Literal") {
    using Mode = Literal<"fast", "accurate">;

    Mode mode;
    CHECK(mode.value() == "fast");
    CHECK(Mode("accurate").index() == 1);
    CHECK_FALSE(Mode::fromString("slow").has_value());
    CHECK_THROWS_AS(Mode("slow"), std::invalid_argument);
}

} // TEST_SUITE("Field")

//=============================================================================
// MetaType tests
//=============================================================================

TEST_SUITE("MetaType") {

TEST_CASE("record fields in declaration order") {
    auto const& meta = metaTypeOf<FlagArgs>();
    CHECK(meta.shape() == MetaType::Shape::record);

    auto fields = meta.fields();
    REQUIRE(fields.size() == 4);
    CHECK(fields[0].fieldname == "boolean");
    CHECK(fields[1].fieldname == "optional_boolean");
    CHECK(fields[2].fieldname == "flag_a");
    CHECK(fields[3].fieldname == "flag_b");
    CHECK(&fields[1].metaType() == &metaTypeOf<std::optional<bool>>());
}

TEST_CASE("non-field members are not part of the record") {
    CHECK(metaTypeOf<WithStatic>().fields().size() == 1);
    CHECK(metaTypeOf<Opaque>().shape() == MetaType::Shape::primitive);
}

TEST_CASE("shapes") {
    CHECK(metaTypeOf<int>().shape() == MetaType::Shape::primitive);
    CHECK(metaTypeOf<std::optional<int>>().shape() == MetaType::Shape::optional);
    CHECK(metaTypeOf<std::vector<int>>().shape() == MetaType::Shape::sequence);
    CHECK(metaTypeOf<std::set<int>>().shape() == MetaType::Shape::sequence);
    CHECK(metaTypeOf<std::tuple<int, float>>().shape() == MetaType::Shape::fixedTuple);
    CHECK(metaTypeOf<std::array<int, 3>>().shape() == MetaType::Shape::fixedTuple);
    CHECK(metaTypeOf<std::map<std::string, int>>().shape() == MetaType::Shape::mapping);
    CHECK(metaTypeOf<Literal<"a", "b">>().shape() == MetaType::Shape::literal);
    CHECK(metaTypeOf<Color>().shape() == MetaType::Shape::literal);
    CHECK(metaTypeOf<std::variant<Foo, Bar>>().shape() == MetaType::Shape::variant);
    CHECK(metaTypeOf<Annotated<int, conf::Positional>>().shape() == MetaType::Shape::annotated);
}

TEST_CASE("singletons") {
    CHECK(&metaTypeOf<Point>() == &metaTypeOf<Point>());
    CHECK(&metaTypeOf<Point const>() == &metaTypeOf<Point>());
}

TEST_CASE("names") {
    CHECK(metaTypeOf<Commit>().name() == "commit");
    CHECK(metaTypeOf<Checkout>().name() == "checkout");
    CHECK(metaTypeOf<BarCommand>().name() == "bar-command");
    CHECK(metaTypeOf<Box<int>>().name() == "box-int");
    CHECK(metaTypeOf<Box<std::string>>().name() == "box-str");
    CHECK(metaTypeOf<Box<Point>>().name() == "box-point");
    CHECK(metaTypeOf<Line>().help() == "A line between two points");
}

TEST_CASE("enum choices") {
    auto const& meta = metaTypeOf<Color>();
    CHECK(meta.choices() == std::vector<std::string> { "red", "green", "blue" });
    CHECK(meta.fromChoice(1)->get<Color>() == Color::green);
    CHECK(meta.choiceOf(Fundamental<Color>(Color::blue)) == 2);
}

TEST_CASE("record assembly") {
    auto const& meta = metaTypeOf<Point>();
    std::vector<ValuePtr> parts { makeValue(1.0f), makeValue(2.0f) };

    auto value = meta.assemble(parts);
    REQUIRE(value.has_value());
    CHECK((*value)->get<Point>().x() == 1.0f);
    CHECK((*value)->get<Point>().y() == 2.0f);
    CHECK_FALSE(meta.assemble(std::vector<ValuePtr> { makeValue(1.0f) }).has_value());
}

TEST_CASE("disassemble reports unset fields") {
    auto parts = metaTypeOf<FlagArgs>().disassemble(Fundamental<FlagArgs>(FlagArgs {}));
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == nullptr);
    CHECK(parts[2]->get<bool>() == false);
}

TEST_CASE("validate hook") {
    auto const& meta = metaTypeOf<Range>();
    std::vector<ValuePtr> parts { makeValue(5), makeValue(1) };

    auto value = meta.assemble(parts);
    REQUIRE_FALSE(value.has_value());
    CHECK(value.error() == "low must not exceed high");
}

TEST_CASE("variant wrap and unwrap") {
    auto const& meta = metaTypeOf<std::variant<int, std::string>>();
    auto wrapped = meta.wrap(1, makeValue(std::string("abc")));
    REQUIRE(wrapped != nullptr);
    CHECK(meta.alternativeOf(*wrapped) == 1);
    CHECK(meta.unwrap(*wrapped)->get<std::string>() == "abc");
}

TEST_CASE("get with wrong type throws") {
    auto value = makeValue(3);
    CHECK(value->holds<int>());
    CHECK_THROWS_AS(value->get<float>(), std::bad_cast);
}

TEST_CASE("shape stream output") {
    std::ostringstream ss;
    ss << MetaType::Shape::fixedTuple;
    CHECK(ss.str() == "fixed tuple");
}

} // TEST_SUITE("MetaType")

//=============================================================================
// Resolver tests
//=============================================================================

TEST_SUITE("Resolver") {

TEST_CASE("resolution is idempotent") {
    Resolver resolver;

    for (auto* meta : { &metaTypeOf<FlagArgs>(), &metaTypeOf<Git>(), &metaTypeOf<Collections>(),
                        &metaTypeOf<Markers>(), &metaTypeOf<Box<float>>(), &metaTypeOf<WithOrigin>() })
    {
        auto desc = resolver.resolve(*meta);
        auto again = resolver.resolve(*desc);
        CHECK(*again == *desc);
    }
}

TEST_CASE("annotations are moved to the field") {
    auto desc = Resolver().resolve(metaTypeOf<Markers>());
    REQUIRE(desc->members.size() == 5);

    auto const& input = desc->members[4];
    CHECK(input.type->kind == TypeDescriptor::Kind::primitive);
    CHECK(input.type->meta == &metaTypeOf<std::string>());
    CHECK(input.annotations.positional);

    auto const& lr = desc->members[3];
    CHECK(lr.name == "lr");
    CHECK(lr.fieldname == "learning_rate");
}

TEST_CASE("kinds") {
    auto desc = Resolver().resolve(metaTypeOf<Collections>());
    CHECK(desc->kind == TypeDescriptor::Kind::nestedStruct);
    CHECK(desc->members[0].type->kind == TypeDescriptor::Kind::sequence);
    CHECK(desc->members[1].type->kind == TypeDescriptor::Kind::fixedTuple);
    CHECK(desc->members[1].type->children.size() == 2);
    CHECK(desc->members[2].type->kind == TypeDescriptor::Kind::mapping);
    CHECK(desc->members[3].type->kind == TypeDescriptor::Kind::union_);
    CHECK_FALSE(desc->members[3].type->isChoice());
    CHECK(desc->members[4].type->kind == TypeDescriptor::Kind::optional);
}

TEST_CASE("union of records is a choice") {
    auto desc = Resolver().resolve(metaTypeOf<std::variant<Foo, Bar>>());
    CHECK(desc->kind == TypeDescriptor::Kind::union_);
    CHECK(desc->isChoice());
    CHECK(isSubcommandShape(*desc));
    CHECK(isSubcommandShape(*Resolver().resolve(metaTypeOf<std::optional<Point>>())));
    CHECK_FALSE(isSubcommandShape(*Resolver().resolve(metaTypeOf<std::optional<int>>())));
}

TEST_CASE("mixed unions are rejected") {
    CHECK_THROWS_AS(Resolver().resolve(metaTypeOf<Mixed>()), UnsupportedUnionShapeError);
}

TEST_CASE("recursive types are rejected") {
    Resolver resolver;
    CHECK_THROWS_AS(resolver.resolve(metaTypeOf<TreeNode>()), CyclicTypeError);

    try
    {
        resolver.resolve(metaTypeOf<TreeNode>());
    }
    catch (CyclicTypeError const& e)
    {
        CHECK(std::string(e.what()).find("TreeNode") != std::string::npos);
    }

    // the resolver is usable again after the failure
    CHECK(resolver.resolve(metaTypeOf<Line>())->members.size() == 3);
}

TEST_CASE("repeated records are not cycles") {
    auto desc = Resolver().resolve(metaTypeOf<Line>());
    CHECK(desc->members[0].type->kind == TypeDescriptor::Kind::nestedStruct);
    CHECK(desc->members[1].type->kind == TypeDescriptor::Kind::nestedStruct);
}

TEST_CASE("generic bindings") {
    auto desc = Resolver().resolve(metaTypeOf<Box<float>>());
    REQUIRE(desc->bindings.size() == 1);
    CHECK(desc->bindings[0] == &metaTypeOf<float>());
    CHECK(desc->members[0].type->meta == &metaTypeOf<float>());
    CHECK_FALSE(*Resolver().resolve(metaTypeOf<Box<float>>()) == *Resolver().resolve(metaTypeOf<Box<int>>()));
}

TEST_CASE("kind stream output") {
    std::ostringstream ss;
    ss << TypeDescriptor::Kind::nestedStruct;
    CHECK(ss.str() == "nested struct");
}

} // TEST_SUITE("Resolver")

//=============================================================================
// ConstructorRegistry tests
//=============================================================================

TEST_SUITE("ConstructorRegistry") {

TEST_CASE("built-in metavars") {
    ConstructorRegistry registry;
    Resolver resolver;

    auto metavar = [&] (MetaType const& meta) { return registry.find(*resolver.resolve(meta))->metavar; };

    CHECK(metavar(metaTypeOf<int>()) == "INT");
    CHECK(metavar(metaTypeOf<unsigned char>()) == "INT");
    CHECK(metavar(metaTypeOf<double>()) == "FLOAT");
    CHECK(metavar(metaTypeOf<std::string>()) == "STR");
    CHECK(metavar(metaTypeOf<std::filesystem::path>()) == "PATH");
    CHECK(metavar(metaTypeOf<bool>()) == "{True,False}");
    CHECK(metavar(metaTypeOf<Color>()) == "{red,green,blue}");
    CHECK(metavar(metaTypeOf<std::vector<int>>()) == "INT [INT ...]");
    CHECK(metavar(metaTypeOf<std::tuple<int, std::string>>()) == "INT STR");
    CHECK(metavar(metaTypeOf<std::map<std::string, int>>()) == "STR INT [STR INT ...]");
    CHECK(metavar(metaTypeOf<std::optional<int>>()) == "{None}|INT");
    CHECK(metavar(metaTypeOf<std::variant<int, std::string>>()) == "INT|STR");
}

TEST_CASE("nargs") {
    ConstructorRegistry registry;
    Resolver resolver;

    CHECK(registry.find(*resolver.resolve(metaTypeOf<int>()))->nargs == 1);
    CHECK(registry.find(*resolver.resolve(metaTypeOf<std::vector<int>>()))->isVariable());
    CHECK(registry.find(*resolver.resolve(metaTypeOf<std::tuple<int, std::string, float>>()))->nargs == 3);
    CHECK(registry.find(*resolver.resolve(metaTypeOf<std::array<std::pair<int, int>, 2>>()))->nargs == 4);
}

TEST_CASE("no rule for opaque types") {
    ConstructorRegistry registry;
    CHECK_FALSE(registry.find(*Resolver().resolve(metaTypeOf<Opaque>())).has_value());
    CHECK_FALSE(registry.find(*Resolver().resolve(metaTypeOf<std::vector<Opaque>>())).has_value());
    CHECK_FALSE(registry.find(*Resolver().resolve(metaTypeOf<JsonDict>())).has_value());
}

TEST_CASE("containers of empty tuples have no rule") {
    ConstructorRegistry registry;
    Resolver resolver;

    CHECK(registry.find(*resolver.resolve(metaTypeOf<std::tuple<>>()))->nargs == 0);
    CHECK_FALSE(registry.find(*resolver.resolve(metaTypeOf<std::vector<std::tuple<>>>())).has_value());

    using EmptyMap = std::map<std::tuple<>, std::tuple<>>;
    CHECK_FALSE(registry.find(*resolver.resolve(metaTypeOf<EmptyMap>())).has_value());
}

TEST_CASE("primitive conversions") {
    ConstructorRegistry registry;
    auto spec = registry.find(*Resolver().resolve(metaTypeOf<int>()));
    REQUIRE(spec.has_value());

    std::vector<std::string> tokens { "-42" };
    CHECK((*spec->instanceFromTokens(tokens))->get<int>() == -42);

    tokens = { "+7" };
    CHECK((*spec->instanceFromTokens(tokens))->get<int>() == 7);

    tokens = { "+-5" };
    CHECK_FALSE(spec->instanceFromTokens(tokens).has_value());

    tokens = { "+" };
    CHECK_FALSE(spec->instanceFromTokens(tokens).has_value());

    tokens = { "4x" };
    CHECK_FALSE(spec->instanceFromTokens(tokens).has_value());

    tokens = { "99999999999999999999" };
    CHECK_FALSE(spec->instanceFromTokens(tokens).has_value());

    auto boolean = registry.find(*Resolver().resolve(metaTypeOf<bool>()));
    tokens = { "true" };
    CHECK((*boolean->instanceFromTokens(tokens))->get<bool>());
    tokens = { "yes" };
    CHECK_FALSE(boolean->instanceFromTokens(tokens).has_value());
    CHECK(boolean->tokensFromInstance(Fundamental<bool>(false)) == std::vector<std::string> { "False" });
}

TEST_CASE("union of primitives tries alternatives in order") {
    ConstructorRegistry registry;
    auto spec = registry.find(*Resolver().resolve(metaTypeOf<std::variant<int, std::string>>()));
    REQUIRE(spec.has_value());

    std::vector<std::string> tokens { "12" };
    auto number = spec->instanceFromTokens(tokens);
    REQUIRE(number.has_value());
    CHECK(std::get<int>((*number)->get<std::variant<int, std::string>>()) == 12);

    tokens = { "twelve" };
    auto text = spec->instanceFromTokens(tokens);
    REQUIRE(text.has_value());
    CHECK(std::get<std::string>((*text)->get<std::variant<int, std::string>>()) == "twelve");
    CHECK(spec->tokensFromInstance(**text) == std::vector<std::string> { "twelve" });
}

TEST_CASE("user rules precede built-in rules") {
    ConstructorRegistry registry;
    auto scope = registry.scope();
    registry.add<int>(hexSpec());

    Resolver resolver;
    CHECK(registry.find(*resolver.resolve(metaTypeOf<int>()))->metavar == "HEX");
    CHECK(registry.find(*resolver.resolve(metaTypeOf<std::vector<int>>()))->metavar == "HEX [HEX ...]");
    CHECK(registry.find(*resolver.resolve(metaTypeOf<float>()))->metavar == "FLOAT");
}

TEST_CASE("first matching rule wins") {
    ConstructorRegistry registry;
    auto scope = registry.scope();

    auto first = hexSpec();
    first.metavar = "FIRST";
    auto second = hexSpec();
    second.metavar = "SECOND";

    registry.add<int>(first);
    registry.add<int>(second);

    CHECK(registry.find(*Resolver().resolve(metaTypeOf<int>()))->metavar == "FIRST");
}

TEST_CASE("predicate rules") {
    ConstructorRegistry registry;
    auto scope = registry.scope();

    registry.add([] (TypeDescriptor const& desc) { return desc.kind == TypeDescriptor::Kind::mapping; },
                 [] (TypeDescriptor const&, ConstructorRegistry const&) { return jsonSpec(); });

    CHECK(registry.find(*Resolver().resolve(metaTypeOf<JsonDict>()))->metavar == "JSON");
}

TEST_CASE("rules are removed when their scope ends") {
    ConstructorRegistry registry;
    Resolver resolver;
    auto desc = resolver.resolve(metaTypeOf<int>());
    CHECK(registry.depth() == 1);

    {
        auto outer = registry.scope();
        registry.add<int>(hexSpec());
        CHECK(registry.depth() == 2);

        {
            auto inner = registry.scope();
            CHECK(registry.depth() == 3);
            CHECK(registry.find(*desc)->metavar == "HEX");
        }

        CHECK(registry.depth() == 2);
        CHECK(registry.find(*desc)->metavar == "HEX");
    }

    CHECK(registry.depth() == 1);
    CHECK(registry.find(*desc)->metavar == "INT");
}

TEST_CASE("scopes are released when an exception propagates") {
    ConstructorRegistry registry;

    try
    {
        auto scope = registry.scope();
        registry.add<int>(hexSpec());
        throw std::runtime_error("failure");
    }
    catch (std::runtime_error const&)
    {
    }

    CHECK(registry.depth() == 1);
    CHECK(registry.find(*Resolver().resolve(metaTypeOf<int>()))->metavar == "INT");
}

TEST_CASE("scopes released out of order are an internal error") {
    ConstructorRegistry registry;

    auto releaseOutOfOrder = [&registry]
    {
        auto outer = registry.scope();
        auto inner = registry.scope();
        auto moved = std::move(outer);
    };

    CHECK_THROWS_AS(releaseOutOfOrder(), InternalError);
    CHECK(registry.depth() == 2);
}

TEST_CASE("lookup honours per-field overrides") {
    ConstructorRegistry registry;
    Annotations annotations;
    annotations.constructor = &hexSpec;

    auto desc = Resolver().resolve(metaTypeOf<int>());
    CHECK(registry.lookup(*desc, annotations, Path().child("x")).metavar == "HEX");
    CHECK(registry.lookup(*desc, Annotations(), Path().child("x")).metavar == "INT");
    CHECK_THROWS_AS(registry.lookup(*Resolver().resolve(metaTypeOf<Opaque>()), Annotations(), Path().child("x")),
                    NoMatchingRuleError);
}

} // TEST_SUITE("ConstructorRegistry")

//=============================================================================
// SchemaBuilder tests
//=============================================================================

TEST_SUITE("SchemaBuilder") {

TEST_CASE("leaf definitions") {
    auto root = schemaOf<FlagArgs>();
    REQUIRE(root->children().size() == 4);

    auto leaves = leavesOf(*root);

    auto boolean = leaves.at("boolean")->definition();
    CHECK(boolean.flag == "--boolean");
    CHECK(boolean.required);
    CHECK_FALSE(boolean.booleanFlag);
    CHECK(boolean.metavar == "{True,False}");

    auto optional = leaves.at("optional_boolean")->definition();
    CHECK(optional.flag == "--optional-boolean");
    CHECK_FALSE(optional.required);
    CHECK_FALSE(optional.booleanFlag);
    CHECK(optional.defaultDisplay == std::vector<std::string> { "None" });

    auto flagA = leaves.at("flag_a")->definition();
    CHECK(flagA.booleanFlag);
    CHECK(flagA.nargs == 0);
    CHECK(flagA.negatedFlag() == "--no-flag-a");
    CHECK(flagA.defaultDisplay == std::vector<std::string> { "False" });
}

TEST_CASE("nested records become groups") {
    auto root = schemaOf<Line>();
    REQUIRE(root->children().size() == 3);
    CHECK(root->children()[0]->kind() == ParserNode::Kind::group);
    CHECK(root->children()[0]->field().defaultValue.kind == Default::Kind::missing);

    auto leaves = leavesOf(*root);
    CHECK(leaves.size() == 5);
    CHECK(leaves.at("start.x")->definition().flag == "--start.x");
    CHECK(leaves.at("finish.y")->field().defaultValue.hasValue());
    CHECK(root->field().doc == "A line between two points");
}

TEST_CASE("leaf paths are unique") {
    for (auto const& root : { schemaOf<Git>(), schemaOf<Collections>(), schemaOf<Line>(), schemaOf<MergedDistinct>() })
    {
        std::set<std::string> keys;
        std::size_t count = 0;

        forEachLeaf(*root, [&] (LeafNode const& leaf) { keys.insert(leaf.key()); ++count; });
        CHECK(keys.size() == count);
    }
}

TEST_CASE("colliding names are rejected") {
    CHECK_THROWS_AS(schemaOf<Merged>(), AmbiguousFieldNameError);
    CHECK_THROWS_AS(schemaOf<Renamed>(), AmbiguousFieldNameError);
    CHECK_THROWS_AS(schemaOf<DashCollision>(), AmbiguousFieldNameError);
    CHECK_THROWS_AS(schemaOf<NegatedCollision>(), AmbiguousFieldNameError);
}

TEST_CASE("merged records share the parent namespace") {
    auto leaves = leavesOf(*schemaOf<MergedDistinct>());
    CHECK(leaves.contains("x"));
    CHECK(leaves.contains("z"));
    CHECK(leaves.at("x")->definition().flag == "--x");
}

TEST_CASE("non-field members are excluded") {
    auto root = schemaOf<WithStatic>();
    REQUIRE(root->children().size() == 1);
    CHECK(root->children()[0]->key() == "x");
}

TEST_CASE("subcommands") {
    auto root = schemaOf<Git>();
    REQUIRE(root->children()[0]->kind() == ParserNode::Kind::choice);

    auto const& choice = static_cast<ChoiceNode const&>(*root->children()[0]);
    REQUIRE(choice.variants().size() == 2);
    CHECK(choice.variants()[0].name == "command:commit");
    CHECK(choice.variants()[0].help == "Record changes");
    CHECK(choice.variants()[1].name == "command:checkout");
    CHECK_FALSE(choice.defaultVariant().has_value());
    CHECK_FALSE(choice.implicit());

    auto leaves = leavesOf(*root);
    CHECK(leaves.at("command.(commit).message")->definition().flag == "--command.message");
    CHECK(leaves.at("command.(checkout).branch")->definition().flag == "--command.branch");
}

TEST_CASE("default variant") {
    auto root = schemaOf<GitWithDefault>();
    auto const& choice = static_cast<ChoiceNode const&>(*root->children()[0]);
    CHECK(choice.defaultVariant() == 1);

    auto leaves = leavesOf(*root);
    auto branch = leaves.at("command.(checkout).branch")->definition();
    CHECK_FALSE(branch.required);
    CHECK(branch.defaultDisplay == std::vector<std::string> { "main" });
    CHECK(leaves.at("command.(commit).message")->definition().required);
}

TEST_CASE("avoid subcommands") {
    auto root = schemaOf<GitWithoutSubcommands>();
    auto const& choice = static_cast<ChoiceNode const&>(*root->children()[0]);
    CHECK(choice.implicit());
    REQUIRE(choice.variants().size() == 1);
    CHECK(choice.variants()[0].name == "command:checkout");
}

TEST_CASE("optional records") {
    auto root = schemaOf<WithOrigin>();
    auto const& choice = static_cast<ChoiceNode const&>(*root->children()[0]);
    REQUIRE(choice.variants().size() == 2);
    CHECK(choice.variants()[0].name == "origin:point");
    CHECK(choice.variants()[1].name == "origin:None");
    CHECK(choice.variants()[1].subtree == nullptr);
    CHECK(choice.defaultVariant() == 1);
}

TEST_CASE("markers") {
    auto leaves = leavesOf(*schemaOf<Markers>());

    auto seed = leaves.at("seed")->definition();
    CHECK(seed.fixed);
    CHECK(seed.defaultDisplay == std::vector<std::string> { "42" });

    CHECK(leaves.at("secret")->definition().suppressed);

    auto strict = leaves.at("strict")->definition();
    CHECK_FALSE(strict.booleanFlag);
    CHECK(strict.nargs == 1);

    auto lr = leaves.at("lr")->definition();
    CHECK(lr.flag == "--lr");
    CHECK(lr.help == "Step size");

    auto input = leaves.at("input")->definition();
    CHECK(input.positional);
    CHECK(input.flag.empty());
    CHECK(input.required);
}

TEST_CASE("fixed fields need a default") {
    CHECK_THROWS_AS(schemaOf<BadFixed>(), StructuralError);
}

TEST_CASE("unrepresentable fields with a default are fixed") {
    auto leaves = leavesOf(*schemaOf<WithOpaque>());
    CHECK(leaves.at("opaque")->isFixed());
    CHECK_FALSE(leaves.at("x")->isFixed());
}

TEST_CASE("unrepresentable required fields are rejected") {
    CHECK_THROWS_AS(schemaOf<WithRequiredOpaque>(), NoMatchingRuleError);
    CHECK_THROWS_AS(schemaOf<JsonArgs>(), NoMatchingRuleError);
}

TEST_CASE("per-field constructor") {
    auto leaves = leavesOf(*schemaOf<HexArgs>());
    auto address = leaves.at("address")->definition();
    CHECK(address.metavar == "HEX");
    CHECK(address.defaultDisplay == std::vector<std::string> { "ff" });
    CHECK(leaves.at("count")->definition().metavar == "INT");
}

TEST_CASE("default instance overrides declared defaults") {
    Line line;
    line.label = "custom";

    Point finish;
    finish.x = 3.0f;
    line.finish = finish;

    Resolver resolver;
    ConstructorRegistry registry;
    auto root = SchemaBuilder(registry).build(resolver.resolve(metaTypeOf<Line>()), makeValue(line));
    auto leaves = leavesOf(*root);

    CHECK(leaves.at("label")->definition().defaultDisplay == std::vector<std::string> { "custom" });
    CHECK(leaves.at("finish.x")->definition().defaultDisplay == std::vector<std::string> { "3" });
    CHECK(leaves.at("start.x")->definition().defaultDisplay == std::vector<std::string> { "0" });
}

TEST_CASE("default instance fields set through accessors") {
    Line line;
    line.start().x = 4.0f;

    Resolver resolver;
    ConstructorRegistry registry;
    auto root = SchemaBuilder(registry).build(resolver.resolve(metaTypeOf<Line>()), makeValue(line));
    auto leaves = leavesOf(*root);

    CHECK(leaves.at("start.x")->definition().defaultDisplay == std::vector<std::string> { "4" });
    CHECK(leaves.at("label")->definition().defaultDisplay == std::vector<std::string> { "line" });

    Git git;
    git.command = Commit { "fix" };

    auto gitRoot = SchemaBuilder(registry).build(resolver.resolve(metaTypeOf<Git>()), makeValue(git));
    auto const& choice = static_cast<ChoiceNode const&>(*gitRoot->children()[0]);
    CHECK(choice.defaultVariant() == 0);
    CHECK_FALSE(leavesOf(*gitRoot).at("command.(commit).message")->definition().required);
}

TEST_CASE("default display round-trips") {
    std::size_t checked = 0;

    for (auto const& root : { schemaOf<Collections>(), schemaOf<Style>(), schemaOf<FlagArgs>(), schemaOf<HexArgs>(), schemaOf<Line>() })
    {
        forEachLeaf(*root, [&checked] (LeafNode const& leaf)
        {
            auto const& def = leaf.field().defaultValue;

            if (! def.hasValue())
                return;

            auto const& ctor = leaf.constructor();
            REQUIRE(ctor.accepts(*def.value));

            auto const tokens = ctor.tokensFromInstance(*def.value);
            auto const parsed = ctor.instanceFromTokens(tokens);
            REQUIRE(parsed.has_value());
            CHECK(ctor.tokensFromInstance(**parsed) == tokens);
            ++checked;
        });
    }

    CHECK(checked == 21);
}

TEST_CASE("default display of specific values") {
    auto leaves = leavesOf(*schemaOf<Collections>());
    CHECK(leaves.at("numbers")->definition().defaultDisplay == std::vector<std::string> { "1", "2" });
    CHECK(leaves.at("pair")->definition().defaultDisplay == std::vector<std::string> { "1", "a" });
    CHECK(leaves.at("weights")->definition().defaultDisplay.empty());
    CHECK(leaves.at("id")->definition().defaultDisplay == std::vector<std::string> { "0" });
    CHECK(leaves.at("rate")->definition().defaultDisplay == std::vector<std::string> { "0.1" });
    CHECK(leaves.at("scale")->definition().defaultDisplay == std::vector<std::string> { "1", "2.5" });
    CHECK(leaves.at("scale")->definition().nargs == 2);
}

} // TEST_SUITE("SchemaBuilder")

//=============================================================================
// Reconstructor tests
//=============================================================================

TEST_SUITE("Reconstructor") {

TEST_CASE("leaves use their defaults when absent") {
    auto root = schemaOf<Flags>();
    FlatValues values { { "flag_a", std::nullopt }, { "flag_b", std::vector<std::string> { "False" } } };

    auto result = Reconstructor::assembleAll(*root, values);
    REQUIRE(result.has_value());
    CHECK((*result)->get<Flags>().flagA() == false);
    CHECK((*result)->get<Flags>().flagB() == false);
}

TEST_CASE("every key is consumed") {
    auto root = schemaOf<Flags>();
    FlatValues values { { "flag_a", std::nullopt }, { "flag_b", std::nullopt } };

    Reconstructor reconstructor(values);
    REQUIRE(reconstructor.assemble(*root).has_value());
    CHECK(reconstructor.consumed() == std::set<std::string> { "flag_a", "flag_b" });
}

TEST_CASE("leftover keys are an internal error") {
    auto root = schemaOf<Flags>();
    FlatValues values { { "flag_a", std::nullopt }, { "flag_b", std::nullopt }, { "flag_c", std::nullopt } };

    CHECK_THROWS_AS(Reconstructor::assembleAll(*root, values), InternalError);
}

TEST_CASE("missing required argument") {
    auto root = schemaOf<Required>();
    FlatValues values { { "count", std::vector<std::string> { "1" } } };

    auto result = Reconstructor::assembleAll(*root, values);
    REQUIRE_FALSE(result.has_value());

    auto const* missing = result.error().as<MissingRequiredArgument>();
    REQUIRE(missing != nullptr);
    CHECK(missing->path.toString() == "inner.depth");
    CHECK(missing->argument == "--inner.depth");
    CHECK(result.error().context().size() == 1);
    CHECK(result.error().message().find("--inner.depth") != std::string::npos);
}

TEST_CASE("conversion error") {
    auto root = schemaOf<Required>();
    FlatValues values { { "count", std::vector<std::string> { "many" } }, { "inner.depth", std::vector<std::string> { "1" } } };

    auto result = Reconstructor::assembleAll(*root, values);
    REQUIRE_FALSE(result.has_value());

    auto const* conversion = result.error().as<ConversionError>();
    REQUIRE(conversion != nullptr);
    CHECK(conversion->path.toString() == "count");
    CHECK(conversion->tokens == std::vector<std::string> { "many" });
    CHECK_FALSE(conversion->cause.empty());
}

TEST_CASE("token count must match nargs") {
    auto root = schemaOf<Required>();

    FlatValues empty { { "count", std::vector<std::string> {} }, { "inner.depth", std::vector<std::string> { "1" } } };
    auto result = Reconstructor::assembleAll(*root, empty);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().as<ConversionError>() != nullptr);
    CHECK(result.error().as<ConversionError>()->path.toString() == "count");
    CHECK(result.error().as<ConversionError>()->cause == "expected 1 value, got 0");

    FlatValues tooMany { { "count", std::vector<std::string> { "1", "2" } }, { "inner.depth", std::vector<std::string> { "1" } } };
    result = Reconstructor::assembleAll(*root, tooMany);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().as<ConversionError>() != nullptr);
    CHECK(result.error().as<ConversionError>()->cause == "expected 1 value, got 2");
}

TEST_CASE("instantiation error") {
    auto root = schemaOf<Range>();
    FlatValues values { { "low", std::vector<std::string> { "20" } }, { "high", std::nullopt } };

    auto result = Reconstructor::assembleAll(*root, values);
    REQUIRE_FALSE(result.has_value());

    auto const* instantiation = result.error().as<InstantiationError>();
    REQUIRE(instantiation != nullptr);
    CHECK(instantiation->cause == "low must not exceed high");
}

TEST_CASE("only the selected variant is assembled") {
    auto root = schemaOf<Git>();
    FlatValues values {
        { "command", std::vector<std::string> { "command:checkout" } },
        { "command.(checkout).branch", std::vector<std::string> { "dev" } },
        { "verbose", std::nullopt }
    };

    Reconstructor reconstructor(values);
    auto result = reconstructor.assemble(*root);
    REQUIRE(result.has_value());

    auto const& git = (*result)->get<Git>();
    CHECK(std::get<Checkout>(git.command()).branch() == "dev");
    CHECK_FALSE(reconstructor.consumed().contains("command.(commit).message"));
}

TEST_CASE("missing subcommand") {
    auto root = schemaOf<Git>();
    FlatValues values { { "command", std::nullopt }, { "verbose", std::nullopt } };

    auto result = Reconstructor::assembleAll(*root, values);
    REQUIRE_FALSE(result.has_value());

    auto const* missing = result.error().as<MissingRequiredArgument>();
    REQUIRE(missing != nullptr);
    CHECK(missing->path.toString() == "command");
    CHECK(missing->argument == "{command:commit,command:checkout}");
}

} // TEST_SUITE("Reconstructor")

//=============================================================================
// FrontEndParser tests
//=============================================================================

TEST_SUITE("FrontEndParser") {

TEST_CASE("flat values") {
    auto root = schemaOf<FlagArgs>();
    FrontEndParser parser(*root, "prog");

    std::vector<std::string> args { "--boolean=True", "--no-flag-b" };
    auto result = parser.parse(args);
    REQUIRE(result.has_value());

    auto const& values = result->values;
    CHECK(values.size() == 4);
    CHECK(values.at("boolean") == std::vector<std::string> { "True" });
    CHECK_FALSE(values.at("optional_boolean").has_value());
    CHECK_FALSE(values.at("flag_a").has_value());
    CHECK(values.at("flag_b") == std::vector<std::string> { "False" });
}

TEST_CASE("unselected subcommands receive no entries") {
    auto root = schemaOf<Git>();
    FrontEndParser parser(*root, "prog");

    std::vector<std::string> args { "command:commit", "--command.message", "hi" };
    auto result = parser.parse(args);
    REQUIRE(result.has_value());

    CHECK(result->values.at("command") == std::vector<std::string> { "command:commit" });
    CHECK(result->values.contains("command.(commit).message"));
    CHECK_FALSE(result->values.contains("command.(checkout).branch"));
}

TEST_CASE("default variant is activated") {
    auto root = schemaOf<GitWithDefault>();
    FrontEndParser parser(*root, "prog");

    auto result = parser.parse(std::vector<std::string> {});
    REQUIRE(result.has_value());
    CHECK_FALSE(result->values.at("command").has_value());
    CHECK(result->values.contains("command.(checkout).branch"));
}

TEST_CASE("variable nargs stop at the next flag") {
    auto root = schemaOf<Collections>();
    FrontEndParser parser(*root, "prog");

    std::vector<std::string> args { "--numbers", "1", "-2", "3", "--rate", "2" };
    auto result = parser.parse(args);
    REQUIRE(result.has_value());
    CHECK(result->values.at("numbers") == std::vector<std::string> { "1", "-2", "3" });
    CHECK(result->values.at("rate") == std::vector<std::string> { "2" });
}

TEST_CASE("usage errors") {
    auto root = schemaOf<Markers>();
    FrontEndParser parser(*root, "prog");

    auto failsWith = [&parser] (std::vector<std::string> args, std::string_view text)
    {
        auto result = parser.parse(args);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().as<UsageError>() != nullptr);
        CHECK(result.error().message().find(text) != std::string::npos);
    };

    failsWith({ "--unknown", "1" }, "unrecognized arguments: --unknown");
    failsWith({ "--seed", "1" }, "fixed");
    failsWith({ "--lr" }, "expected 1 argument");
    failsWith({ "a.txt", "b.txt" }, "unrecognized arguments: b.txt");
}

TEST_CASE("double dash ends flag parsing") {
    auto root = schemaOf<Positionals>();
    FrontEndParser parser(*root, "prog");

    std::vector<std::string> args { "--level", "2", "--", "--input", "5" };
    auto result = parser.parse(args);
    REQUIRE(result.has_value());
    CHECK(result->values.at("input") == std::vector<std::string> { "--input" });
    CHECK(result->values.at("numbers") == std::vector<std::string> { "5" });
}

TEST_CASE("help") {
    auto root = schemaOf<FlagArgs>();
    FrontEndParser parser(*root, "prog", "Booleans and flags");

    std::vector<std::string> args { "--boolean", "True", "-h" };
    auto result = parser.parse(args);
    REQUIRE(result.has_value());
    CHECK(result->helpRequested);

    auto const help = parser.help();
    CHECK(help.find("Booleans and flags") != std::string::npos);
    CHECK(help.find("--flag-a, --no-flag-a") != std::string::npos);
    CHECK(help.find("(default: False)") != std::string::npos);
    CHECK(help.find("(required)") != std::string::npos);
}

TEST_CASE("usage") {
    auto root = schemaOf<Flags>();
    CHECK(FrontEndParser(*root, "prog").usage() == "usage: prog [-h] [--flag-a | --no-flag-a] [--flag-b | --no-flag-b]");

    auto git = schemaOf<Git>();
    CHECK(FrontEndParser(*git, "git").usage() == "usage: git [-h] [--verbose | --no-verbose] {command:commit,command:checkout}");

    auto markers = schemaOf<Markers>();
    auto const usage = FrontEndParser(*markers, "prog").usage();
    CHECK(usage.find("--secret") == std::string::npos);
    CHECK(usage.find("[--lr FLOAT]") != std::string::npos);
    CHECK(usage.find(" STR") != std::string::npos);
}

} // TEST_SUITE("FrontEndParser")

//=============================================================================
// parse() tests
//=============================================================================

TEST_SUITE("parse") {

TEST_CASE("explicit boolean and absent optional") {
    auto args = parse<FlagArgs>({ "--boolean", "True" });
    REQUIRE(args.has_value());
    CHECK(args->boolean() == true);
    CHECK_FALSE(args->optionalBoolean().has_value());
    CHECK(args->flagA() == false);
    CHECK(args->flagB() == true);
}

TEST_CASE("flag pairs") {
    auto args = parse<Flags>({ "--flag-a", "--no-flag-b" });
    REQUIRE(args.has_value());
    CHECK(args->flagA() == true);
    CHECK(args->flagB() == false);
}

TEST_CASE("union of records") {
    auto args = parse<std::variant<Foo, Bar>>({ "bar", "--y", "hi" });
    REQUIRE(args.has_value());
    REQUIRE(std::holds_alternative<Bar>(*args));
    CHECK(std::get<Bar>(*args).y() == "hi");

    auto foo = parse<std::variant<Foo, Bar>>({ "foo", "--x", "3" });
    REQUIRE(foo.has_value());
    CHECK(std::get<Foo>(*foo).x() == 3);
}

TEST_CASE("union of instantiations of one template") {
    using Boxes = std::variant<Box<int>, Box<std::string>>;

    auto text = parse<Boxes>({ "box-str", "--value", "hi" });
    REQUIRE(text.has_value());
    REQUIRE(std::holds_alternative<Box<std::string>>(*text));
    CHECK(std::get<Box<std::string>>(*text).value() == "hi");

    auto number = parse<Boxes>({ "box-int", "--value", "3" });
    REQUIRE(number.has_value());
    CHECK(std::get<Box<int>>(*number).value() == 3);
}

TEST_CASE("custom rule for a mapping of JSON values") {
    ConstructorRegistry registry;
    auto scope = registry.scope();
    registry.add<JsonDict>(jsonSpec());

    auto args = parse<JsonArgs>({ "--x", R"({"a": 1})" }, { .registry = &registry });
    REQUIRE(args.has_value());
    CHECK(args->x().size() == 1);
    CHECK(args->x().at("a") == 1);

    auto invalid = parse<JsonArgs>({ "--x", "[1, 2]" }, { .registry = &registry });
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().error->as<ConversionError>() != nullptr);
}

TEST_CASE("mapping of JSON values without a rule") {
    CHECK_THROWS_AS(parse<JsonArgs>({ "--x", R"({"a": 1})" }), NoMatchingRuleError);
}

TEST_CASE("per-field JSON constructor") {
    auto args = parse<AnnotatedJsonArgs>({ "--x", R"({"a": 1, "b": [true]})" });
    REQUIRE(args.has_value());
    CHECK(args->x().at("b")[0] == true);
}

TEST_CASE("missing required argument names its path") {
    auto args = parse<Required>({ "--count", "1" });
    REQUIRE_FALSE(args.has_value());
    CHECK(args.error().reason == Failure::Reason::invalidInput);
    REQUIRE(args.error().error.has_value());

    auto const* missing = args.error().error->as<MissingRequiredArgument>();
    REQUIRE(missing != nullptr);
    CHECK(missing->path.toString() == "inner.depth");
    CHECK(args.error().usage.starts_with("usage: program"));
}

TEST_CASE("nested records") {
    auto line = parse<Line>({ "--start.x", "1.5", "--finish.y", "-2", "--label", "diagonal" });
    REQUIRE(line.has_value());
    CHECK(line->start().x() == 1.5f);
    CHECK(line->start().y() == 0.0f);
    CHECK(line->finish().y() == -2.0f);
    CHECK(line->label() == "diagonal");
}

TEST_CASE("default instance") {
    Line defaults;
    defaults.label = "custom";

    Point start;
    start.x = 4.0f;
    defaults.start = start;

    auto line = parse<Line>({ "--finish.x", "1" }, { .defaultInstance = defaults });
    REQUIRE(line.has_value());
    CHECK(line->label() == "custom");
    CHECK(line->start().x() == 4.0f);
    CHECK(line->finish().x() == 1.0f);
}

TEST_CASE("default instance modified through accessors") {
    Line defaults;
    defaults.start().x = 4.0f;

    auto line = parse<Line>({}, { .defaultInstance = defaults });
    REQUIRE(line.has_value());
    CHECK(line->start().x() == 4.0f);
    CHECK(line->start().y() == 0.0f);
    CHECK(line->label() == "line");

    Required required;
    required.count() = 5;
    required.inner().depth() = 2;

    auto result = parse<Required>({}, { .defaultInstance = required });
    REQUIRE(result.has_value());
    CHECK(result->count() == 5);
    CHECK(result->inner().depth() == 2);
}

TEST_CASE("default instance selects a subcommand") {
    Git defaults;
    defaults.command = Commit { "fix" };

    auto git = parse<Git>({}, { .defaultInstance = defaults });
    REQUIRE(git.has_value());
    REQUIRE(std::holds_alternative<Commit>(git->command()));
    CHECK(std::get<Commit>(git->command()).message() == "fix");
    CHECK_FALSE(std::get<Commit>(git->command()).all());

    auto checkout = parse<Git>({ "command:checkout", "--command.branch", "dev" }, { .defaultInstance = defaults });
    REQUIRE(checkout.has_value());
    REQUIRE(std::holds_alternative<Checkout>(checkout->command()));
    CHECK(std::get<Checkout>(checkout->command()).branch() == "dev");
}

TEST_CASE("subcommands") {
    auto git = parse<Git>({ "--verbose", "command:commit", "--command.message", "hi", "--command.all" });
    REQUIRE(git.has_value());
    CHECK(git->verbose());

    auto const& commit = std::get<Commit>(git->command());
    CHECK(commit.message() == "hi");
    CHECK(commit.all());
}

TEST_CASE("unselected subcommands are never required") {
    auto git = parse<Git>({ "command:checkout", "--command.branch", "dev" });
    REQUIRE(git.has_value());
    CHECK(std::get<Checkout>(git->command()).branch() == "dev");
}

TEST_CASE("default subcommand") {
    auto git = parse<GitWithDefault>({});
    REQUIRE(git.has_value());
    CHECK(std::get<Checkout>(git->command()).branch() == "main");

    auto commit = parse<GitWithDefault>({ "command:commit", "--command.message", "m" });
    REQUIRE(commit.has_value());
    CHECK(std::get<Commit>(commit->command()).message() == "m");
}

TEST_CASE("avoid subcommands") {
    auto git = parse<GitWithoutSubcommands>({ "--command.branch", "dev" });
    REQUIRE(git.has_value());
    CHECK(std::get<Checkout>(git->command()).branch() == "dev");

    CHECK_FALSE(parse<GitWithoutSubcommands>({ "command:commit" }).has_value());
}

TEST_CASE("optional records") {
    auto none = parse<WithOrigin>({});
    REQUIRE(none.has_value());
    CHECK_FALSE(none->origin().has_value());

    auto point = parse<WithOrigin>({ "origin:point", "--origin.x", "1" });
    REQUIRE(point.has_value());
    REQUIRE(point->origin().has_value());
    CHECK(point->origin()->x() == 1.0f);
}

TEST_CASE("literals and enums") {
    auto style = parse<Style>({ "--mode", "accurate", "--color", "blue" });
    REQUIRE(style.has_value());
    CHECK(style->mode() == "accurate");
    CHECK(style->color() == Color::blue);

    auto invalid = parse<Style>({ "--mode", "slow" });
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().text.find("invalid choice") != std::string::npos);
}

TEST_CASE("containers") {
    auto c = parse<Collections>({ "--numbers", "3", "4", "5",
                                  "--pair", "2", "b",
                                  "--weights", "a", "1", "b", "2",
                                  "--id", "abc",
                                  "--limit", "7",
                                  "--scale", "0.5", "1.5",
                                  "--tags", "z", "z", "y" });
    REQUIRE(c.has_value());
    CHECK(c->numbers() == std::vector<int> { 3, 4, 5 });
    CHECK(c->pair() == std::tuple<int, std::string> { 2, "b" });
    CHECK(c->weights() == std::map<std::string, int> { { "a", 1 }, { "b", 2 } });
    CHECK(std::get<std::string>(c->id()) == "abc");
    CHECK(c->limit() == 7);
    CHECK(c->scale() == std::array<float, 2> { 0.5f, 1.5f });
    CHECK(c->tags() == std::set<std::string> { "y", "z" });
    CHECK(c->output() == std::filesystem::path("out.txt"));

    auto none = parse<Collections>({ "--limit", "None" });
    REQUIRE(none.has_value());
    CHECK_FALSE(none->limit().has_value());

    CHECK_FALSE(parse<Collections>({ "--weights", "a" }).has_value());
}

TEST_CASE("markers") {
    auto m = parse<Markers>({ "in.txt", "--strict", "True", "--lr", "0.25" });
    REQUIRE(m.has_value());
    CHECK(m->input() == "in.txt");
    CHECK(m->strict());
    CHECK(m->learningRate() == 0.25f);
    CHECK(m->seed() == 42);
    CHECK(m->secret() == 7);

    CHECK_FALSE(parse<Markers>({ "in.txt", "--strict" }).has_value());
}

TEST_CASE("fixed unrepresentable fields keep their default") {
    auto w = parse<WithOpaque>({ "--x", "2" });
    REQUIRE(w.has_value());
    CHECK(w->opaque().handle == 5);
    CHECK(w->x() == 2);

    CHECK_FALSE(parse<WithOpaque>({ "--opaque", "1" }).has_value());
}

TEST_CASE("validation failures") {
    auto range = parse<Range>({ "--low", "11" });
    REQUIRE_FALSE(range.has_value());
    CHECK(range.error().error->as<InstantiationError>() != nullptr);
    CHECK(range.error().text.find("low must not exceed high") != std::string::npos);
}

TEST_CASE("help") {
    auto help = parse<Line>({ "--help" });
    REQUIRE_FALSE(help.has_value());
    CHECK(help.error().reason == Failure::Reason::helpRequested);
    CHECK(help.error().text.find("A line between two points") != std::string::npos);
    CHECK(help.error().text.find("--start.x FLOAT") != std::string::npos);
}

TEST_CASE("description and program name") {
    auto help = parse<Flags>({ "-h" }, { .prog = "flags", .description = "Toggles" });
    REQUIRE_FALSE(help.has_value());
    CHECK(help.error().text.starts_with("usage: flags [-h]"));
    CHECK(help.error().text.find("Toggles") != std::string::npos);
}

TEST_CASE("non-record targets") {
    auto number = parse<int>({ "5" });
    REQUIRE(number.has_value());
    CHECK(*number == 5);

    auto numbers = parse<std::vector<int>>({ "1", "2" });
    REQUIRE(numbers.has_value());
    CHECK(*numbers == std::vector<int> { 1, 2 });

    auto withDefault = parse<int>({}, { .defaultInstance = 9 });
    REQUIRE(withDefault.has_value());
    CHECK(*withDefault == 9);

    CHECK_FALSE(parse<int>({}).has_value());
}

TEST_CASE("structural errors propagate") {
    CHECK_THROWS_AS(parse<Mixed>({}), UnsupportedUnionShapeError);
    CHECK_THROWS_AS(parse<TreeNode>({}), CyclicTypeError);
    CHECK_THROWS_AS(parse<Merged>({}), AmbiguousFieldNameError);
}

} // TEST_SUITE("parse")

//=============================================================================
// Generics tests
//=============================================================================

TEST_SUITE("Generics") {

TEST_CASE("explicit template arguments") {
    auto box = parse<Box<std::string>>({ "--value", "text" });
    REQUIRE(box.has_value());
    CHECK(box->value() == "text");
}

TEST_CASE("default template arguments") {
    auto box = parse<Box>({ "--value", "3" });
    REQUIRE(box.has_value());
    CHECK(box->value() == 3);
}

TEST_CASE("template arguments from a default instance") {
    NoDefaultBox<std::string> defaults;
    defaults.value = "fallback";

    Options<NoDefaultBox<std::string>> options;
    options.defaultInstance = defaults;

    auto box = parse<NoDefaultBox>({}, options);
    REQUIRE(box.has_value());
    CHECK(box->value() == "fallback");
}

TEST_CASE("unresolvable template arguments") {
    CHECK_THROWS_AS(parse<NoDefaultBox>({}), UnresolvedGenericError);
    CHECK_THROWS_AS(parse<NoDefaultBox>({}, Options<NoDefaultBox<int>>()), UnresolvedGenericError);
}

} // TEST_SUITE("Generics")

//=============================================================================
// call() tests
//=============================================================================

int scale(int value, float factor)
{
    return static_cast<int>(static_cast<float>(value) * factor);
}

TEST_SUITE("call") {

TEST_CASE("lambda") {
    auto sum = call<"a", "b">([] (int a, int b) { return a + b; }, { "--a", "1", "--b", "2" });
    REQUIRE(sum.has_value());
    CHECK(*sum == 3);
}

TEST_CASE("function pointer") {
    auto scaled = call<"value", "factor">(&scale, { "--value", "10", "--factor", "1.5" });
    REQUIRE(scaled.has_value());
    CHECK(*scaled == 15);
}

TEST_CASE("void result") {
    std::string seen;
    auto result = call<"name">([&seen] (std::string const& name) { seen = name; }, { "--name", "dynargs" });
    REQUIRE(result.has_value());
    CHECK(seen == "dynargs");
}

TEST_CASE("missing parameter") {
    auto sum = call<"a", "b">([] (int a, int b) { return a + b; }, { "--a", "1" });
    REQUIRE_FALSE(sum.has_value());
    REQUIRE(sum.error().error.has_value());
    CHECK(sum.error().error->as<MissingRequiredArgument>()->path.toString() == "b");
}

TEST_CASE("custom registry") {
    ConstructorRegistry registry;
    auto scope = registry.scope();
    registry.add<int>(hexSpec());

    auto sum = call<"a", "b">([] (int a, int b) { return a + b; }, { "--a", "a", "--b", "10" }, &registry);
    REQUIRE(sum.has_value());
    CHECK(*sum == 26);
}

} // TEST_SUITE("call")

//=============================================================================
// InputError tests
//=============================================================================

TEST_SUITE("InputError") {

TEST_CASE("context") {
    auto error = InputError(MissingRequiredArgument { Path().child("a").child("b"), "--a.b" })
        .within(Path().child("a"))
        .within(Path());

    CHECK(error.context().size() == 1);
    CHECK(error.message() == "the following arguments are required: --a.b (while constructing 'a')");
}

TEST_CASE("messages") {
    CHECK(InputError(UsageError { "bad" }).message() == "bad");
    CHECK(InputError(ConversionError { Path().child("n"), "--n", { "x", "y" }, "oops" }).message()
          == "argument --n: invalid value 'x y': oops");
    CHECK(InputError(InstantiationError { Path(), "broken" }).message() == "invalid arguments: broken");
}

TEST_CASE("stream output") {
    std::ostringstream ss;
    ss << InputError(UsageError { "bad" });
    CHECK(ss.str() == "bad");
}

} // TEST_SUITE("InputError")
