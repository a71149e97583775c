#include "dynargs.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ostream>
#include <boost/core/demangle.hpp>
#include "debug.hpp"

namespace dynargs
{

//=============================================================================
// Path
//=============================================================================

Path Path::child(std::string name) const
{
    Path result(*this);
    result.push_back({ std::move(name), false });
    return result;
}

Path Path::variant(std::string name) const
{
    Path result(*this);
    result.push_back({ std::move(name), true });
    return result;
}

std::string Path::toString() const
{
    std::string key;

    for (auto const& segment : *this)
    {
        if (segment.name.empty())
            continue;

        if (! key.empty())
            key += '.';

        key += segment.isVariant ? "(" + segment.name + ")" : segment.name;
    }

    return key;
}

std::string Path::prefix() const
{
    std::string result;

    for (auto const& segment : *this)
    {
        if (segment.isVariant || segment.name.empty())
            continue;

        if (! result.empty())
            result += '.';

        result += detail::kebabCase(segment.name);
    }

    return result;
}

std::string Path::flagName() const
{
    return "--" + prefix();
}

Path Path::fromString(std::string const& key)
{
    Path result;
    std::size_t start = 0;

    while (start <= key.size() && (! key.empty()))
    {
        auto const end = std::min(key.find('.', start), key.size());
        auto segment = key.substr(start, end - start);

        if (segment.size() >= 2 && segment.front() == '(' && segment.back() == ')')
            result.push_back({ segment.substr(1, segment.size() - 2), true });
        else
            result.push_back({ std::move(segment), false });

        start = end + 1;
    }

    return result;
}

std::ostream& operator<<(std::ostream& o, Path const& path)
{
    return o << path.toString();
}

//=============================================================================
// Annotations
//=============================================================================

void Annotations::merge(Annotations const& other)
{
    positional        = positional        || other.positional;
    fixed             = fixed             || other.fixed;
    suppress          = suppress          || other.suppress;
    flagConversionOff = flagConversionOff || other.flagConversionOff;
    avoidSubcommands  = avoidSubcommands  || other.avoidSubcommands;

    if (other.name.has_value())
        name = other.name;

    if (other.help.has_value())
        help = other.help;

    if (other.constructor != nullptr)
        constructor = other.constructor;
}

//=============================================================================
// MetaType
//=============================================================================

std::string MetaType::name() const
{
    return detail::demangle(typeInfo().name());
}

std::expected<ValuePtr, std::string> MetaType::assemble(std::span<ValuePtr const>) const
{
    return std::unexpected(std::format("values of type {} cannot be assembled from parts", name()));
}

std::ostream& operator<<(std::ostream& o, MetaType::Shape shape)
{
    switch (shape)
    {
    case MetaType::Shape::primitive:  return o << "primitive";
    case MetaType::Shape::annotated:  return o << "annotated";
    case MetaType::Shape::optional:   return o << "optional";
    case MetaType::Shape::sequence:   return o << "sequence";
    case MetaType::Shape::fixedTuple: return o << "fixed tuple";
    case MetaType::Shape::mapping:    return o << "mapping";
    case MetaType::Shape::literal:    return o << "literal";
    case MetaType::Shape::record:     return o << "record";
    case MetaType::Shape::variant:    return o << "variant";
    }

    return o;
}

//=============================================================================
// Naming helpers
//=============================================================================

namespace detail
{
std::string demangle(char const* mangled)
{
    return boost::core::demangle(mangled);
}

std::string shortTypeName(std::string_view qualified)
{
    auto const templateArgs = qualified.find('<');

    if (templateArgs != std::string_view::npos)
        qualified = qualified.substr(0, templateArgs);

    auto const scope = qualified.rfind("::");

    if (scope != std::string_view::npos)
        qualified = qualified.substr(scope + 2);

    return std::string(qualified);
}

std::string kebabCase(std::string_view name, bool splitCamelCase)
{
    std::string result;
    result.reserve(name.size() + 4);

    for (std::size_t i = 0; i < name.size(); ++i)
    {
        auto const c = static_cast<unsigned char>(name[i]);

        if (c == '_')
        {
            result += '-';
            continue;
        }

        if (! splitCamelCase)
        {
            result += static_cast<char>(c);
            continue;
        }

        if (std::isupper(c) && i > 0)
        {
            auto const prev = static_cast<unsigned char>(name[i - 1]);
            auto const next = i + 1 < name.size() ? static_cast<unsigned char>(name[i + 1]) : '\0';

            if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && std::islower(next)))
                result += '-';
        }

        result += static_cast<char>(std::tolower(c));
    }

    return result;
}

std::string argumentName(MetaType const& meta)
{
    if (auto const* codec = meta.codec())
    {
        switch (codec->kind)
        {
        case PrimitiveCodec::Kind::boolean:  return "bool";
        case PrimitiveCodec::Kind::integer:  return "int";
        case PrimitiveCodec::Kind::floating: return "float";
        case PrimitiveCodec::Kind::string:   return "str";
        case PrimitiveCodec::Kind::path:     return "path";
        }
    }

    if (meta.shape() == MetaType::Shape::record)
        return meta.name();

    return kebabCase(shortTypeName(meta.name()), true);
}

//=============================================================================
// Entry point
//=============================================================================

std::expected<ValuePtr, Failure> run(MetaType const& target, ValuePtr defaultInstance, std::span<std::string const> args,
                                     std::string const& prog, std::optional<std::string> const& description,
                                     ConstructorRegistry const* registry)
{
    ConstructorRegistry builtinRules;
    auto const& rules = registry != nullptr ? *registry : builtinRules;

    DYNARGS_DEBUG_L1("run: deriving command line of {} for '{}'", target.name(), prog);

    Resolver resolver;
    auto const root = SchemaBuilder(rules).build(resolver.resolve(target), std::move(defaultInstance));

    FrontEndParser parser(*root, prog, description.value_or(root->field().doc));
    auto const usage = parser.usage();

    auto parsed = parser.parse(args);

    if (! parsed)
        return std::unexpected(Failure { Failure::Reason::invalidInput, usage, parsed.error().message(), parsed.error() });

    if (parsed->helpRequested)
        return std::unexpected(Failure { Failure::Reason::helpRequested, usage, parser.help(), std::nullopt });

    auto value = Reconstructor::assembleAll(*root, parsed->values);

    if (! value)
        return std::unexpected(Failure { Failure::Reason::invalidInput, usage, value.error().message(), value.error() });

    return std::move(*value);
}
} // namespace detail
} // namespace dynargs
