/**
 * @file field.hpp
 * @brief Building blocks for describing a command line as a C++ struct
 *
 * Every member of a struct that should appear on the command line is wrapped
 * in a Field<T, Name, Markers...> template. The struct is then introspected
 * with Boost.PFR, one Field at a time, in declaration order:
 *
 *   struct Args {
 *       Field<bool, "boolean">                      boolean;
 *       Field<std::optional<bool>, "optional_boolean"> optionalBoolean = std::nullopt;
 *       Field<bool, "flag_a">                       flagA = false;
 *       Field<int, "count", conf::Help<"How often">> count = 3;
 *   };
 *
 * A Field that is initialised in the struct definition has a default value,
 * one that is not is required on the command line.
 */

#pragma once

#include <algorithm>
#include <compare>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>
#include "dynargs_detail.hpp"

namespace dynargs
{

struct ConstructorSpec;

//=============================================================================
// Path
//=============================================================================

/// One element of a Path. Variant segments record which union branch was taken.
struct PathSegment
{
    std::string name;
    bool isVariant = false;

    friend bool operator==(PathSegment const&, PathSegment const&) = default;
    friend auto operator<=>(PathSegment const&, PathSegment const&) = default;
};

/**
 * @brief Location of a field within a nested struct hierarchy
 *
 * A Path stores the sequence of field names traversed from the root struct to
 * a nested field. For a struct Line containing Point structs, the path to the x
 * coordinate of the start point is ["start", "x"].
 *
 * Paths have two textual forms:
 *   - toString(): the unique key used in the flat value mapping, e.g. "start.x"
 *     or "command.(commit).message" when a union branch is part of the path
 *   - flagName(): the command line flag, e.g. "--start.x" or "--command.message"
 */
struct Path : std::vector<PathSegment>
{
    Path() = default;
    Path(std::vector<PathSegment> && o) : std::vector<PathSegment>(std::move(o)) {}

    /// Returns a new path with a field segment appended
    Path child(std::string name) const;

    /// Returns a new path with a variant segment appended
    Path variant(std::string name) const;

    /// Key form, e.g. "a.b.(bar).c". Empty segments are skipped.
    std::string toString() const;

    /// Flag form without leading dashes, e.g. "a.b.c"
    std::string prefix() const;

    /// Flag form, e.g. "--a.b.c"
    std::string flagName() const;

    /// Parses the key form produced by toString()
    static Path fromString(std::string const& key);
};

std::ostream& operator<<(std::ostream& o, Path const& path);

//=============================================================================
// Type-erased values
//=============================================================================

/**
 * @brief Abstract base class for type-erased values
 *
 * Values produced while reconstructing a struct from the command line are
 * passed around as Value instances until they are assigned to the Field they
 * belong to. Use get<T>() to access the underlying value; it throws
 * std::bad_cast if the type does not match.
 */
class Value
{
public:
    virtual ~Value() = default;

    /// Returns the std::type_info for the underlying value type
    virtual std::type_info const& type() const = 0;

    /// Returns true if the underlying value is of type T
    template <typename T>
    bool holds() const { return type() == typeid(T); }

    template <typename T>
    T const& get() const;

protected:
    Value() = default;
};

using ValuePtr = std::shared_ptr<Value const>;

/// Concrete wrapper for a value of type T
template <typename T>
class Fundamental final : public Value
{
public:
    explicit Fundamental(T underlying_) : underlying(std::move(underlying_)) {}

    std::type_info const& type() const override { return typeid(T); }

    /// Returns the underlying value (read-only access)
    T const& operator()() const { return underlying; }

private:
    T underlying;
};

template <typename T>
T const& Value::get() const
{
    if (! holds<T>())
        throw std::bad_cast();

    return static_cast<Fundamental<T> const&>(*this)();
}

template <typename T>
ValuePtr makeValue(T value)
{
    return std::make_shared<Fundamental<T> const>(std::move(value));
}

//=============================================================================
// Annotations
//=============================================================================

/**
 * @brief Field-level metadata collected from markers
 *
 * Annotations never change the shape of a type. They select how a field is
 * exposed: as a positional, under a different name, with an explicit
 * constructor etc.
 */
struct Annotations
{
    bool positional = false;
    bool fixed = false;
    bool suppress = false;
    bool flagConversionOff = false;
    bool avoidSubcommands = false;
    std::optional<std::string> name;
    std::optional<std::string> help;
    ConstructorSpec (*constructor)() = nullptr;

    /// Overlays other on top of this (set flags and present optionals of other win)
    void merge(Annotations const& other);

    friend bool operator==(Annotations const&, Annotations const&) = default;
};

/**
 * @brief Markers that customise how a field is exposed
 *
 * Markers are passed as extra template arguments to Field or Annotated:
 *
 * @code
 * Field<std::string, "input", conf::Positional, conf::Help<"File to read">> input;
 * Field<int, "seed", conf::Fixed> seed = 42;
 * @endcode
 */
namespace conf
{
/// The field is a positional argument instead of a --flag
struct Positional { static void apply(Annotations& a) { a.positional = true; } };

/// The field is shown but cannot be set; its default is always used
struct Fixed { static void apply(Annotations& a) { a.fixed = true; } };

/// Like Fixed, but the field is hidden from usage and help
struct Suppress { static void apply(Annotations& a) { a.suppress = true; } };

/// A defaulted bool expects an explicit {True,False} instead of a --flag/--no-flag pair
struct FlagConversionOff { static void apply(Annotations& a) { a.flagConversionOff = true; } };

/// A defaulted union of structs exposes the default branch directly instead of subcommands
struct AvoidSubcommands { static void apply(Annotations& a) { a.avoidSubcommands = true; } };

/// Custom name for the path segment (and hence the flag) of a field
template <fixstr::fixed_string S>
struct Name { static void apply(Annotations& a) { a.name = std::string(std::string_view(S)); } };

/// Help text, documentation only
template <fixstr::fixed_string S>
struct Help { static void apply(Annotations& a) { a.help = std::string(std::string_view(S)); } };

/// Explicit constructor for this field, consulted before any registry rule
template <ConstructorSpec (*Factory)()>
struct Constructor { static void apply(Annotations& a) { a.constructor = Factory; } };
} // namespace conf

/**
 * @brief Attaches markers to a type
 *
 * Annotated<T, Markers...> is a pure type-level wrapper: a Field<Annotated<T, ...>>
 * stores a T. The resolver strips the wrapper and turns its markers into
 * field-level annotations.
 */
template <typename T, typename... Markers>
struct Annotated
{
    using type = T;

    static Annotations annotations()
    {
        Annotations a;
        (Markers::apply(a), ...);
        return a;
    }
};

//=============================================================================
// Field
//=============================================================================

/**
 * @brief Named field wrapper for use as struct members
 *
 * Each member of a struct that should be settable from the command line is
 * wrapped in Field<Type, "name", Markers...>. The name becomes the path segment
 * and flag name (underscores are turned into dashes for the flag).
 *
 * A Field remembers whether it holds a value: fields initialised in the struct
 * definition are defaults, fields left alone are required.
 *
 * @tparam T The underlying value type, optionally wrapped in Annotated<>
 * @tparam Name Compile-time string literal for the field name
 * @tparam Markers Optional conf:: markers
 */
template <typename T, fixstr::fixed_string Name, typename... Markers>
class Field
{
public:
    /// The type as declared, possibly Annotated<>
    using DeclaredType = T;

    /// The type actually stored
    using ValueType = detail::strip_annotated_t<T>;

    static constexpr std::string_view kName = Name;

    /// Default constructor - the field holds no value and is required
    Field() = default;

    /// Constructs a field holding a (default) value
    template <typename U>
        requires (std::is_constructible_v<ValueType, U&&> && (! std::is_same_v<std::remove_cvref_t<U>, Field>))
    Field(U && value) : underlying(std::forward<U>(value)), isSet(true) {}

    Field(Field const&) = default;
    Field(Field&&) = default;
    Field& operator=(Field const&) = default;
    Field& operator=(Field&&) = default;

    /// Assign new value to the field
    Field& operator=(ValueType const& t) { underlying = t; isSet = true; return *this; }

    /// Assign new value to the field (move version)
    Field& operator=(ValueType && t) { underlying = std::move(t); isSet = true; return *this; }

    /// Assign anything the underlying type can be constructed from, e.g. a string literal
    template <typename U>
        requires (std::is_constructible_v<ValueType, U&&> && (! std::is_same_v<std::remove_cvref_t<U>, Field>))
    Field& operator=(U && value) { underlying = ValueType(std::forward<U>(value)); isSet = true; return *this; }

    /// Returns the underlying value
    ValueType const& operator()() const { return underlying; }

    /// Returns the underlying value for modification. The field counts as set afterwards.
    ValueType& operator()() { isSet = true; return underlying; }

    ValueType const* operator->() const { return &underlying; }
    ValueType*       operator->()       { isSet = true; return &underlying; }

    /// Implicit conversion to the underlying type
    operator ValueType const&() const { return underlying; }

    /// Returns true if the field was initialised or assigned
    bool hasValue() const noexcept { return isSet; }

    /// Returns the compile-time field name as specified in the template parameter
    std::string_view fieldname() const { return kName; }

    /// Markers attached directly to this field
    static Annotations annotations()
    {
        Annotations a;
        (Markers::apply(a), ...);
        return a;
    }

    friend bool operator==(Field const& a, Field const& b) requires std::equality_comparable<ValueType>
    {
        return a.underlying == b.underlying;
    }

private:
    ValueType underlying{};
    bool isSet = false;
};

//=============================================================================
// Literal & enums
//=============================================================================

/**
 * @brief A value restricted to a fixed set of strings
 *
 * @code
 * Field<Literal<"fast", "accurate">, "mode"> mode = "fast";
 * if (args.mode().value() == "accurate") ...
 * @endcode
 */
template <fixstr::fixed_string... Choices>
class Literal
{
public:
    static_assert(sizeof...(Choices) >= 1, "A Literal needs at least one choice");

    static constexpr std::array<std::string_view, sizeof...(Choices)> kChoices = {{ std::string_view(Choices)... }};

    /// Defaults to the first choice
    constexpr Literal() = default;

    /// Throws std::invalid_argument if value is not one of the choices
    constexpr Literal(std::string_view value) : idx(indexOf(value)) {}

    static constexpr Literal fromIndex(std::size_t i)
    {
        Literal l;
        l.idx = i;
        return l;
    }

    static std::optional<Literal> fromString(std::string_view value)
    {
        auto it = std::find(kChoices.begin(), kChoices.end(), value);

        if (it == kChoices.end())
            return std::nullopt;

        return fromIndex(static_cast<std::size_t>(it - kChoices.begin()));
    }

    constexpr std::string_view value() const { return kChoices[idx]; }
    constexpr std::size_t index() const { return idx; }

    friend constexpr bool operator==(Literal const&, Literal const&) = default;
    friend constexpr bool operator==(Literal const& l, std::string_view s) { return l.value() == s; }

private:
    static constexpr std::size_t indexOf(std::string_view value)
    {
        for (std::size_t i = 0; i < kChoices.size(); ++i)
            if (kChoices[i] == value)
                return i;

        throw std::invalid_argument("not a valid choice for this Literal");
    }

    std::size_t idx = 0;
};

/*
 * Enums become literals once their enumerators are named:
 *
 * template <> struct dynargs::EnumTraits<Color>
 * {
 *     static constexpr std::array kEnumerators = {
 *         std::pair{Color::red, std::string_view("red")},
 *         std::pair{Color::green, std::string_view("green")}
 *     };
 * };
 */

//=============================================================================
// Records
//=============================================================================

/**
 * @brief Customisation point exposing the Field<> members of a record
 *
 * The primary template handles aggregates via Boost.PFR; Signature<> below
 * provides its own specialisation.
 */
template <typename T>
struct RecordTraits
{
    static constexpr bool kIsRecord = detail::num_fields<T>() >= 1;

    static auto fields(T& u)       { return detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(u)); }
    static auto fields(T const& u) { return detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(u)); }
};

template <typename T>
concept record = RecordTraits<T>::kIsRecord;

/// The parameter list of a callable, with names supplied by the caller
template <typename Arguments, fixstr::fixed_string... Names> struct Signature;

template <typename... Args, fixstr::fixed_string... Names>
struct Signature<std::tuple<Args...>, Names...>
{
    static_assert(sizeof...(Args) == sizeof...(Names), "Every parameter needs exactly one name");
    static constexpr std::string_view kCommandName = "";

    std::tuple<Field<Args, Names>...> parameters;
};

template <typename... Args, fixstr::fixed_string... Names>
struct RecordTraits<Signature<std::tuple<Args...>, Names...>>
{
    static constexpr bool kIsRecord = sizeof...(Args) >= 1;

    template <typename S>
    static auto fields(S& s) { return std::apply([] (auto&... flds) { return std::tie(flds...); }, s.parameters); }
};

namespace detail
{
/// One-field record used to expose a non-record type (int, std::variant<A, B>, ...) as a command line
template <typename T>
struct Wrapped
{
    static constexpr std::string_view kCommandName = "";

    Field<T, "", conf::Positional> value;
};
} // namespace detail

} // namespace dynargs
