#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <functional>
#include <system_error>

namespace dynargs
{
namespace detail
{
//=============================================================================
// Built-in primitive conversions
//=============================================================================

template <typename T>
concept builtin_integer = std::is_integral_v<T>
    && (! std::is_same_v<T, bool>)
    && (! std::is_same_v<T, wchar_t>)
    && (! std::is_same_v<T, char8_t>)
    && (! std::is_same_v<T, char16_t>)
    && (! std::is_same_v<T, char32_t>);

template <typename T>
concept builtin_primitive = std::is_same_v<T, bool>
    || builtin_integer<T>
    || std::is_floating_point_v<T>
    || std::is_same_v<T, std::string>
    || std::is_same_v<T, std::filesystem::path>;

template <typename T>
std::expected<ValuePtr, std::string> parsePrimitive(std::string_view token)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        if (token == "True" || token == "true")
            return makeValue(true);

        if (token == "False" || token == "false")
            return makeValue(false);

        return std::unexpected(std::format("invalid choice: '{}' (choose from True, False)", token));
    }
    else if constexpr (builtin_integer<T> || std::is_floating_point_v<T>)
    {
        static constexpr auto kWhat = builtin_integer<T> ? "integer" : "float";

        auto const* first = token.data();
        auto const* last  = token.data() + token.size();

        // from_chars does not accept an explicit plus sign; "+-5" stays invalid
        if (last - first >= 2 && first[0] == '+' && first[1] != '-')
            ++first;

        T value{};
        auto [ptr, ec] = std::from_chars(first, last, value);

        if (ec == std::errc::result_out_of_range)
            return std::unexpected(std::format("{} out of range: '{}'", kWhat, token));

        if (token.empty() || ec != std::errc() || ptr != last)
            return std::unexpected(std::format("invalid {} value: '{}'", kWhat, token));

        return makeValue(value);
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        return makeValue(std::string(token));
    }
    else
    {
        return makeValue(std::filesystem::path(token));
    }
}

template <typename T>
std::string formatPrimitive(Value const& value)
{
    auto const& x = value.get<T>();

    if constexpr (std::is_same_v<T, bool>)
        return x ? "True" : "False";
    else if constexpr (builtin_integer<T>)
        return std::format("{}", +x);
    else if constexpr (std::is_floating_point_v<T>)
        return std::format("{}", x);
    else if constexpr (std::is_same_v<T, std::string>)
        return x;
    else
        return x.string();
}

template <typename T>
constexpr PrimitiveCodec::Kind codecKind()
{
    if constexpr (std::is_same_v<T, bool>)          return PrimitiveCodec::Kind::boolean;
    else if constexpr (builtin_integer<T>)          return PrimitiveCodec::Kind::integer;
    else if constexpr (std::is_floating_point_v<T>) return PrimitiveCodec::Kind::floating;
    else if constexpr (std::is_same_v<T, std::string>) return PrimitiveCodec::Kind::string;
    else                                            return PrimitiveCodec::Kind::path;
}

template <typename T>
constexpr std::string_view metavarOf()
{
    switch (codecKind<T>())
    {
    case PrimitiveCodec::Kind::boolean:  return "{True,False}";
    case PrimitiveCodec::Kind::integer:  return "INT";
    case PrimitiveCodec::Kind::floating: return "FLOAT";
    case PrimitiveCodec::Kind::string:   return "STR";
    case PrimitiveCodec::Kind::path:     return "PATH";
    }

    return "VALUE";
}

//=============================================================================
// MetaType implementations
//=============================================================================

template <typename T>
class PrimitiveMeta final : public MetaType
{
public:
    Shape shape() const override { return Shape::primitive; }
    std::type_info const& typeInfo() const override { return typeid(T); }

    PrimitiveCodec const* codec() const override
    {
        if constexpr (builtin_primitive<T>)
        {
            static PrimitiveCodec const kCodec { codecKind<T>(), metavarOf<T>(), &parsePrimitive<T>, &formatPrimitive<T> };
            return &kCodec;
        }
        else
        {
            return nullptr;
        }
    }
};

template <typename T>
class AnnotatedMeta final : public MetaType
{
public:
    Shape shape() const override { return Shape::annotated; }
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::vector<MetaTypeGetter> elementTypes() const override { return { &metaTypeOf<typename T::type> }; }
    Annotations annotations() const override { return T::annotations(); }
};

template <typename T>
class LiteralMeta final : public MetaType
{
public:
    Shape shape() const override { return Shape::literal; }
    std::type_info const& typeInfo() const override { return typeid(T); }

    std::vector<std::string> choices() const override
    {
        return { T::kChoices.begin(), T::kChoices.end() };
    }

    ValuePtr fromChoice(std::size_t idx) const override
    {
        if (idx >= T::kChoices.size())
            return nullptr;

        return makeValue(T::fromIndex(idx));
    }

    std::optional<std::size_t> choiceOf(Value const& v) const override
    {
        if (! v.holds<T>())
            return std::nullopt;

        return v.get<T>().index();
    }
};

template <typename E>
class EnumMeta final : public MetaType
{
public:
    Shape shape() const override { return Shape::literal; }
    std::type_info const& typeInfo() const override { return typeid(E); }

    std::vector<std::string> choices() const override
    {
        std::vector<std::string> result;

        for (auto const& [enumerator, label] : EnumTraits<E>::kEnumerators)
            result.emplace_back(label);

        return result;
    }

    ValuePtr fromChoice(std::size_t idx) const override
    {
        if (idx >= EnumTraits<E>::kEnumerators.size())
            return nullptr;

        return makeValue(EnumTraits<E>::kEnumerators[idx].first);
    }

    std::optional<std::size_t> choiceOf(Value const& v) const override
    {
        if (! v.holds<E>())
            return std::nullopt;

        auto const& enumerators = EnumTraits<E>::kEnumerators;
        auto it = std::find_if(enumerators.begin(), enumerators.end(),
                               [&v] (auto const& entry) { return entry.first == v.get<E>(); });

        if (it == enumerators.end())
            return std::nullopt;

        return static_cast<std::size_t>(it - enumerators.begin());
    }
};

template <typename T>
class OptionalMeta final : public MetaType
{
    using Inner = typename T::value_type;
public:
    Shape shape() const override { return Shape::optional; }
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::vector<MetaTypeGetter> elementTypes() const override { return { &metaTypeOf<Inner> }; }
    ValuePtr prototype() const override { return makeValue(T()); }

    ValuePtr wrap(std::size_t, ValuePtr inner) const override
    {
        if (inner == nullptr)
            return makeValue(T());

        return makeValue(T(inner->get<Inner>()));
    }

    std::optional<std::size_t> alternativeOf(Value const& v) const override
    {
        if (v.get<T>().has_value())
            return 0;

        return std::nullopt;
    }

    ValuePtr unwrap(Value const& v) const override
    {
        auto const& opt = v.get<T>();
        return opt.has_value() ? makeValue(*opt) : nullptr;
    }
};

template <typename T>
class SequenceMeta final : public MetaType
{
    using Element = typename T::value_type;
public:
    Shape shape() const override { return Shape::sequence; }
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::vector<MetaTypeGetter> elementTypes() const override { return { &metaTypeOf<Element> }; }
    ValuePtr prototype() const override { return makeValue(T()); }

    std::expected<ValuePtr, std::string> assemble(std::span<ValuePtr const> parts) const override
    {
        T result;

        for (auto const& part : parts)
        {
            if constexpr (requires (T& c) { c.push_back(std::declval<Element>()); })
                result.push_back(part->get<Element>());
            else
                result.insert(part->get<Element>());
        }

        return makeValue(std::move(result));
    }

    std::vector<ValuePtr> disassemble(Value const& v) const override
    {
        std::vector<ValuePtr> parts;

        for (auto const& element : v.get<T>())
            parts.emplace_back(makeValue(Element(element)));

        return parts;
    }
};

template <typename T>
class FixedTupleMeta final : public MetaType
{
    static constexpr auto kSize = std::tuple_size_v<T>;
public:
    Shape shape() const override { return Shape::fixedTuple; }
    std::type_info const& typeInfo() const override { return typeid(T); }

    std::vector<MetaTypeGetter> elementTypes() const override
    {
        return std::invoke([] <std::size_t... I> (std::index_sequence<I...>) -> std::vector<MetaTypeGetter>
        {
            return { &metaTypeOf<std::tuple_element_t<I, T>>... };
        }, std::make_index_sequence<kSize>());
    }

    std::expected<ValuePtr, std::string> assemble(std::span<ValuePtr const> parts) const override
    {
        if (parts.size() != kSize)
            return std::unexpected(std::format("expected {} values, got {}", kSize, parts.size()));

        return std::invoke([&parts] <std::size_t... I> (std::index_sequence<I...>)
        {
            return makeValue(T{ parts[I]->template get<std::tuple_element_t<I, T>>()... });
        }, std::make_index_sequence<kSize>());
    }

    std::vector<ValuePtr> disassemble(Value const& v) const override
    {
        auto const& tuple = v.get<T>();

        return std::invoke([&tuple] <std::size_t... I> (std::index_sequence<I...>) -> std::vector<ValuePtr>
        {
            return { makeValue(std::get<I>(tuple))... };
        }, std::make_index_sequence<kSize>());
    }
};

template <typename T>
class MappingMeta final : public MetaType
{
    using Key = typename T::key_type;
    using Mapped = typename T::mapped_type;
public:
    Shape shape() const override { return Shape::mapping; }
    std::type_info const& typeInfo() const override { return typeid(T); }
    std::vector<MetaTypeGetter> elementTypes() const override { return { &metaTypeOf<Key>, &metaTypeOf<Mapped> }; }
    ValuePtr prototype() const override { return makeValue(T()); }

    std::expected<ValuePtr, std::string> assemble(std::span<ValuePtr const> parts) const override
    {
        if (parts.size() % 2 != 0)
            return std::unexpected(std::string("expected key/value pairs"));

        T result;

        for (std::size_t i = 0; i < parts.size(); i += 2)
            result.insert_or_assign(parts[i]->get<Key>(), parts[i + 1]->get<Mapped>());

        return makeValue(std::move(result));
    }

    std::vector<ValuePtr> disassemble(Value const& v) const override
    {
        std::vector<ValuePtr> parts;

        for (auto const& [key, mapped] : v.get<T>())
        {
            parts.emplace_back(makeValue(key));
            parts.emplace_back(makeValue(mapped));
        }

        return parts;
    }
};

template <typename T, std::size_t I>
ValuePtr wrapAlternative(ValuePtr const& inner)
{
    return makeValue(T(std::in_place_index<I>, inner->get<std::variant_alternative_t<I, T>>()));
}

template <typename T>
class VariantMeta final : public MetaType
{
    static constexpr auto kSize = std::variant_size_v<T>;
public:
    Shape shape() const override { return Shape::variant; }
    std::type_info const& typeInfo() const override { return typeid(T); }

    std::vector<MetaTypeGetter> elementTypes() const override
    {
        return std::invoke([] <std::size_t... I> (std::index_sequence<I...>) -> std::vector<MetaTypeGetter>
        {
            return { &metaTypeOf<std::variant_alternative_t<I, T>>... };
        }, std::make_index_sequence<kSize>());
    }

    ValuePtr wrap(std::size_t alternative, ValuePtr inner) const override
    {
        static constexpr auto kWrappers = std::invoke([] <std::size_t... I> (std::index_sequence<I...>)
        {
            return std::array<ValuePtr (*)(ValuePtr const&), kSize> {{ &wrapAlternative<T, I>... }};
        }, std::make_index_sequence<kSize>());

        if (alternative >= kSize || inner == nullptr)
            return nullptr;

        return kWrappers[alternative](inner);
    }

    std::optional<std::size_t> alternativeOf(Value const& v) const override
    {
        return v.get<T>().index();
    }

    ValuePtr unwrap(Value const& v) const override
    {
        return std::visit([] (auto const& alternative) -> ValuePtr { return makeValue(alternative); }, v.get<T>());
    }
};

template <typename T>
concept validatable = requires (T const& t)
{
    { t.validate() } -> std::same_as<std::expected<void, std::string>>;
};

template <typename T>
class RecordMeta final : public MetaType
{
    using Traits = RecordTraits<T>;
    using FieldsAsTuple = typename decay_tuple<decltype(Traits::fields(std::declval<T&>()))>::type;
    static constexpr auto kNumFields = std::tuple_size_v<FieldsAsTuple>;

    template <std::size_t I>
    using FieldAt = std::tuple_element_t<I, FieldsAsTuple>;
public:
    Shape shape() const override { return Shape::record; }
    std::type_info const& typeInfo() const override { return typeid(T); }

    std::string name() const override
    {
        if constexpr (requires { T::kCommandName; })
            return std::string(T::kCommandName);
        else
        {
            // Box<int> -> box-int
            auto result = kebabCase(shortTypeName(MetaType::name()), true);

            for (auto getter : templateArguments())
                result += "-" + argumentName(getter());

            return result;
        }
    }

    std::string help() const override
    {
        if constexpr (requires { T::kHelp; })
            return std::string(T::kHelp);
        else
            return {};
    }

    std::span<FieldDescriptor const> fields() const override
    {
        static auto const kDescriptors = std::invoke([] <std::size_t... I> (std::index_sequence<I...>)
        {
            return std::array<FieldDescriptor, kNumFields> {{
                FieldDescriptor { FieldAt<I>::kName, &metaTypeOf<typename FieldAt<I>::DeclaredType>, &FieldAt<I>::annotations }...
            }};
        }, std::make_index_sequence<kNumFields>());

        return kDescriptors;
    }

    std::vector<MetaTypeGetter> templateArguments() const override
    {
        return std::invoke([] <typename... Args> (std::type_identity<std::tuple<Args...>>) -> std::vector<MetaTypeGetter>
        {
            return { &metaTypeOf<Args>... };
        }, std::type_identity<typename template_arguments<T>::type>());
    }

    ValuePtr prototype() const override { return makeValue(T{}); }

    std::expected<ValuePtr, std::string> assemble(std::span<ValuePtr const> parts) const override
    {
        if (parts.size() != kNumFields)
            return std::unexpected(std::format("expected {} field values, got {}", kNumFields, parts.size()));

        T result{};

        std::invoke([&parts, &result] <std::size_t... I> (std::index_sequence<I...>)
        {
            auto flds = Traits::fields(result);
            ((std::get<I>(flds) = parts[I]->template get<typename FieldAt<I>::ValueType>()), ...);
        }, std::make_index_sequence<kNumFields>());

        if constexpr (validatable<T>)
        {
            if (auto valid = result.validate(); ! valid)
                return std::unexpected(valid.error());
        }

        return makeValue(std::move(result));
    }

    std::vector<ValuePtr> disassemble(Value const& v) const override
    {
        auto const& record = v.get<T>();

        return std::apply([] (auto const&... flds) -> std::vector<ValuePtr>
        {
            return { (flds.hasValue() ? makeValue(flds()) : ValuePtr()) ... };
        }, Traits::fields(record));
    }
};
} // namespace detail

template <typename T>
MetaType const& metaTypeOf()
{
    using U = std::remove_cv_t<T>;

    if constexpr (detail::is_annotated<U>::value)
    {
        static detail::AnnotatedMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::is_optional<U>::value)
    {
        static detail::OptionalMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::is_variant<U>::value)
    {
        static detail::VariantMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::is_literal<U>::value)
    {
        static detail::LiteralMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::enum_with_traits<U>)
    {
        static detail::EnumMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::is_fixed_tuple<U>::value)
    {
        static detail::FixedTupleMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::is_mapping<U>::value)
    {
        static detail::MappingMeta<U> const meta;
        return meta;
    }
    else if constexpr (detail::is_sequence<U>::value)
    {
        static detail::SequenceMeta<U> const meta;
        return meta;
    }
    else if constexpr (RecordTraits<U>::kIsRecord)
    {
        static detail::RecordMeta<U> const meta;
        return meta;
    }
    else
    {
        static detail::PrimitiveMeta<U> const meta;
        return meta;
    }
}
} // namespace dynargs
