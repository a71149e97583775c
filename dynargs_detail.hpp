#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <boost/pfr.hpp>
#include <fixed_string.hpp>

namespace dynargs
{

// Forward declarations needed by detail namespace
template <typename T, fixstr::fixed_string Name, typename... Markers> class Field;
template <typename T, typename... Markers> struct Annotated;
template <fixstr::fixed_string... Choices> class Literal;
template <typename E> struct EnumTraits {};

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/**
 * @brief Filters a tuple, keeping only elements that satisfy the Predicate
 *
 * @tparam Predicate A template that provides a ::value bool for each type
 * @param tp The tuple to filter
 * @return A new tuple containing only elements where Predicate<T>::value is true
 */
template <template<typename> class Predicate, typename Tuple>
auto filter_tuple(Tuple&& tp)
{
    return std::apply([]<typename... Ts>(Ts&&... args) {
        auto maybe_keep = []<typename T>(T&& arg) {
            if constexpr (Predicate<T>::value)
                return std::tuple<T>(std::forward<T>(arg));
            else
                return std::tuple<>();
        };
        return std::tuple_cat(maybe_keep(std::forward<Ts>(args))...);
    }, std::forward<Tuple>(tp));
}

//-----------------------------------------------------------------------------
// Field type detection
//-----------------------------------------------------------------------------

template <typename T> struct is_field_helper : std::false_type {};
template <typename T, fixstr::fixed_string Name, typename... Markers>
struct is_field_helper<Field<T, Name, Markers...>> : std::true_type {};

/// Predicate that is true if T is a Field<> specialization
template <typename T> struct is_field { static constexpr auto value = is_field_helper<std::decay_t<T>>::value; };

template <typename T> struct is_std_array : std::false_type {};
template <typename U, std::size_t N> struct is_std_array<std::array<U, N>> : std::true_type {};

/// Returns the number of Field<> members in the aggregate T
template <typename T>
constexpr std::size_t num_fields()
{
    if constexpr (std::is_aggregate_v<T> && (! std::is_array_v<T>) && (! is_std_array<T>::value))
        return std::tuple_size_v<decltype(filter_tuple<is_field>(boost::pfr::structure_tie(std::declval<T&>())))>;
    else
        return 0;
}

/// Helper to decay all types in a tuple
template <typename T> struct decay_tuple;
template <typename... Types> struct decay_tuple<std::tuple<Types...>>
{
    using type = std::tuple<std::decay_t<Types>...>;
};

//-----------------------------------------------------------------------------
// Shape detection for the standard containers the resolver understands
//-----------------------------------------------------------------------------

template <typename T> struct is_optional : std::false_type {};
template <typename U> struct is_optional<std::optional<U>> : std::true_type {};

template <typename T> struct is_variant : std::false_type {};
template <typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

template <typename T> struct is_sequence : std::false_type {};
template <typename U, typename A> struct is_sequence<std::vector<U, A>> : std::true_type {};
template <typename U, typename A> struct is_sequence<std::deque<U, A>>  : std::true_type {};
template <typename U, typename A> struct is_sequence<std::list<U, A>>   : std::true_type {};
template <typename U, typename C, typename A> struct is_sequence<std::set<U, C, A>> : std::true_type {};

template <typename T> struct is_fixed_tuple : is_std_array<T> {};
template <typename... Ts> struct is_fixed_tuple<std::tuple<Ts...>> : std::true_type {};
template <typename A, typename B> struct is_fixed_tuple<std::pair<A, B>> : std::true_type {};

template <typename T> struct is_mapping : std::false_type {};
template <typename K, typename V, typename C, typename A> struct is_mapping<std::map<K, V, C, A>> : std::true_type {};
template <typename K, typename V, typename H, typename E, typename A> struct is_mapping<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <typename T> struct is_literal : std::false_type {};
template <fixstr::fixed_string... Choices> struct is_literal<Literal<Choices...>> : std::true_type {};

template <typename T> struct is_annotated : std::false_type {};
template <typename T, typename... Markers> struct is_annotated<Annotated<T, Markers...>> : std::true_type {};

template <typename E>
concept enum_with_traits = std::is_enum_v<E> && requires { EnumTraits<E>::kEnumerators; };

/// Strips Annotated<> wrappers, yielding the type a value is actually stored as
template <typename T> struct strip_annotated { using type = T; };
template <typename T, typename... Markers> struct strip_annotated<Annotated<T, Markers...>> : strip_annotated<T> {};
template <typename T> using strip_annotated_t = typename strip_annotated<T>::type;

/// Template arguments of a class template instantiation (the generic binding environment)
template <typename T> struct template_arguments { using type = std::tuple<>; };
template <template <typename...> class Tmpl, typename... Args>
struct template_arguments<Tmpl<Args...>> { using type = std::tuple<Args...>; };

/// Callable introspection for function pointers and non-generic lambdas
template <typename F> struct callable_traits : callable_traits<decltype(&F::operator())> {};
template <typename R, typename... Args> struct callable_traits<R (*)(Args...)>
{
    using result_type = R;
    using arguments = std::tuple<std::remove_cvref_t<Args>...>;
};
template <typename R, typename... Args> struct callable_traits<R (*)(Args...) noexcept> : callable_traits<R (*)(Args...)> {};
template <typename R, typename... Args> struct callable_traits<R (Args...)> : callable_traits<R (*)(Args...)> {};
template <typename C, typename R, typename... Args> struct callable_traits<R (C::*)(Args...)> : callable_traits<R (*)(Args...)> {};
template <typename C, typename R, typename... Args> struct callable_traits<R (C::*)(Args...) const> : callable_traits<R (*)(Args...)> {};
template <typename C, typename R, typename... Args> struct callable_traits<R (C::*)(Args...) const noexcept> : callable_traits<R (*)(Args...)> {};

//-----------------------------------------------------------------------------
// Scope guard
//-----------------------------------------------------------------------------

/// Invokes a lambda when leaving the enclosing scope, on every exit path
template <typename Lambda>
struct ScopedReleaser
{
    explicit ScopedReleaser(Lambda && lambda_) : lambda(std::move(lambda_)) {}
    ~ScopedReleaser() { lambda(); }

    ScopedReleaser(ScopedReleaser const&) = delete;
    ScopedReleaser& operator=(ScopedReleaser const&) = delete;
private:
    Lambda lambda;
};

template <typename Lambda>
auto callAtEndOfScope(Lambda && lambda) { return ScopedReleaser<Lambda>(std::move(lambda)); }

// Combines multiple lambda types into a single callable object
template<typename ...L>
struct multilambda : L...
{
    using L::operator()...;
    constexpr multilambda(L...lambda) : L(std::move(lambda))... {}
};

//-----------------------------------------------------------------------------
// Naming helpers (implemented in dynargs.cpp)
//-----------------------------------------------------------------------------

/// Demangles a type name, e.g. "N3app3FooE" -> "app::Foo"
std::string demangle(char const* mangled);

/// Unqualified name without template arguments, e.g. "app::Box<int>" -> "Box"
std::string shortTypeName(std::string_view qualified);

/// "flag_a" -> "flag-a", "BarCommand" -> "bar-command"
std::string kebabCase(std::string_view name, bool splitCamelCase = false);
} // namespace detail

} // namespace dynargs
