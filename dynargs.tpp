#pragma once

#include <filesystem>
#include <format>
#include <functional>
#include <iostream>

namespace dynargs
{
namespace detail
{
inline constexpr char const* kDefaultProg = "program";

/// Non-record types are parsed through a one-field wrapper record
template <typename T>
using CliTarget = std::conditional_t<record<T>, T, Wrapped<T>>;

template <typename T>
ValuePtr defaultInstanceOf(std::optional<T> const& instance)
{
    if (! instance.has_value())
        return nullptr;

    if constexpr (record<T>)
    {
        return makeValue(*instance);
    }
    else
    {
        Wrapped<T> wrapped;
        wrapped.value = *instance;
        return makeValue(std::move(wrapped));
    }
}

template <typename T>
T unwrapResult(Value const& value)
{
    if constexpr (record<T>)
        return value.get<T>();
    else
        return value.get<Wrapped<T>>().value();
}
} // namespace detail

//=============================================================================
template <typename T>
std::expected<T, Failure> parse(std::vector<std::string> args, Options<T> options)
{
    using Target = detail::CliTarget<T>;

    auto value = detail::run(metaTypeOf<Target>(), detail::defaultInstanceOf(options.defaultInstance), args,
                             options.prog.value_or(detail::kDefaultProg), options.description, options.registry);

    if (! value)
        return std::unexpected(std::move(value.error()));

    return detail::unwrapResult<T>(**value);
}

template <template <typename...> class Tmpl>
auto parse(std::vector<std::string> args)
{
    if constexpr (requires { typename Tmpl<>; })
    {
        return parse<Tmpl<>>(std::move(args));
    }
    else
    {
        throw UnresolvedGenericError("the template arguments of a generic struct could not be inferred; "
                                     "give them explicitly, declare defaults or pass a default instance");
    }
}

template <template <typename...> class Tmpl, typename... Args>
std::expected<Tmpl<Args...>, Failure> parse(std::vector<std::string> args, Options<Tmpl<Args...>> options)
{
    if (! options.defaultInstance.has_value())
        throw UnresolvedGenericError(std::format("cannot infer the template arguments of {} without a default instance",
                                                 detail::demangle(typeid(Tmpl<Args...>).name())));

    return parse<Tmpl<Args...>>(std::move(args), std::move(options));
}

template <typename T>
T cli(int argc, char const* const* argv, Options<T> options)
{
    std::vector<std::string> args;

    if (options.args.has_value())
        args = *options.args;
    else
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);

    if ((! options.prog.has_value()) && argc > 0 && argv[0] != nullptr)
        options.prog = std::filesystem::path(argv[0]).filename().string();

    auto result = parse<T>(std::move(args), std::move(options));

    if (result)
        return std::move(*result);

    auto const& failure = result.error();

    if (failure.reason == Failure::Reason::helpRequested)
    {
        std::cout << failure.text;
        std::exit(EXIT_SUCCESS);
    }

    std::cerr << failure.usage << "\n\n" << "error: " << failure.text << std::endl;
    std::exit(EXIT_FAILURE);
}

template <fixstr::fixed_string... Names, typename Fn>
auto call(Fn && fn, std::vector<std::string> args, ConstructorRegistry const* registry)
{
    using Traits = detail::callable_traits<std::decay_t<Fn>>;
    using Result = typename Traits::result_type;
    using Parameters = Signature<typename Traits::arguments, Names...>;

    Options<Parameters> options;
    options.registry = registry;

    auto parameters = parse<Parameters>(std::move(args), std::move(options));

    if (! parameters)
        return std::expected<Result, Failure>(std::unexpect, std::move(parameters.error()));

    auto invoke = [&fn] (auto const&... flds) -> Result { return std::invoke(std::forward<Fn>(fn), flds()...); };

    if constexpr (std::is_void_v<Result>)
    {
        std::apply(invoke, parameters->parameters);
        return std::expected<Result, Failure>();
    }
    else
    {
        return std::expected<Result, Failure>(std::apply(invoke, parameters->parameters));
    }
}
} // namespace dynargs
