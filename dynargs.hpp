/**
 * @file dynargs.hpp
 * @brief Command lines derived from C++ structs
 *
 * Describe the arguments of a program as a struct of Field<> members and let
 * dynargs derive the command line, parse it and hand back a filled-in instance:
 *
 * @code
 * struct Args
 * {
 *     Field<bool, "boolean"> boolean;
 *     Field<std::optional<bool>, "optional_boolean"> optionalBoolean = std::nullopt;
 *     Field<bool, "flag_a"> flagA = false;
 * };
 *
 * int main(int argc, char** argv)
 * {
 *     auto args = dynargs::cli<Args>(argc, argv);
 *     std::cout << args.boolean() << std::endl;
 * }
 * @endcode
 *
 * Nested structs become groups of prefixed flags (--inner.x), std::variant<>s
 * of structs become subcommands and everything else becomes a single argument
 * converted by a ConstructorRegistry rule.
 *
 * Errors in the struct definitions throw a StructuralError. Errors in the
 * user's input are returned as a Failure by parse() and terminate the process
 * in cli().
 */

#pragma once

#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "calling.hpp"
#include "constructors.hpp"
#include "errors.hpp"
#include "field.hpp"
#include "frontend.hpp"
#include "metatype.hpp"
#include "resolver.hpp"
#include "schema.hpp"

namespace dynargs
{

/**
 * @brief Settings of a single parse
 *
 * @tparam T The type being parsed
 */
template <typename T>
struct Options
{
    /// Program name shown in usage. cli() defaults it to argv[0].
    std::optional<std::string> prog;

    /// Replaces the kHelp text of the top-level struct
    std::optional<std::string> description;

    /// Used by cli() instead of argv
    std::optional<std::vector<std::string>> args;

    /// Its set fields replace the declared defaults
    std::optional<T> defaultInstance;

    /// Rules for user types. Built-in rules are used if nullptr.
    ConstructorRegistry const* registry = nullptr;
};

/// Why parse() did not return an instance
struct Failure
{
    enum class Reason
    {
        helpRequested,
        invalidInput
    };

    Reason reason;
    std::string usage;

    /// The help text, or the error message
    std::string text;

    std::optional<InputError> error;
};

/**
 * @brief Parses args into a T
 *
 * T may be a record, or any other supported type, which is then exposed as a
 * single positional argument (or as subcommands for a std::variant of records).
 * options.args is ignored; args is used instead.
 *
 * Throws a StructuralError if T cannot be expressed as a command line.
 */
template <typename T>
std::expected<T, Failure> parse(std::vector<std::string> args, Options<T> options = {});

/**
 * @brief Parses args into an instance of a class template
 *
 * Uses the default template arguments of Tmpl. Throws UnresolvedGenericError if
 * Tmpl has none.
 */
template <template <typename...> class Tmpl>
auto parse(std::vector<std::string> args);

/// Parses into Tmpl<Args...>, with the template arguments taken from the options' default instance
template <template <typename...> class Tmpl, typename... Args>
std::expected<Tmpl<Args...>, Failure> parse(std::vector<std::string> args, Options<Tmpl<Args...>> options);

/**
 * @brief Parses the process arguments into a T
 *
 * Prints help to stdout and exits with EXIT_SUCCESS if requested. Prints the
 * usage and the error to stderr and exits with EXIT_FAILURE on invalid input.
 */
template <typename T>
T cli(int argc, char const* const* argv, Options<T> options = {});

/**
 * @brief Reconstructs the parameters of fn from args and calls it
 *
 * @code
 * auto sum = dynargs::call<"a", "b">([] (int a, int b) { return a + b; }, { "--a", "1", "--b", "2" });
 * @endcode
 */
template <fixstr::fixed_string... Names, typename Fn>
auto call(Fn && fn, std::vector<std::string> args, ConstructorRegistry const* registry = nullptr);

namespace detail
{
/// Derives the schema of target, parses args against it and reconstructs the instance
std::expected<ValuePtr, Failure> run(MetaType const& target, ValuePtr defaultInstance, std::span<std::string const> args,
                                     std::string const& prog, std::optional<std::string> const& description,
                                     ConstructorRegistry const* registry);
} // namespace detail
} // namespace dynargs

#include "dynargs.tpp"
