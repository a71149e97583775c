/**
 * @file constructors.hpp
 * @brief Conversion between raw command line tokens and typed values
 *
 * A ConstructorSpec describes how a leaf argument consumes tokens. Specs are
 * obtained from a ConstructorRegistry, which consults, in order:
 *   1. an explicit per-field conf::Constructor<> override
 *   2. user rules, in registration order (first match wins)
 *   3. built-in rules for primitives, literals, optionals, sequences, fixed
 *      tuples, mappings and unions of primitives
 *
 * User rules are added to the innermost scope and are removed again when that
 * scope ends:
 *
 * @code
 * ConstructorRegistry registry;
 * {
 *     auto scope = registry.scope();
 *     registry.add<std::map<std::string, nlohmann::json>>(jsonSpec());
 *     auto args = dynargs::parse<Args>(argv, { .registry = &registry });
 * }
 * @endcode
 */

#pragma once

#include <expected>
#include <functional>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "resolver.hpp"

namespace dynargs
{

/// nargs value of a leaf consuming any number of tokens
inline constexpr std::size_t kVariableNargs = std::numeric_limits<std::size_t>::max();

struct ConstructorSpec
{
    std::size_t nargs = 1;
    std::string metavar;

    std::function<std::expected<ValuePtr, std::string>(std::span<std::string const>)> instanceFromTokens;
    std::function<std::vector<std::string>(Value const&)> tokensFromInstance;
    std::function<bool(Value const&)> accepts;

    /// Valid tokens for literal-like specs, shown in help
    std::vector<std::string> choices;

    bool isVariable() const noexcept { return nargs == kVariableNargs; }
};

/**
 * @brief Builds a spec for a type T from typed conversion functions
 *
 * @param parse (std::span<std::string const>) -> std::expected<T, std::string>
 * @param format (T const&) -> std::vector<std::string>
 */
template <typename T, typename Parse, typename Format>
ConstructorSpec makeSpec(std::size_t nargs, std::string metavar, Parse parse, Format format)
{
    ConstructorSpec spec;
    spec.nargs = nargs;
    spec.metavar = std::move(metavar);

    spec.instanceFromTokens = [parse] (std::span<std::string const> tokens) -> std::expected<ValuePtr, std::string>
    {
        auto result = parse(tokens);

        if (! result)
            return std::unexpected(std::move(result.error()));

        return makeValue<T>(std::move(*result));
    };

    spec.tokensFromInstance = [format] (Value const& v) -> std::vector<std::string> { return format(v.get<T>()); };
    spec.accepts = [] (Value const& v) { return v.holds<T>(); };
    return spec;
}

class ConstructorRegistry
{
public:
    using Rule = std::function<std::optional<ConstructorSpec>(TypeDescriptor const&, ConstructorRegistry const&)>;
    using Predicate = std::function<bool(TypeDescriptor const&)>;
    using Factory = std::function<ConstructorSpec(TypeDescriptor const&, ConstructorRegistry const&)>;

    /// Removes the rules added while it was the innermost scope
    class Scope
    {
    public:
        Scope(Scope && o) noexcept : registry(std::exchange(o.registry, nullptr)), depth(o.depth) {}

        /// Pops the frame pushed by this scope. Throws InternalError if it is not the innermost one.
        ~Scope() noexcept(false);

        Scope(Scope const&) = delete;
        Scope& operator=(Scope const&) = delete;
        Scope& operator=(Scope&&) = delete;

    private:
        friend class ConstructorRegistry;
        explicit Scope(ConstructorRegistry& registry_);

        ConstructorRegistry* registry;
        std::size_t depth = 0;
    };

    ConstructorRegistry();

    [[nodiscard]] Scope scope();

    /// Number of active scopes, the base scope included
    std::size_t depth() const { return frames.size(); }

    void add(Rule rule);
    void add(Predicate predicate, Factory factory);

    /// Registers spec for exactly the type T
    template <typename T>
    void add(ConstructorSpec spec)
    {
        add([spec = std::move(spec)] (TypeDescriptor const& desc, ConstructorRegistry const&) -> std::optional<ConstructorSpec>
        {
            if (desc.meta == nullptr || desc.meta->typeInfo() != typeid(T))
                return std::nullopt;

            return spec;
        });
    }

    /// User rules, then built-in rules. Returns nullopt if no rule matches.
    std::optional<ConstructorSpec> find(TypeDescriptor const& desc) const;

    /// Like find() but honours a per-field override and throws NoMatchingRuleError
    ConstructorSpec lookup(TypeDescriptor const& desc, Annotations const& annotations, Path const& path) const;

    /// Rules for the shapes every registry understands
    static std::optional<ConstructorSpec> builtin(TypeDescriptor const& desc, ConstructorRegistry const& registry);

private:
    std::vector<std::vector<Rule>> frames;
};
} // namespace dynargs
