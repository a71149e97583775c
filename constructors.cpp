#include "constructors.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <iterator>
#include <sstream>
#include "debug.hpp"
#include "errors.hpp"

namespace dynargs
{

namespace
{
std::string join(std::vector<std::string> const& parts, std::string_view separator)
{
    std::string result;

    for (auto const& part : parts)
    {
        if (! result.empty())
            result += separator;

        result += part;
    }

    return result;
}

/// Resolves the specs of all children, or nothing if one of them has no rule
std::optional<std::vector<ConstructorSpec>> childSpecs(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    std::vector<ConstructorSpec> specs;

    for (auto const& child : desc.children)
    {
        auto spec = registry.find(*child);

        if (! spec)
            return std::nullopt;

        specs.push_back(std::move(*spec));
    }

    return specs;
}

std::function<bool(Value const&)> holdsTypeOf(MetaType const& meta)
{
    return [&meta] (Value const& v) { return v.type() == meta.typeInfo(); };
}

//=============================================================================
std::optional<ConstructorSpec> primitiveRule(TypeDescriptor const& desc, ConstructorRegistry const&)
{
    if (desc.kind != TypeDescriptor::Kind::primitive)
        return std::nullopt;

    auto const* codec = desc.meta->codec();

    if (codec == nullptr)
        return std::nullopt;

    ConstructorSpec spec;
    spec.nargs = 1;
    spec.metavar = std::string(codec->metavar);
    spec.instanceFromTokens = [codec] (std::span<std::string const> tokens) { return codec->parse(tokens.front()); };
    spec.tokensFromInstance = [codec] (Value const& v) -> std::vector<std::string> { return { codec->format(v) }; };
    spec.accepts = holdsTypeOf(*desc.meta);

    if (codec->kind == PrimitiveCodec::Kind::boolean)
        spec.choices = { "True", "False" };

    return spec;
}

std::optional<ConstructorSpec> literalRule(TypeDescriptor const& desc, ConstructorRegistry const&)
{
    if (desc.kind != TypeDescriptor::Kind::literal)
        return std::nullopt;

    auto const* meta = desc.meta;
    auto const choices = desc.choices;

    ConstructorSpec spec;
    spec.nargs = 1;
    spec.metavar = "{" + join(choices, ",") + "}";
    spec.choices = choices;

    spec.instanceFromTokens = [meta, choices] (std::span<std::string const> tokens) -> std::expected<ValuePtr, std::string>
    {
        auto it = std::find(choices.begin(), choices.end(), tokens.front());

        if (it == choices.end())
            return std::unexpected(std::format("invalid choice: '{}' (choose from {})", tokens.front(), join(choices, ", ")));

        return meta->fromChoice(static_cast<std::size_t>(it - choices.begin()));
    };

    spec.tokensFromInstance = [meta, choices] (Value const& v) -> std::vector<std::string>
    {
        if (auto idx = meta->choiceOf(v); idx && *idx < choices.size())
            return { choices[*idx] };

        return {};
    };

    spec.accepts = [meta] (Value const& v) { return meta->choiceOf(v).has_value(); };
    return spec;
}

std::optional<ConstructorSpec> optionalRule(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    if (desc.kind != TypeDescriptor::Kind::optional)
        return std::nullopt;

    auto inner = registry.find(*desc.children.front());

    if (! inner)
        return std::nullopt;

    auto const* meta = desc.meta;

    ConstructorSpec spec;
    spec.nargs = inner->nargs;
    spec.metavar = "{None}|" + inner->metavar;
    spec.choices = inner->choices;

    if (! spec.choices.empty())
        spec.choices.insert(spec.choices.begin(), "None");

    spec.instanceFromTokens = [meta, parse = inner->instanceFromTokens] (std::span<std::string const> tokens)
        -> std::expected<ValuePtr, std::string>
    {
        if (tokens.size() == 1 && tokens.front() == "None")
            return meta->wrap(0, nullptr);

        auto value = parse(tokens);

        if (! value)
            return std::unexpected(std::move(value.error()));

        return meta->wrap(0, *value);
    };

    spec.tokensFromInstance = [meta, format = inner->tokensFromInstance] (Value const& v) -> std::vector<std::string>
    {
        auto contained = meta->unwrap(v);

        if (contained == nullptr)
            return { "None" };

        return format(*contained);
    };

    spec.accepts = holdsTypeOf(*meta);
    return spec;
}

std::optional<ConstructorSpec> sequenceRule(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    if (desc.kind != TypeDescriptor::Kind::sequence)
        return std::nullopt;

    auto element = registry.find(*desc.children.front());

    if (! element || element->isVariable() || element->nargs == 0)
        return std::nullopt;

    auto const* meta = desc.meta;
    auto const chunk = element->nargs;

    ConstructorSpec spec;
    spec.nargs = kVariableNargs;
    spec.metavar = std::format("{0} [{0} ...]", element->metavar);
    spec.choices = element->choices;

    spec.instanceFromTokens = [meta, chunk, parse = element->instanceFromTokens] (std::span<std::string const> tokens)
        -> std::expected<ValuePtr, std::string>
    {
        if (tokens.size() % chunk != 0)
            return std::unexpected(std::format("expected a multiple of {} values, got {}", chunk, tokens.size()));

        std::vector<ValuePtr> parts;

        for (std::size_t i = 0; i < tokens.size(); i += chunk)
        {
            auto part = parse(tokens.subspan(i, chunk));

            if (! part)
                return std::unexpected(std::move(part.error()));

            parts.push_back(std::move(*part));
        }

        return meta->assemble(parts);
    };

    spec.tokensFromInstance = [meta, format = element->tokensFromInstance] (Value const& v)
    {
        std::vector<std::string> tokens;

        for (auto const& part : meta->disassemble(v))
            std::ranges::copy(format(*part), std::back_inserter(tokens));

        return tokens;
    };

    spec.accepts = holdsTypeOf(*meta);
    return spec;
}

std::optional<ConstructorSpec> fixedTupleRule(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    if (desc.kind != TypeDescriptor::Kind::fixedTuple)
        return std::nullopt;

    auto elements = childSpecs(desc, registry);

    if (! elements)
        return std::nullopt;

    if (std::ranges::any_of(*elements, [] (ConstructorSpec const& e) { return e.isVariable(); }))
        return std::nullopt;

    auto const* meta = desc.meta;

    ConstructorSpec spec;
    spec.nargs = 0;
    std::vector<std::string> metavars;

    for (auto const& e : *elements)
    {
        spec.nargs += e.nargs;
        metavars.push_back(e.metavar);
    }

    spec.metavar = join(metavars, " ");

    spec.instanceFromTokens = [meta, elements = *elements] (std::span<std::string const> tokens)
        -> std::expected<ValuePtr, std::string>
    {
        std::vector<ValuePtr> parts;
        std::size_t offset = 0;

        for (auto const& e : elements)
        {
            if (offset + e.nargs > tokens.size())
                return std::unexpected(std::format("expected more than {} values", tokens.size()));

            auto part = e.instanceFromTokens(tokens.subspan(offset, e.nargs));

            if (! part)
                return std::unexpected(std::move(part.error()));

            parts.push_back(std::move(*part));
            offset += e.nargs;
        }

        return meta->assemble(parts);
    };

    spec.tokensFromInstance = [meta, elements = *elements] (Value const& v)
    {
        std::vector<std::string> tokens;
        auto const parts = meta->disassemble(v);

        for (std::size_t i = 0; i < parts.size() && i < elements.size(); ++i)
            std::ranges::copy(elements[i].tokensFromInstance(*parts[i]), std::back_inserter(tokens));

        return tokens;
    };

    spec.accepts = holdsTypeOf(*meta);
    return spec;
}

std::optional<ConstructorSpec> mappingRule(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    if (desc.kind != TypeDescriptor::Kind::mapping)
        return std::nullopt;

    auto elements = childSpecs(desc, registry);

    if (! elements || (*elements)[0].isVariable() || (*elements)[1].isVariable())
        return std::nullopt;

    if ((*elements)[0].nargs + (*elements)[1].nargs == 0)
        return std::nullopt;

    auto const* meta = desc.meta;
    auto key = (*elements)[0];
    auto mapped = (*elements)[1];

    ConstructorSpec spec;
    spec.nargs = kVariableNargs;
    spec.metavar = std::format("{0} {1} [{0} {1} ...]", key.metavar, mapped.metavar);

    spec.instanceFromTokens = [meta, key, mapped] (std::span<std::string const> tokens)
        -> std::expected<ValuePtr, std::string>
    {
        auto const chunk = key.nargs + mapped.nargs;

        if (tokens.size() % chunk != 0)
            return std::unexpected(std::format("expected key/value pairs of {} values, got {} values", chunk, tokens.size()));

        std::vector<ValuePtr> parts;

        for (std::size_t i = 0; i < tokens.size(); i += chunk)
        {
            auto k = key.instanceFromTokens(tokens.subspan(i, key.nargs));

            if (! k)
                return std::unexpected(std::move(k.error()));

            auto v = mapped.instanceFromTokens(tokens.subspan(i + key.nargs, mapped.nargs));

            if (! v)
                return std::unexpected(std::move(v.error()));

            parts.push_back(std::move(*k));
            parts.push_back(std::move(*v));
        }

        return meta->assemble(parts);
    };

    spec.tokensFromInstance = [meta, key, mapped] (Value const& v)
    {
        std::vector<std::string> tokens;
        auto const parts = meta->disassemble(v);

        for (std::size_t i = 0; i + 1 < parts.size(); i += 2)
        {
            std::ranges::copy(key.tokensFromInstance(*parts[i]), std::back_inserter(tokens));
            std::ranges::copy(mapped.tokensFromInstance(*parts[i + 1]), std::back_inserter(tokens));
        }

        return tokens;
    };

    spec.accepts = holdsTypeOf(*meta);
    return spec;
}

/// Alternatives are tried in declaration order, the first one that parses wins
std::optional<ConstructorSpec> unionRule(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    if (desc.kind != TypeDescriptor::Kind::union_ || desc.isChoice())
        return std::nullopt;

    auto branches = childSpecs(desc, registry);

    if (! branches || branches->empty())
        return std::nullopt;

    auto const nargs = branches->front().nargs;

    if (std::ranges::any_of(*branches, [nargs] (ConstructorSpec const& b) { return b.nargs != nargs; }))
        return std::nullopt;

    auto const* meta = desc.meta;

    ConstructorSpec spec;
    spec.nargs = nargs;

    std::vector<std::string> metavars;

    for (auto const& b : *branches)
    {
        metavars.push_back(b.metavar);
        std::ranges::copy(b.choices, std::back_inserter(spec.choices));
    }

    spec.metavar = join(metavars, "|");

    // a branch without choices accepts any token, so the choices no longer restrict the input
    if (std::ranges::any_of(*branches, [] (ConstructorSpec const& b) { return b.choices.empty(); }))
        spec.choices.clear();

    spec.instanceFromTokens = [meta, branches = *branches] (std::span<std::string const> tokens)
        -> std::expected<ValuePtr, std::string>
    {
        std::vector<std::string> errors;

        for (std::size_t i = 0; i < branches.size(); ++i)
        {
            auto value = branches[i].instanceFromTokens(tokens);

            if (value)
                return meta->wrap(i, *value);

            errors.push_back(std::move(value.error()));
        }

        return std::unexpected(join(errors, "; "));
    };

    spec.tokensFromInstance = [meta, branches = *branches] (Value const& v) -> std::vector<std::string>
    {
        auto const inner = meta->unwrap(v);

        if (inner == nullptr)
            return {};

        for (auto const& b : branches)
            if (b.accepts(*inner))
                return b.tokensFromInstance(*inner);

        return {};
    };

    spec.accepts = holdsTypeOf(*meta);
    return spec;
}
} // namespace

//=============================================================================
ConstructorRegistry::Scope::Scope(ConstructorRegistry& registry_) : registry(&registry_)
{
    registry->frames.emplace_back();
    depth = registry->frames.size();
    DYNARGS_DEBUG_L2("ConstructorRegistry: entering scope {}", registry->frames.size());
}

ConstructorRegistry::Scope::~Scope() noexcept(false)
{
    if (registry == nullptr)
        return;

    if (registry->frames.size() != depth)
    {
        if (std::uncaught_exceptions() == 0)
            throw InternalError(std::format("registry scope {} released while {} scopes are active", depth, registry->frames.size()));

        DYNARGS_DEBUG_L1("ConstructorRegistry: scope {} released out of order during unwinding", depth);
        return;
    }

    DYNARGS_DEBUG_L2("ConstructorRegistry: leaving scope {} ({} rules)", registry->frames.size(), registry->frames.back().size());
    registry->frames.pop_back();
}

//=============================================================================
ConstructorRegistry::ConstructorRegistry() : frames(1) {}

ConstructorRegistry::Scope ConstructorRegistry::scope()
{
    return Scope(*this);
}

void ConstructorRegistry::add(Rule rule)
{
    frames.back().push_back(std::move(rule));
}

void ConstructorRegistry::add(Predicate predicate, Factory factory)
{
    add([predicate = std::move(predicate), factory = std::move(factory)] (TypeDescriptor const& desc, ConstructorRegistry const& registry)
        -> std::optional<ConstructorSpec>
    {
        if (! predicate(desc))
            return std::nullopt;

        return factory(desc, registry);
    });
}

std::optional<ConstructorSpec> ConstructorRegistry::find(TypeDescriptor const& desc) const
{
    for (auto const& frame : frames)
    {
        for (auto const& rule : frame)
        {
            if (auto spec = rule(desc, *this))
                return spec;
        }
    }

    return builtin(desc, *this);
}

ConstructorSpec ConstructorRegistry::lookup(TypeDescriptor const& desc, Annotations const& annotations, Path const& path) const
{
    if (annotations.constructor != nullptr)
        return annotations.constructor();

    if (auto spec = find(desc))
        return *spec;

    throw NoMatchingRuleError(std::format("no constructor rule matches field '{}' of type {} ({}); "
                                          "register one with ConstructorRegistry::add or attach conf::Constructor<>",
                                          path.toString(), detail::demangle(desc.meta->typeInfo().name()),
                                          [&desc] { std::ostringstream s; s << desc.kind; return s.str(); } ()));
}

std::optional<ConstructorSpec> ConstructorRegistry::builtin(TypeDescriptor const& desc, ConstructorRegistry const& registry)
{
    for (auto rule : { &primitiveRule, &literalRule, &optionalRule, &sequenceRule, &fixedTupleRule, &mappingRule, &unionRule })
    {
        if (auto spec = rule(desc, registry))
            return spec;
    }

    return std::nullopt;
}
} // namespace dynargs
