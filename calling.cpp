#include "calling.hpp"

#include <format>
#include "debug.hpp"

namespace dynargs
{

namespace
{
std::string displayName(LeafNode const& leaf)
{
    auto const def = leaf.definition();
    return def.positional ? def.metavar : def.flag;
}
} // namespace

std::expected<ValuePtr, InputError> Reconstructor::assemble(ParserNode const& node)
{
    return node.visit(detail::multilambda {
        [this] (LeafNode const& leaf)     { return assembleLeaf(leaf); },
        [this] (GroupNode const& group)   { return assembleGroup(group); },
        [this] (ChoiceNode const& choice) { return assembleChoice(choice); }
    });
}

std::expected<ValuePtr, InputError> Reconstructor::assembleLeaf(LeafNode const& leaf)
{
    auto const key = leaf.key();
    auto const& field = leaf.field();
    auto it = values.find(key);

    if (it != values.end())
        used.insert(key);

    if (it == values.end() || (! it->second.has_value()))
    {
        if (field.defaultValue.hasValue())
        {
            DYNARGS_DEBUG_L3("Reconstructor: '{}' uses its default", key);
            return field.defaultValue.value;
        }

        return std::unexpected(InputError(MissingRequiredArgument { field.path, displayName(leaf) }));
    }

    auto const& tokens = *it->second;

    if (leaf.isFixed())
        return std::unexpected(InputError(ConversionError { field.path, displayName(leaf), tokens, "this argument is fixed and cannot be set" }));

    auto const nargs = leaf.constructor().nargs;

    if ((! leaf.constructor().isVariable()) && tokens.size() != nargs)
        return std::unexpected(InputError(ConversionError { field.path, displayName(leaf), tokens,
                                                            std::format("expected {} value{}, got {}", nargs, nargs == 1 ? "" : "s", tokens.size()) }));

    DYNARGS_DEBUG_L3("Reconstructor: '{}' from {} tokens", key, tokens.size());

    auto value = leaf.constructor().instanceFromTokens(tokens);

    if (! value)
        return std::unexpected(InputError(ConversionError { field.path, displayName(leaf), tokens, std::move(value.error()) }));

    return std::move(*value);
}

std::expected<ValuePtr, InputError> Reconstructor::assembleGroup(GroupNode const& group)
{
    std::vector<ValuePtr> parts;
    parts.reserve(group.children().size());

    for (auto const& child : group.children())
    {
        auto value = assemble(*child);

        if (! value)
            return std::unexpected(std::move(value.error()).within(group.field().path));

        parts.push_back(std::move(*value));
    }

    auto instance = group.record().assemble(parts);

    if (! instance)
        return std::unexpected(InputError(InstantiationError { group.field().path, std::move(instance.error()) }));

    DYNARGS_DEBUG_L2("Reconstructor: assembled '{}'", group.key());
    return std::move(*instance);
}

std::expected<ValuePtr, InputError> Reconstructor::assembleChoice(ChoiceNode const& choice)
{
    auto const& field = choice.field();
    std::optional<std::size_t> selected;

    if (choice.implicit())
    {
        selected = choice.defaultVariant();
    }
    else
    {
        auto const key = choice.key();
        auto it = values.find(key);

        if (it != values.end())
            used.insert(key);

        if (it != values.end() && it->second.has_value() && (! it->second->empty()))
        {
            auto const& name = it->second->front();
            selected = choice.find(name);

            if (! selected)
                return std::unexpected(InputError(UsageError { std::format("invalid subcommand: '{}'", name) }));
        }
        else if (choice.defaultVariant())
        {
            selected = choice.defaultVariant();
        }
        else
        {
            std::string names;

            for (auto const& variant : choice.variants())
                names += (names.empty() ? "" : ",") + variant.name;

            return std::unexpected(InputError(MissingRequiredArgument { field.path, "{" + names + "}" }));
        }
    }

    if (! selected)
        throw InternalError(std::format("subcommand group '{}' has no variant to select", field.path.toString()));

    auto const& variant = choice.variants()[*selected];
    DYNARGS_DEBUG_L2("Reconstructor: '{}' selects {}", choice.key(), variant.name);

    ValuePtr inner;

    if (variant.subtree != nullptr)
    {
        auto value = assemble(*variant.subtree);

        if (! value)
            return std::unexpected(std::move(value.error()).within(field.path));

        inner = std::move(*value);
    }

    return choice.wrap(*selected, std::move(inner));
}

std::expected<ValuePtr, InputError> Reconstructor::assembleAll(GroupNode const& root, FlatValues const& values)
{
    Reconstructor reconstructor(values);
    auto result = reconstructor.assemble(root);

    if (! result)
        return result;

    std::string leftovers;

    for (auto const& [key, tokens] : values)
        if (! reconstructor.consumed().contains(key))
            leftovers += (leftovers.empty() ? "'" : ", '") + key + "'";

    if (! leftovers.empty())
        throw InternalError(std::format("parsed arguments were never consumed: {}", leftovers));

    return result;
}
} // namespace dynargs
