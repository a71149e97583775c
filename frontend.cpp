#include "frontend.hpp"

#include <cctype>
#include <deque>
#include <format>
#include <map>
#include "debug.hpp"

namespace dynargs
{

namespace
{
bool looksLikeFlag(std::string_view tok)
{
    if (tok.size() < 2 || tok.front() != '-')
        return false;

    // negative numbers are values
    return ! (std::isdigit(static_cast<unsigned char>(tok[1])) || tok[1] == '.');
}

std::string join(std::vector<std::string> const& parts, std::string_view separator)
{
    std::string result;

    for (auto const& part : parts)
        result += (result.empty() ? "" : std::string(separator)) + part;

    return result;
}

std::unexpected<InputError> usageError(std::string message)
{
    return std::unexpected(InputError(UsageError { std::move(message) }));
}

/// Leaves and subcommand groups of the top-level parser scope
void collectScope(ParserNode const& node, std::vector<LeafNode const*>& leaves, std::vector<ChoiceNode const*>& choices)
{
    node.visit(detail::multilambda {
        [&] (LeafNode const& leaf) { leaves.push_back(&leaf); },
        [&] (GroupNode const& group)
        {
            for (auto const& child : group.children())
                collectScope(*child, leaves, choices);
        },
        [&] (ChoiceNode const& choice)
        {
            if (! choice.implicit())
            {
                choices.push_back(&choice);
                return;
            }

            for (auto const& variant : choice.variants())
                if (variant.subtree != nullptr)
                    collectScope(*variant.subtree, leaves, choices);
        }
    });
}

std::string subcommandList(ChoiceNode const& choice)
{
    std::vector<std::string> names;

    for (auto const& variant : choice.variants())
        names.push_back(variant.name);

    return "{" + join(names, ",") + "}";
}

std::string helpLine(std::string const& invocation, std::string const& text)
{
    static constexpr std::size_t kColumn = 22;

    if (text.empty())
        return std::format("  {}\n", invocation);

    if (invocation.size() < kColumn)
        return std::format("  {:<{}}{}\n", invocation, kColumn, text);

    return std::format("  {}\n  {:<{}}{}\n", invocation, "", kColumn, text);
}

std::string describe(ArgumentDefinition const& def)
{
    std::string text = def.help;
    std::string suffix;

    if (def.required)
        suffix = "(required)";
    else if (def.fixed)
        suffix = std::format("(fixed to: {})", join(def.defaultDisplay, " "));
    else
        suffix = std::format("(default: {})", join(def.defaultDisplay, " "));

    return text.empty() ? suffix : text + " " + suffix;
}

//=============================================================================
struct FlagTarget
{
    LeafNode const* leaf;
    bool negated;
};

/// Arguments that are currently reachable, given the subcommands selected so far
class ParseState
{
public:
    explicit ParseState(ParseResult& result_) : result(result_) {}

    void activate(ParserNode const& node)
    {
        node.visit(detail::multilambda {
            [this] (LeafNode const& leaf)
            {
                auto const def = leaf.definition();
                result.values.try_emplace(def.key, std::nullopt);

                if (def.positional)
                {
                    positionals.push_back(&leaf);
                    return;
                }

                flags.insert_or_assign(def.flag, FlagTarget { &leaf, false });

                if (def.booleanFlag)
                    flags.insert_or_assign(def.negatedFlag(), FlagTarget { &leaf, true });
            },
            [this] (GroupNode const& group)
            {
                for (auto const& child : group.children())
                    activate(*child);
            },
            [this] (ChoiceNode const& choice)
            {
                if (choice.implicit())
                {
                    for (auto const& variant : choice.variants())
                        if (variant.subtree != nullptr)
                            activate(*variant.subtree);

                    return;
                }

                result.values.try_emplace(choice.key(), std::nullopt);
                pending.push_back(&choice);
            }
        });
    }

    /// The pending subcommand group offering tok, if any
    std::optional<std::pair<ChoiceNode const*, std::size_t>> findSubcommand(std::string_view tok) const
    {
        for (auto const* choice : pending)
            if (auto idx = choice->find(tok))
                return std::make_pair(choice, *idx);

        return std::nullopt;
    }

    void select(ChoiceNode const& choice, std::size_t idx)
    {
        auto const& variant = choice.variants()[idx];
        DYNARGS_DEBUG_L2("FrontEndParser: selected subcommand {}", variant.name);

        result.values[choice.key()] = std::vector<std::string> { variant.name };
        std::erase(pending, &choice);

        if (variant.subtree != nullptr)
            activate(*variant.subtree);
    }

    /// Activates the default variant of every subcommand group left unselected
    void finish()
    {
        while (! pending.empty())
        {
            auto const* choice = pending.front();
            pending.pop_front();

            if (auto idx = choice->defaultVariant())
                if (auto const& subtree = choice->variants()[*idx].subtree)
                    activate(*subtree);
        }
    }

    std::map<std::string, FlagTarget> flags;
    std::deque<LeafNode const*> positionals;

private:
    ParseResult& result;
    std::deque<ChoiceNode const*> pending;
};
} // namespace

//=============================================================================
std::expected<ParseResult, InputError> FrontEndParser::parse(std::span<std::string const> args) const
{
    ParseResult result;
    ParseState state(result);
    state.activate(root);

    bool onlyPositionals = false;

    // consumes tokens until n are collected, a flag starts or (for variable nargs) a subcommand is named
    auto take = [&] (std::size_t& i, std::size_t n, std::vector<std::string>& out)
    {
        while (i < args.size() && out.size() < n)
        {
            auto const& tok = args[i];

            if ((! onlyPositionals) && (tok == "--" || looksLikeFlag(tok)))
                break;

            if (n == kVariableNargs && (! onlyPositionals) && state.findSubcommand(tok))
                break;

            out.push_back(tok);
            ++i;
        }
    };

    auto countMismatch = [] (ArgumentDefinition const& def, std::size_t got)
    {
        return def.nargs != kVariableNargs && got != def.nargs;
    };

    for (std::size_t i = 0; i < args.size();)
    {
        auto const& tok = args[i];
        DYNARGS_DEBUG_L3("FrontEndParser: token '{}'", tok);

        if ((! onlyPositionals) && tok == "--")
        {
            onlyPositionals = true;
            ++i;
            continue;
        }

        if ((! onlyPositionals) && (tok == "-h" || tok == "--help"))
        {
            result.helpRequested = true;
            return result;
        }

        if ((! onlyPositionals) && looksLikeFlag(tok))
        {
            auto const eq = tok.find('=');
            auto const name = tok.substr(0, eq);
            auto it = state.flags.find(name);

            if (it == state.flags.end())
                return usageError(std::format("unrecognized arguments: {}", tok));

            auto const [leaf, negated] = it->second;
            auto const def = leaf->definition();
            ++i;

            if (def.fixed)
                return usageError(std::format("argument {}: this argument is fixed and cannot be set", name));

            if (def.booleanFlag)
            {
                if (eq != std::string::npos)
                    return usageError(std::format("argument {}: ignored explicit argument '{}'", name, tok.substr(eq + 1)));

                result.values[def.key] = std::vector<std::string> { negated ? "False" : "True" };
                continue;
            }

            std::vector<std::string> tokens;

            if (eq != std::string::npos)
                tokens.push_back(tok.substr(eq + 1));

            take(i, def.nargs, tokens);

            if (countMismatch(def, tokens.size()))
                return usageError(std::format("argument {}: expected {} argument{}", name, def.nargs, def.nargs == 1 ? "" : "s"));

            result.values[def.key] = std::move(tokens);
            continue;
        }

        if (! onlyPositionals)
        {
            if (auto selection = state.findSubcommand(tok))
            {
                state.select(*selection->first, selection->second);
                ++i;
                continue;
            }
        }

        if (! state.positionals.empty())
        {
            auto const* leaf = state.positionals.front();
            state.positionals.pop_front();

            auto const def = leaf->definition();
            std::vector<std::string> tokens;
            take(i, def.nargs, tokens);

            if (countMismatch(def, tokens.size()))
                return usageError(std::format("argument {}: expected {} argument{}", def.metavar, def.nargs, def.nargs == 1 ? "" : "s"));

            if (def.fixed)
                return usageError(std::format("argument {}: this argument is fixed and cannot be set", def.metavar));

            result.values[def.key] = std::move(tokens);
            continue;
        }

        return usageError(std::format("unrecognized arguments: {}", tok));
    }

    state.finish();
    DYNARGS_DEBUG_L1("FrontEndParser: {} arguments, {} values", args.size(), result.values.size());
    return result;
}

std::string FrontEndParser::usage() const
{
    std::vector<LeafNode const*> leaves;
    std::vector<ChoiceNode const*> choices;
    collectScope(root, leaves, choices);

    std::string line = std::format("usage: {} [-h]", prog);
    std::vector<std::string> positionals;

    for (auto const* leaf : leaves)
    {
        auto const def = leaf->definition();

        if (def.suppressed)
            continue;

        if (def.positional)
        {
            positionals.push_back(def.required ? def.metavar : "[" + def.metavar + "]");
            continue;
        }

        if (def.booleanFlag)
            line += std::format(" [{} | {}]", def.flag, def.negatedFlag());
        else if (def.required)
            line += std::format(" {} {}", def.flag, def.metavar);
        else
            line += std::format(" [{} {}]", def.flag, def.metavar);
    }

    for (auto const& positional : positionals)
        line += " " + positional;

    for (auto const* choice : choices)
    {
        auto const list = subcommandList(*choice);
        line += choice->defaultVariant() ? " [" + list + "]" : " " + list;
    }

    return line;
}

std::string FrontEndParser::help() const
{
    std::vector<LeafNode const*> leaves;
    std::vector<ChoiceNode const*> choices;
    collectScope(root, leaves, choices);

    std::string text = usage() + "\n";

    if (! description.empty())
        text += "\n" + description + "\n";

    std::string positionals;
    std::string options = helpLine("-h, --help", "show this help message and exit");

    for (auto const* leaf : leaves)
    {
        auto const def = leaf->definition();

        if (def.suppressed)
            continue;

        if (def.positional)
            positionals += helpLine(def.metavar, describe(def));
        else if (def.booleanFlag)
            options += helpLine(std::format("{}, {}", def.flag, def.negatedFlag()), describe(def));
        else
            options += helpLine(std::format("{} {}", def.flag, def.metavar), describe(def));
    }

    if (! positionals.empty())
        text += "\npositional arguments:\n" + positionals;

    text += "\noptions:\n" + options;

    for (auto const* choice : choices)
    {
        text += std::format("\nsubcommands{}:\n", choice->field().name.empty() ? std::string() : " (" + choice->field().name + ")");
        text += helpLine(subcommandList(*choice), "");

        for (auto const& variant : choice->variants())
            text += helpLine("  " + variant.name, variant.help);
    }

    return text;
}
} // namespace dynargs
