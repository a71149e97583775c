#include "schema.hpp"

#include <algorithm>
#include <format>
#include <set>
#include "debug.hpp"
#include "errors.hpp"

namespace dynargs
{

namespace
{
/// Fixed and Suppress on a record or union apply to every argument below it
Annotations inheritedFrom(Annotations const& parent)
{
    Annotations a;
    a.fixed = parent.fixed;
    a.suppress = parent.suppress;
    return a;
}

ConstructorSpec unsettableSpec(TypeDescriptor const& desc)
{
    ConstructorSpec spec;
    spec.nargs = 1;
    spec.metavar = "{fixed}";
    spec.instanceFromTokens = [name = desc.name()] (std::span<std::string const>) -> std::expected<ValuePtr, std::string>
    {
        return std::unexpected(std::format("values of type {} cannot be parsed", name));
    };
    spec.tokensFromInstance = [] (Value const&) { return std::vector<std::string>(); };
    spec.accepts = [] (Value const&) { return false; };
    return spec;
}

//=============================================================================
struct ScopeNames
{
    std::set<std::string> flags;
    std::set<std::string> subcommands;
};

void claim(std::set<std::string>& taken, std::string const& name, std::string_view what)
{
    if (! taken.insert(name).second)
        throw AmbiguousFieldNameError(std::format("{} '{}' is used more than once; rename one of the fields with conf::Name<>",
                                                  what, name));
}

/// Collects the names of one parser scope. Subcommand subtrees open their own scope and are returned in nested.
void collectScope(ParserNode const& node, ScopeNames& scope, std::set<std::string>& keys,
                  std::vector<ChoiceNode const*>& nested)
{
    node.visit(detail::multilambda {
        [&] (LeafNode const& leaf)
        {
            claim(keys, leaf.key(), "argument");

            auto const def = leaf.definition();

            if (def.flag.empty())
                return;

            claim(scope.flags, def.flag, "flag");

            if (def.booleanFlag)
                claim(scope.flags, def.negatedFlag(), "flag");
        },
        [&] (GroupNode const& group)
        {
            for (auto const& child : group.children())
                collectScope(*child, scope, keys, nested);
        },
        [&] (ChoiceNode const& choice)
        {
            if (choice.implicit())
            {
                for (auto const& variant : choice.variants())
                    if (variant.subtree != nullptr)
                        collectScope(*variant.subtree, scope, keys, nested);

                return;
            }

            claim(keys, choice.key(), "subcommand group");

            for (auto const& variant : choice.variants())
                claim(scope.subcommands, variant.name, "subcommand");

            nested.push_back(&choice);
        }
    });
}

void checkScope(ParserNode const& node, ScopeNames scope, std::set<std::string>& keys)
{
    std::vector<ChoiceNode const*> nested;
    collectScope(node, scope, keys, nested);

    for (auto const* choice : nested)
        for (auto const& variant : choice->variants())
            if (variant.subtree != nullptr)
                checkScope(*variant.subtree, scope, keys);
}
} // namespace

//=============================================================================
std::string ArgumentDefinition::negatedFlag() const
{
    auto const dot = flag.rfind('.');
    auto const split = dot == std::string::npos ? std::min<std::size_t>(2, flag.size()) : dot + 1;
    return flag.substr(0, split) + "no-" + flag.substr(split);
}

ArgumentDefinition LeafNode::definition() const
{
    ArgumentDefinition def;
    def.key = key();
    def.positional = isPositional();
    def.flag = def.positional ? std::string() : spec.path.flagName();
    def.booleanFlag = isBooleanFlag();
    def.nargs = def.booleanFlag ? 0 : ctor.nargs;
    def.metavar = ctor.metavar;
    def.required = spec.defaultValue.kind == Default::Kind::required;
    def.help = spec.doc;
    def.fixed = isFixed();
    def.suppressed = isSuppressed();
    def.choices = ctor.choices;

    auto const& value = spec.defaultValue.value;

    if (spec.defaultValue.hasValue() && value != nullptr && ctor.accepts && ctor.accepts(*value))
        def.defaultDisplay = ctor.tokensFromInstance(*value);

    return def;
}

std::optional<std::size_t> ChoiceNode::find(std::string_view name) const
{
    auto it = std::find_if(alternatives.begin(), alternatives.end(),
                           [name] (Variant const& v) { return v.name == name; });

    if (it == alternatives.end())
        return std::nullopt;

    return static_cast<std::size_t>(it - alternatives.begin());
}

ValuePtr ChoiceNode::wrap(std::size_t variant, ValuePtr inner) const
{
    auto const& v = alternatives.at(variant);
    auto value = std::move(inner);

    if (v.alternative && unionMeta != nullptr)
        value = unionMeta->wrap(*v.alternative, std::move(value));

    if (optionalMeta != nullptr)
        value = optionalMeta->wrap(0, v.alternative ? std::move(value) : nullptr);

    return value;
}

//=============================================================================
std::unique_ptr<GroupNode const> SchemaBuilder::build(TypeDescriptorPtr const& target, ValuePtr defaultInstance,
                                                      Path const& prefix) const
{
    if (target == nullptr || target->kind != TypeDescriptor::Kind::nestedStruct)
        throw StructuralError("only records can be turned into a command line");

    DYNARGS_DEBUG_L1("SchemaBuilder: building {} (default instance: {})", target->name(), defaultInstance != nullptr);

    FieldSpec root;
    root.type = target;
    root.defaultValue = defaultInstance != nullptr ? Default::of(defaultInstance) : Default::missing();
    root.doc = target->meta->help();
    root.path = prefix;
    root.overrides = target->annotations;

    auto group = buildGroup(std::move(root), std::move(defaultInstance));
    checkUniqueness(*group);
    return group;
}

std::unique_ptr<GroupNode const> SchemaBuilder::buildGroup(FieldSpec field, ValuePtr instance) const
{
    auto const& record = *field.type;
    auto const& meta = *record.meta;

    auto const prototype = meta.prototype();
    auto const declared = meta.disassemble(*prototype);
    auto const given = instance != nullptr ? meta.disassemble(*instance) : std::vector<ValuePtr>(declared.size());

    std::vector<ParserNodePtr> children;

    for (std::size_t i = 0; i < record.members.size(); ++i)
    {
        auto member = record.members[i];
        member.annotations.fixed    = member.annotations.fixed    || field.overrides.fixed;
        member.annotations.suppress = member.annotations.suppress || field.overrides.suppress;

        Default def;

        if (i < given.size() && given[i] != nullptr)
            def = Default::of(given[i]);
        else if (i < declared.size() && declared[i] != nullptr)
            def = Default::of(declared[i]);

        children.push_back(buildMember(member, std::move(def), field.path));
    }

    DYNARGS_DEBUG_L2("SchemaBuilder: group '{}' with {} children", field.path.toString(), children.size());
    return std::make_unique<GroupNode const>(std::move(field), meta, std::move(children));
}

ParserNodePtr SchemaBuilder::buildMember(TypeDescriptor::Member const& member, Default defaultValue, Path const& prefix) const
{
    FieldSpec field;
    field.name = member.name;
    field.type = member.type;
    field.defaultValue = std::move(defaultValue);
    field.doc = member.annotations.help.value_or(std::string());
    field.path = prefix.child(member.name);
    field.overrides = member.annotations;

    auto const& desc = *member.type;

    if (desc.kind == TypeDescriptor::Kind::nestedStruct)
    {
        auto instance = field.defaultValue.value;

        if (! field.defaultValue.hasValue())
            field.defaultValue = Default::missing();

        if (field.doc.empty())
            field.doc = desc.meta->help();

        return buildGroup(std::move(field), std::move(instance));
    }

    if (isSubcommandShape(desc))
        return buildChoice(std::move(field));

    return buildLeaf(std::move(field));
}

ParserNodePtr SchemaBuilder::buildChoice(FieldSpec field) const
{
    auto const& desc = *field.type;

    MetaType const* optionalMeta = nullptr;
    MetaType const* unionMeta = nullptr;
    auto inner = field.type;

    if (desc.kind == TypeDescriptor::Kind::optional)
    {
        optionalMeta = desc.meta;
        inner = desc.children.front();
    }

    std::vector<TypeDescriptorPtr> branches;

    if (inner->kind == TypeDescriptor::Kind::union_)
    {
        unionMeta = inner->meta;
        branches = inner->children;
    }
    else
    {
        branches.push_back(inner);
    }

    // which variant the default selects, and the record it holds
    std::optional<std::size_t> selected;
    ValuePtr selectedValue;
    bool defaultIsNone = false;

    if (field.defaultValue.hasValue())
    {
        auto value = field.defaultValue.value;

        if (optionalMeta != nullptr)
        {
            value = optionalMeta->unwrap(*value);
            defaultIsNone = (value == nullptr);
        }

        if (value != nullptr && unionMeta != nullptr)
        {
            selected = unionMeta->alternativeOf(*value);
            selectedValue = unionMeta->unwrap(*value);
        }
        else if (value != nullptr)
        {
            selected = 0;
            selectedValue = value;
        }
    }
    else
    {
        field.defaultValue = Default::missing();
    }

    auto const prefix = field.path.prefix();
    auto subcommand = [&prefix] (std::string const& name) { return prefix.empty() ? name : prefix + ":" + name; };

    std::vector<ChoiceNode::Variant> variants;

    for (std::size_t i = 0; i < branches.size(); ++i)
    {
        auto const& branch = branches[i];
        auto const name = branch->name();
        auto const isDefault = selected == i;

        FieldSpec sub;
        sub.name = name;
        sub.type = branch;
        sub.defaultValue = isDefault ? Default::of(selectedValue) : Default::missing();
        sub.doc = branch->meta->help();
        sub.path = field.path.variant(name);
        sub.overrides = inheritedFrom(field.overrides);

        auto help = sub.doc;
        auto subtree = buildGroup(std::move(sub), isDefault ? selectedValue : nullptr);
        variants.push_back({ subcommand(name), std::move(subtree), i, std::move(help) });
    }

    if (optionalMeta != nullptr)
    {
        variants.push_back({ subcommand("None"), nullptr, std::nullopt, std::string() });

        if (defaultIsNone)
            selected = variants.size() - 1;
    }

    auto const implicit = field.overrides.avoidSubcommands && selected.has_value();

    if (implicit)
    {
        auto kept = std::move(variants[*selected]);
        variants.clear();
        variants.push_back(std::move(kept));
        selected = 0;
    }

    DYNARGS_DEBUG_L2("SchemaBuilder: choice '{}' with {} variants{}", field.path.toString(), variants.size(),
                     implicit ? " (no subcommands)" : "");

    return std::make_unique<ChoiceNode const>(std::move(field), std::move(variants), unionMeta, optionalMeta, selected, implicit);
}

ParserNodePtr SchemaBuilder::buildLeaf(FieldSpec field) const
{
    auto const& desc = *field.type;
    auto const& annotations = field.overrides;
    auto const& def = field.defaultValue;

    LeafNode::Flags flags;
    flags.fixed = annotations.fixed;
    flags.suppressed = annotations.suppress;
    flags.positional = annotations.positional;

    if ((flags.fixed || flags.suppressed) && (! def.hasValue()))
        throw StructuralError(std::format("field '{}' cannot be fixed without a default value", field.path.toString()));

    std::optional<ConstructorSpec> spec;

    if (annotations.constructor != nullptr)
        spec = annotations.constructor();
    else
        spec = registry.find(desc);

    if (! spec)
    {
        // throws NoMatchingRuleError
        if (! def.hasValue())
            return std::make_unique<LeafNode const>(field, registry.lookup(desc, annotations, field.path), flags);

        DYNARGS_DEBUG_L1("SchemaBuilder: no rule for '{}' ({}), using its default as a fixed value",
                         field.path.toString(), desc.name());

        spec = unsettableSpec(desc);
        flags.fixed = true;
    }

    flags.booleanFlag = def.hasValue()
        && desc.kind == TypeDescriptor::Kind::primitive
        && desc.meta->typeInfo() == typeid(bool)
        && annotations.constructor == nullptr
        && (! annotations.flagConversionOff)
        && (! flags.positional)
        && (! flags.fixed)
        && (! flags.suppressed);

    DYNARGS_DEBUG_L3("SchemaBuilder: leaf '{}' nargs={} metavar={}", field.path.toString(),
                     spec->isVariable() ? std::string("*") : std::to_string(spec->nargs), spec->metavar);

    return std::make_unique<LeafNode const>(std::move(field), std::move(*spec), flags);
}

//=============================================================================
void checkUniqueness(GroupNode const& root)
{
    std::set<std::string> keys;
    checkScope(root, ScopeNames(), keys);
}

bool isSubcommandShape(TypeDescriptor const& desc)
{
    if (desc.kind == TypeDescriptor::Kind::union_)
        return desc.isChoice();

    if (desc.kind == TypeDescriptor::Kind::optional)
    {
        auto const& inner = *desc.children.front();
        return inner.kind == TypeDescriptor::Kind::nestedStruct || inner.isChoice();
    }

    return false;
}

void forEachLeaf(ParserNode const& node, std::function<void(LeafNode const&)> const& fn)
{
    node.visit(detail::multilambda {
        [&fn] (LeafNode const& leaf) { fn(leaf); },
        [&fn] (GroupNode const& group)
        {
            for (auto const& child : group.children())
                forEachLeaf(*child, fn);
        },
        [&fn] (ChoiceNode const& choice)
        {
            for (auto const& variant : choice.variants())
                if (variant.subtree != nullptr)
                    forEachLeaf(*variant.subtree, fn);
        }
    });
}
} // namespace dynargs
