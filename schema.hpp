/**
 * @file schema.hpp
 * @brief The tree of arguments derived from a record
 *
 * The SchemaBuilder walks a resolved record and produces a tree of ParserNodes:
 *   - LeafNode: a single argument consuming raw tokens
 *   - GroupNode: a nested record, assembled from its children
 *   - ChoiceNode: a union of records (or an optional record), exposed as
 *     subcommands of which exactly one is active
 *
 * The tree is immutable once built. The front-end parser and the
 * Reconstructor only ever read it.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "constructors.hpp"

namespace dynargs
{

/// Default of a field: required, a concrete value, or missing (groups/choices without a default)
struct Default
{
    enum class Kind
    {
        required,
        value,
        missing
    };

    Kind kind = Kind::required;
    ValuePtr value;

    static Default required()           { return {}; }
    static Default missing()            { return { Kind::missing, nullptr }; }
    static Default of(ValuePtr value_)  { return { Kind::value, std::move(value_) }; }

    bool hasValue() const noexcept { return kind == Kind::value; }
};

/// One field of a record, as placed in the tree
struct FieldSpec
{
    std::string name;
    TypeDescriptorPtr type;
    Default defaultValue;
    std::string doc;
    Path path;
    Annotations overrides;
};

/**
 * @brief What the front-end parser needs to know about a leaf
 */
struct ArgumentDefinition
{
    std::string key;                    ///< flat mapping key
    std::string flag;                   ///< "--a.b", empty for positionals
    std::size_t nargs = 1;
    std::string metavar;
    bool required = false;
    std::vector<std::string> defaultDisplay;
    std::string help;
    bool positional = false;
    bool booleanFlag = false;           ///< --x / --no-x pair, no tokens
    bool fixed = false;
    bool suppressed = false;
    std::vector<std::string> choices;

    /// "--no-x" for boolean flags
    std::string negatedFlag() const;
};

class LeafNode;
class GroupNode;
class ChoiceNode;

class ParserNode
{
public:
    enum class Kind
    {
        leaf,
        group,
        choice
    };

    virtual ~ParserNode() = default;

    virtual Kind kind() const = 0;

    FieldSpec const& field() const { return spec; }

    /// Flat mapping key of this node
    std::string key() const { return spec.path.toString(); }

    /// Calls the overload matching the concrete node type
    template <typename Lambda>
    auto visit(this auto&& self, Lambda && lambda) -> decltype(auto);

protected:
    explicit ParserNode(FieldSpec spec_) : spec(std::move(spec_)) {}

    FieldSpec spec;
};

using ParserNodePtr = std::unique_ptr<ParserNode const>;

class LeafNode final : public ParserNode
{
public:
    struct Flags
    {
        bool booleanFlag = false;
        bool fixed = false;
        bool suppressed = false;
        bool positional = false;
    };

    LeafNode(FieldSpec spec_, ConstructorSpec constructor_, Flags flags_)
        : ParserNode(std::move(spec_)), ctor(std::move(constructor_)), flags(flags_) {}

    Kind kind() const override { return Kind::leaf; }

    ConstructorSpec const& constructor() const { return ctor; }

    bool isBooleanFlag() const { return flags.booleanFlag; }
    bool isFixed() const       { return flags.fixed || flags.suppressed; }
    bool isSuppressed() const  { return flags.suppressed; }
    bool isPositional() const  { return flags.positional; }

    ArgumentDefinition definition() const;

private:
    ConstructorSpec ctor;
    Flags flags;
};

class GroupNode final : public ParserNode
{
public:
    GroupNode(FieldSpec spec_, MetaType const& meta_, std::vector<ParserNodePtr> children_)
        : ParserNode(std::move(spec_)), meta(meta_), nodes(std::move(children_)) {}

    Kind kind() const override { return Kind::group; }

    /// The record assembled by this group
    MetaType const& record() const { return meta; }

    std::vector<ParserNodePtr> const& children() const { return nodes; }

private:
    MetaType const& meta;
    std::vector<ParserNodePtr> nodes;
};

class ChoiceNode final : public ParserNode
{
public:
    struct Variant
    {
        std::string name;                       ///< subcommand, e.g. "command:commit"
        ParserNodePtr subtree;                  ///< nullptr for the "None" variant
        std::optional<std::size_t> alternative; ///< index in the std::variant, nullopt for "None"
        std::string help;
    };

    ChoiceNode(FieldSpec spec_, std::vector<Variant> variants_, MetaType const* unionMeta_,
               MetaType const* optionalMeta_, std::optional<std::size_t> defaultVariant_, bool implicit_)
        : ParserNode(std::move(spec_)), alternatives(std::move(variants_)), unionMeta(unionMeta_),
          optionalMeta(optionalMeta_), defaultIdx(defaultVariant_), isImplicit(implicit_) {}

    Kind kind() const override { return Kind::choice; }

    std::vector<Variant> const& variants() const { return alternatives; }

    /// Index into variants() used when no subcommand is given
    std::optional<std::size_t> defaultVariant() const { return defaultIdx; }

    /// Without subcommands: the default variant is always selected
    bool implicit() const { return isImplicit; }

    /// Finds a variant by its subcommand name
    std::optional<std::size_t> find(std::string_view name) const;

    /// Wraps the value of the given variant (or nullptr for "None") into the field's type
    ValuePtr wrap(std::size_t variant, ValuePtr inner) const;

private:
    std::vector<Variant> alternatives;
    MetaType const* unionMeta;
    MetaType const* optionalMeta;
    std::optional<std::size_t> defaultIdx;
    bool isImplicit;
};

template <typename Lambda>
auto ParserNode::visit(this auto&& self, Lambda && lambda) -> decltype(auto)
{
    switch (self.kind())
    {
    case Kind::leaf:   return lambda(static_cast<LeafNode const&>(self));
    case Kind::group:  return lambda(static_cast<GroupNode const&>(self));
    case Kind::choice: break;
    }

    return lambda(static_cast<ChoiceNode const&>(self));
}

/**
 * @brief Derives the argument tree of a record
 *
 * @code
 * Resolver resolver;
 * ConstructorRegistry registry;
 * auto root = SchemaBuilder(registry).build(resolver.resolve(metaTypeOf<Args>()), nullptr);
 * @endcode
 *
 * Throws NoMatchingRuleError, AmbiguousFieldNameError and StructuralError.
 */
class SchemaBuilder
{
public:
    explicit SchemaBuilder(ConstructorRegistry const& registry_) : registry(registry_) {}

    /**
     * @param target resolved record
     * @param defaultInstance value of the record whose set fields override the declared defaults, or nullptr
     * @param prefix path of the record
     */
    std::unique_ptr<GroupNode const> build(TypeDescriptorPtr const& target, ValuePtr defaultInstance, Path const& prefix = {}) const;

private:
    std::unique_ptr<GroupNode const> buildGroup(FieldSpec field, ValuePtr instance) const;
    ParserNodePtr buildMember(TypeDescriptor::Member const& member, Default defaultValue, Path const& prefix) const;
    ParserNodePtr buildChoice(FieldSpec field) const;
    ParserNodePtr buildLeaf(FieldSpec field) const;

    ConstructorRegistry const& registry;
};

/// Throws AmbiguousFieldNameError if keys, flags or subcommands collide
void checkUniqueness(GroupNode const& root);

/// True for a union of records and for an optional record or union of records
bool isSubcommandShape(TypeDescriptor const& desc);

/// Calls fn for every leaf in the tree, including those of all variants
void forEachLeaf(ParserNode const& node, std::function<void(LeafNode const&)> const& fn);
} // namespace dynargs
