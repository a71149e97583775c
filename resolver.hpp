/**
 * @file resolver.hpp
 * @brief Canonical shape of a type position
 *
 * The Resolver turns the raw MetaType graph into TypeDescriptors: Annotated<>
 * wrappers are stripped into field-level annotations, unions are classified as
 * either a choice between records or a union of primitives and recursive types
 * are rejected.
 */

#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <vector>
#include "metatype.hpp"

namespace dynargs
{

struct TypeDescriptor;
using TypeDescriptorPtr = std::shared_ptr<TypeDescriptor const>;

struct TypeDescriptor
{
    enum class Kind
    {
        primitive,
        optional,
        sequence,
        fixedTuple,
        mapping,
        literal,
        nestedStruct,
        union_
    };

    /// One field of a nestedStruct
    struct Member
    {
        std::string name;           ///< path segment, already renamed by conf::Name
        std::string fieldname;      ///< as declared
        TypeDescriptorPtr type;
        Annotations annotations;    ///< field markers merged with Annotated<> markers
    };

    Kind kind = Kind::primitive;

    /// The type a value is stored as
    MetaType const* meta = nullptr;

    /// The type as declared, possibly wrapped in Annotated<>
    MetaType const* source = nullptr;

    /**
     * optional: [inner], sequence: [element], fixedTuple: one per position,
     * mapping: [key, value], union_: one per alternative
     */
    std::vector<TypeDescriptorPtr> children;

    std::vector<Member> members;
    std::vector<std::string> choices;
    Annotations annotations;

    /// Template arguments the record was instantiated with
    std::vector<MetaType const*> bindings;

    /// A union whose alternatives are all records (rendered as subcommands)
    bool isChoice() const;

    std::string name() const;

    friend bool operator==(TypeDescriptor const& a, TypeDescriptor const& b);
};

std::ostream& operator<<(std::ostream& o, TypeDescriptor::Kind kind);

/**
 * @brief Builds TypeDescriptors from MetaTypes
 *
 * @code
 * Resolver resolver;
 * auto desc = resolver.resolve(metaTypeOf<Args>());
 * @endcode
 *
 * Throws CyclicTypeError, UnsupportedUnionShapeError.
 */
class Resolver
{
public:
    TypeDescriptorPtr resolve(MetaType const& raw);

    /// Re-derives a descriptor from the type it was created from. Yields an equal descriptor.
    TypeDescriptorPtr resolve(TypeDescriptor const& descriptor);

private:
    struct ActiveRecord
    {
        std::type_index type;
        std::vector<std::type_index> bindings;
        std::string name;
    };

    std::shared_ptr<TypeDescriptor> resolveRecord(MetaType const& meta);
    void classifyUnion(TypeDescriptor const& desc) const;

    std::vector<ActiveRecord> active;
};
} // namespace dynargs
