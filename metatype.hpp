/**
 * @file metatype.hpp
 * @brief Compile-time type reflection without instances
 *
 * Every C++ type that may appear in a Field has a MetaType singleton which
 * describes its raw shape (primitive, optional, sequence, record, ...) and
 * offers the type-erased operations needed to take values of that type apart
 * and put them back together. The MetaType graph is built lazily: children are
 * referenced through function pointers, so recursive types can be described
 * and it is up to the Resolver to reject them.
 */

#pragma once

#include <expected>
#include <span>
#include <string>
#include <typeinfo>
#include <vector>
#include "field.hpp"

namespace dynargs
{

class MetaType;

/// Lazily obtains a MetaType, avoiding static initialization order issues with recursive types
using MetaTypeGetter = MetaType const& (*)();

/**
 * @brief Describes a single field within a record's MetaType
 *
 * Provides the field name, a function pointer to lazily obtain the MetaType of
 * the field's declared type and the markers attached to the field.
 */
struct FieldDescriptor
{
    std::string_view fieldname;
    MetaTypeGetter metaType;
    Annotations (*annotations)();
};

/**
 * @brief Built-in string conversion for well-known primitive types
 */
struct PrimitiveCodec
{
    enum class Kind
    {
        boolean,
        integer,
        floating,
        string,
        path
    };

    Kind kind;
    std::string_view metavar;
    std::expected<ValuePtr, std::string> (*parse)(std::string_view token);
    std::string (*format)(Value const& value);
};

/**
 * @brief Abstract base class for compile-time type metadata
 *
 * Access a MetaType without an instance via metaTypeOf<T>():
 * @code
 * auto const& meta = metaTypeOf<Point>();
 * for (auto const& field : meta.fields())
 *     std::cout << field.fieldname << std::endl;
 * @endcode
 *
 * The operations which do not apply to a shape return an empty result.
 */
class MetaType
{
public:
    enum class Shape
    {
        primitive,
        annotated,
        optional,
        sequence,
        fixedTuple,
        mapping,
        literal,
        record,
        variant
    };

    virtual ~MetaType() = default;

    virtual Shape shape() const = 0;

    /// Returns the std::type_info for the underlying type
    virtual std::type_info const& typeInfo() const = 0;

    /// Human readable name. Records may override it with kCommandName.
    virtual std::string name() const;

    /// Help text of a record (kHelp), empty otherwise
    virtual std::string help() const { return {}; }

    /// Built-in conversion for primitives, or nullptr
    virtual PrimitiveCodec const* codec() const { return nullptr; }

    /**
     * @brief Child types
     *
     * optional: [inner], sequence: [element], fixed tuple: one per position,
     * mapping: [key, value], variant: one per alternative, annotated: [inner]
     */
    virtual std::vector<MetaTypeGetter> elementTypes() const { return {}; }

    /// Field descriptors for records, in declaration order
    virtual std::span<FieldDescriptor const> fields() const { return {}; }

    /// Markers of an Annotated<> wrapper
    virtual Annotations annotations() const { return {}; }

    /// Template arguments of a generic record
    virtual std::vector<MetaTypeGetter> templateArguments() const { return {}; }

    //=========================================================================
    // Literals
    virtual std::vector<std::string> choices() const { return {}; }
    virtual ValuePtr fromChoice(std::size_t) const { return nullptr; }
    virtual std::optional<std::size_t> choiceOf(Value const&) const { return std::nullopt; }

    //=========================================================================
    // Records, sequences, fixed tuples and mappings

    /// A default constructed instance (records: T{} with its declared defaults)
    virtual ValuePtr prototype() const { return nullptr; }

    /**
     * @brief Builds a value from its parts
     *
     * records: one value per field, sequences: the elements, fixed tuples: one
     * value per position, mappings: alternating keys and values.
     * Records run their validate() hook, which may fail.
     */
    virtual std::expected<ValuePtr, std::string> assemble(std::span<ValuePtr const> parts) const;

    /// Inverse of assemble(). Unset record fields are returned as nullptr.
    virtual std::vector<ValuePtr> disassemble(Value const&) const { return {}; }

    //=========================================================================
    // Optionals and variants

    /// optional: wraps inner (nullptr gives the empty optional); variant: constructs the given alternative
    virtual ValuePtr wrap(std::size_t /*alternative*/, ValuePtr /*inner*/) const { return nullptr; }

    /// optional: 0 if engaged; variant: the active index
    virtual std::optional<std::size_t> alternativeOf(Value const&) const { return std::nullopt; }

    /// optional: the contained value or nullptr; variant: the active alternative
    virtual ValuePtr unwrap(Value const&) const { return nullptr; }
};

/**
 * @brief Get the MetaType for a given C++ type T
 *
 * @tparam T The type to get metadata for
 * @return Reference to the MetaType singleton for T
 */
template <typename T>
MetaType const& metaTypeOf();

std::ostream& operator<<(std::ostream& o, MetaType::Shape shape);

namespace detail
{
/// Short lowercase name of a template argument, e.g. "int", "str" or "point"
std::string argumentName(MetaType const& meta);
} // namespace detail
} // namespace dynargs

#include "metatype.tpp"
