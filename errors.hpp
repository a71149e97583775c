/**
 * @file errors.hpp
 * @brief Error taxonomy
 *
 * Two families of errors exist:
 *   - structural errors are thrown as exceptions while a command line is
 *     derived from a type. They mean the type cannot be expressed as a command
 *     line at all and are programming errors.
 *   - input errors are values, returned through std::expected while the user's
 *     arguments are parsed and turned back into a typed instance.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "field.hpp"

namespace dynargs
{

//=============================================================================
// Structural errors
//=============================================================================

class StructuralError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

/// A class template could not be instantiated from defaults or a default instance
class UnresolvedGenericError : public StructuralError
{
public:
    using StructuralError::StructuralError;
};

/// A std::variant mixes records with primitive-like alternatives
class UnsupportedUnionShapeError : public StructuralError
{
public:
    using StructuralError::StructuralError;
};

/// A type (transitively) contains itself
class CyclicTypeError : public StructuralError
{
public:
    using StructuralError::StructuralError;
};

/// Two arguments would share a key, a flag or a subcommand name
class AmbiguousFieldNameError : public StructuralError
{
public:
    using StructuralError::StructuralError;
};

/// No constructor rule accepts the type of a required field
class NoMatchingRuleError : public StructuralError
{
public:
    using StructuralError::StructuralError;
};

/// The schema tree and the flat value mapping disagree. Always a bug.
class InternalError : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

//=============================================================================
// Input errors
//=============================================================================

struct MissingRequiredArgument
{
    Path path;
    std::string argument;   ///< flag or metavar shown to the user
};

struct ConversionError
{
    Path path;
    std::string argument;
    std::vector<std::string> tokens;
    std::string cause;
};

struct InstantiationError
{
    Path path;
    std::string cause;
};

/// Reported by the front-end parser: unknown flags, wrong token counts, ...
struct UsageError
{
    std::string message;
};

/**
 * @brief A user-input error together with the groups it occurred in
 *
 * @code
 * if (auto* missing = error.as<MissingRequiredArgument>())
 *     std::cerr << missing->path << std::endl;
 * @endcode
 */
class InputError
{
public:
    using Detail = std::variant<MissingRequiredArgument, ConversionError, InstantiationError, UsageError>;

    InputError(Detail reason_) : reason(std::move(reason_)) {}

    /// Adds an enclosing group, innermost first
    InputError within(Path const& group) &&;

    template <typename T>
    T const* as() const { return std::get_if<T>(&reason); }

    Detail const& get() const { return reason; }

    /// Enclosing groups, innermost first
    std::vector<Path> const& context() const { return groups; }

    /// Single human readable line
    std::string message() const;

private:
    Detail reason;
    std::vector<Path> groups;
};

std::ostream& operator<<(std::ostream& o, InputError const& error);
} // namespace dynargs
