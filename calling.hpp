/**
 * @file calling.hpp
 * @brief Turns the flat token mapping back into a typed instance
 */

#pragma once

#include <expected>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "errors.hpp"
#include "schema.hpp"

namespace dynargs
{

/**
 * @brief Flat result of the front-end parser
 *
 * Maps argument keys (Path::toString()) to the raw tokens given on the command
 * line, or std::nullopt if the argument was not given. Subcommand groups map
 * to a single token naming the selected variant.
 */
using FlatValues = std::map<std::string, std::optional<std::vector<std::string>>>;

/**
 * @brief Bottom-up assembly of a schema tree
 *
 * Leaves convert their tokens (or fall back to their default), groups assemble
 * their record from the children's values and choices recurse into the
 * selected variant only. The first failing node fails the whole assembly.
 */
class Reconstructor
{
public:
    explicit Reconstructor(FlatValues const& values_) : values(values_) {}

    std::expected<ValuePtr, InputError> assemble(ParserNode const& node);

    /// Keys read so far
    std::set<std::string> const& consumed() const { return used; }

    /**
     * @brief Assembles root and verifies that every key of values was consumed
     *
     * Throws InternalError if keys are left over after a successful assembly.
     */
    static std::expected<ValuePtr, InputError> assembleAll(GroupNode const& root, FlatValues const& values);

private:
    std::expected<ValuePtr, InputError> assembleLeaf(LeafNode const& leaf);
    std::expected<ValuePtr, InputError> assembleGroup(GroupNode const& group);
    std::expected<ValuePtr, InputError> assembleChoice(ChoiceNode const& choice);

    FlatValues const& values;
    std::set<std::string> used;
};
} // namespace dynargs
