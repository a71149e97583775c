/**
 * @file frontend.hpp
 * @brief Minimal argv tokenizer producing the flat value mapping
 *
 * Understands long flags (--x v, --x=v), --x/--no-x pairs for boolean flags,
 * positionals in declaration order, subcommands given as bare tokens, -- to end
 * flag parsing and -h/--help. Every argument that is active once parsing ends
 * receives an entry in the result: its tokens, or std::nullopt if it was not
 * given. Arguments of unselected subcommands receive no entry.
 */

#pragma once

#include <expected>
#include <span>
#include <string>
#include <vector>
#include "calling.hpp"

namespace dynargs
{

struct ParseResult
{
    FlatValues values;
    bool helpRequested = false;
};

class FrontEndParser
{
public:
    FrontEndParser(GroupNode const& root_, std::string prog_, std::string description_ = {})
        : root(root_), prog(std::move(prog_)), description(std::move(description_)) {}

    std::expected<ParseResult, InputError> parse(std::span<std::string const> args) const;

    /// One line summary of the top-level arguments
    std::string usage() const;

    /// Usage, description and one line per top-level argument and subcommand
    std::string help() const;

private:
    GroupNode const& root;
    std::string prog;
    std::string description;
};
} // namespace dynargs
