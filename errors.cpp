#include "errors.hpp"

#include <format>
#include <ostream>

namespace dynargs
{

InputError InputError::within(Path const& group) &&
{
    if (! group.empty())
        groups.push_back(group);

    return std::move(*this);
}

std::string InputError::message() const
{
    auto text = std::visit(detail::multilambda {
        [] (MissingRequiredArgument const& e)
        {
            return std::format("the following arguments are required: {}", e.argument);
        },
        [] (ConversionError const& e)
        {
            std::string joined;

            for (auto const& token : e.tokens)
                joined += (joined.empty() ? "" : " ") + token;

            return std::format("argument {}: invalid value '{}': {}", e.argument, joined, e.cause);
        },
        [] (InstantiationError const& e)
        {
            if (e.path.empty())
                return std::format("invalid arguments: {}", e.cause);

            return std::format("invalid arguments for '{}': {}", e.path.toString(), e.cause);
        },
        [] (UsageError const& e)
        {
            return e.message;
        }
    }, reason);

    if (! groups.empty())
        text += std::format(" (while constructing '{}')", groups.front().toString());

    return text;
}

std::ostream& operator<<(std::ostream& o, InputError const& error)
{
    return o << error.message();
}
} // namespace dynargs
