#include <iostream>
#include "dynargs.hpp"

// Booleans and flags
//
// Booleans can either be expected to be passed in explicitly, or, if given a
// default value, are turned into flags. conf::FlagConversionOff turns the
// conversion off.
//
//   ./dynargs_example --help
//   ./dynargs_example --boolean True
//   ./dynargs_example --boolean False --flag-a
//   ./dynargs_example --boolean False --no-flag-b
using namespace dynargs;

struct Args
{
    static constexpr std::string_view kHelp = "Booleans and flags";

    Field<bool, "boolean", conf::Help<"Expects an explicit True or False">> boolean;
    Field<std::optional<bool>, "optional_boolean", conf::Help<"Same as above, but can be omitted">> optionalBoolean = std::nullopt;
    Field<bool, "flag_a", conf::Help<"Pass --flag-a to set this to True">> flagA = false;
    Field<bool, "flag_b", conf::Help<"Pass --no-flag-b to set this to False">> flagB = true;
};

namespace
{
std::ostream& operator<<(std::ostream& o, std::optional<bool> const& b)
{
    if (! b.has_value())
        return o << "None";

    return o << (*b ? "True" : "False");
}
} // namespace

int main(int argc, char** argv)
{
    auto const args = cli<Args>(argc, argv);

    std::cout << "Args(boolean=" << (args.boolean() ? "True" : "False")
              << ", optional_boolean=" << args.optionalBoolean()
              << ", flag_a=" << (args.flagA() ? "True" : "False")
              << ", flag_b=" << (args.flagB() ? "True" : "False") << ")" << std::endl;

    return 0;
}
