#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

struct ParsedArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;   // "--name" -> value
    std::set<std::string> flags;                  // "--name" present
    std::string error;                            // first problem found, "" if none
};

// Split command arguments into positionals, options taking a value
// ("--opt VALUE" or "--opt=VALUE") and boolean flags. "--" ends option parsing.
ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& value_options,
                      const std::set<std::string>& flag_options);
