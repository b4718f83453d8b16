#include "arg_parser.hpp"

ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& value_options,
                      const std::set<std::string>& flag_options) {
    ParsedArgs out;
    bool options_done = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];

        if (options_done || a.size() < 2 || a[0] != '-') {
            out.positional.push_back(a);
            continue;
        }
        if (a == "--") {
            options_done = true;
            continue;
        }

        std::string name = a;
        std::string inline_value;
        bool has_inline = false;
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            name = a.substr(0, eq);
            inline_value = a.substr(eq + 1);
            has_inline = true;
        }

        if (value_options.count(name)) {
            if (has_inline) {
                out.options[name] = inline_value;
            } else if (i + 1 < args.size()) {
                out.options[name] = args[++i];
            } else {
                if (out.error.empty()) out.error = name + " requires a value";
            }
        } else if (flag_options.count(name) && !has_inline) {
            out.flags.insert(name);
        } else if (out.error.empty()) {
            out.error = "Unknown option: " + a;
        }
    }
    return out;
}
