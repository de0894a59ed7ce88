#include "util/cli_parser.hpp"

#include <cstdlib>
#include <stdexcept>

namespace asmhom {

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-') {
            // Handle --key=value syntax for double-dash args
            if (arg.size() >= 3 && arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            // A following argument is the value unless it looks like an
            // option; negative numbers are values.
            bool next_is_value = i + 1 < argc &&
                (argv[i + 1][0] != '-' ||
                 (argv[i + 1][1] >= '0' && argv[i + 1][1] <= '9'));
            if (next_is_value) {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

std::vector<std::string> CliParser::get_list(const std::string& key) const {
    std::vector<std::string> result;
    for (const auto& v : get_strings(key)) {
        for (auto& item : split_list(v)) {
            result.push_back(std::move(item));
        }
    }
    return result;
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stoi(it->second.back());
    } catch (const std::logic_error&) {
        return default_val;
    }
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= s.size()) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) pos = s.size();
        if (pos > start) items.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return items;
}

} // namespace asmhom
