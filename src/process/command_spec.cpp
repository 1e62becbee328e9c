#include "command_spec.hpp"
#include "../util.hpp"

#include <unordered_map>

extern char** environ;

namespace toolbelt {

std::string CommandSpec::display() const {
    std::vector<std::string> parts;
    parts.reserve(args.size() + 1);
    parts.push_back(executable);
    parts.insert(parts.end(), args.begin(), args.end());
    return join_shell_args(parts);
}

std::string find_invalid_env_entry(const std::vector<std::string>& env) {
    for (const auto& entry : env) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            return entry.empty() ? std::string("(empty)") : entry;
        }
    }
    return {};
}

std::vector<std::string> build_environment(const std::vector<std::string>& overlay) {
    std::vector<std::string> result;
    std::unordered_map<std::string, size_t> index; // key -> position in result

    auto add = [&](const std::string& entry) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) return;
        std::string key = entry.substr(0, eq);
        auto it = index.find(key);
        if (it != index.end()) {
            result[it->second] = entry;
        } else {
            index.emplace(std::move(key), result.size());
            result.push_back(entry);
        }
    };

    if (environ) {
        for (char** e = environ; *e != nullptr; ++e) {
            add(*e);
        }
    }
    for (const auto& entry : overlay) {
        add(entry);
    }
    return result;
}

} // namespace toolbelt
