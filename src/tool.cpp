#include "tool.hpp"

namespace toolbelt {

std::string ToolConfig::setting(const std::string& key, const std::string& fallback) const {
    auto it = settings.find(key);
    if (it == settings.end() || it->second.empty()) return fallback;
    return it->second;
}

} // namespace toolbelt
