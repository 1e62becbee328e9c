#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace toolbelt {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::vector<std::string> split_shell_args(const std::string& input) {
    std::vector<std::string> args;
    std::string current;
    bool have_token = false; // distinguishes "" from no token at all
    bool escaped = false;
    char quote = 0;

    for (char ch : input) {
        if (escaped) {
            current += ch;
            have_token = true;
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (quote != 0) {
            if (ch == quote) {
                quote = 0;
            } else {
                current += ch;
            }
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
            have_token = true;
            continue;
        }
        if (ch == ' ' || ch == '\t' || ch == '\n') {
            if (have_token) {
                args.push_back(std::move(current));
                current.clear();
                have_token = false;
            }
            continue;
        }
        current += ch;
        have_token = true;
    }

    // A trailing lone backslash is kept literally
    if (escaped) {
        current += '\\';
        have_token = true;
    }
    if (have_token) {
        args.push_back(std::move(current));
    }
    return args;
}

std::string join_shell_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) out += ' ';
        bool plain = !arg.empty() &&
            arg.find_first_of(" \t\n'\"\\$`;&|<>()*?!#~") == std::string::npos;
        if (plain) {
            out += arg;
            continue;
        }
        out += '\'';
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace toolbelt
