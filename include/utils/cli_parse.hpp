#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag + ".");
    }
    return argv[++i];
}

inline int parse_int(const std::string& s) {
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    return v;
}

inline uint64_t parse_u64(const std::string& s) {
    if (!s.empty() && s[0] == '-') {
        throw std::runtime_error("Invalid uint64: " + s);
    }
    size_t pos = 0;
    uint64_t v = 0;
    try {
        v = std::stoull(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid uint64: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("Invalid uint64: " + s);
    }
    return v;
}

inline double parse_double(const std::string& s) {
    size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid double: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("Invalid double: " + s);
    }
    return v;
}

// "off", "none" and "disabled" map to nullopt.
inline std::optional<int> parse_optional_int(const std::string& s) {
    if (s == "off" || s == "none" || s == "disabled") {
        return std::nullopt;
    }
    return parse_int(s);
}

// Splits "name=value" at the first '='. Both sides must be non-empty.
inline std::pair<std::string, std::string> split_name_value(const std::string& s) {
    const size_t eq = s.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == s.size()) {
        throw std::runtime_error("Expected name=value, got: " + s);
    }
    return {s.substr(0, eq), s.substr(eq + 1)};
}
