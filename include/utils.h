#pragma once

#include <string>
#include <sstream>
#include <iostream>
#include <vector>
#include <cctype>
#include <stdexcept>

namespace naval {

/*
  Trace output: one "[TAG] message" line on stderr, only when verbose
  logging has been switched on (config "Verbose = 1").
*/
inline bool& verboseFlag() {
    static bool enabled = false;
    return enabled;
}

inline void setVerbose(bool enabled) { verboseFlag() = enabled; }
inline bool isVerbose() { return verboseFlag(); }

inline void logDebug(const std::string& tag, const std::string& message) {
    if (!isVerbose()) return;
    std::cerr << "[" << tag << "] " << message << "\n";
}

inline std::string trim(const std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

/*
  Utility: split lines like "Key = Value" into trimmed key and value.
*/
inline bool parseKeyValue(const std::string& line,
                          std::string& key,
                          std::string& value)
{
    auto pos = line.find('=');
    if (pos == std::string::npos) return false;
    key   = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));
    return !key.empty();
}

/*
  Strict integer parse: the whole (trimmed) text must be a base-10 int.
*/
inline bool parseInt(const std::string& text, int& out) {
    const std::string t = trim(text);
    if (t.empty()) return false;
    try {
        std::size_t used = 0;
        int v = std::stoi(t, &used);
        if (used != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/*
  "a, b ,c" -> {"a", "b", "c"}
*/
inline std::vector<std::string> splitList(const std::string& text, char sep = ',') {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, sep)) {
        parts.push_back(trim(item));
    }
    return parts;
}

inline std::string toUpper(std::string s) {
    for (char& ch : s) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return s;
}

} // namespace naval
