#include "rowmap/lib.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <vector>

namespace rowmap {

std::string format_error(const char* file, int line, const char* fmt, va_list args) {
    // Two passes: the first call with a null buffer returns the number of
    // characters that would have been written.
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    std::stringstream ss;
    ss << file << ":" << line << ": ";
    if (required_size < 0) {
        ss << fmt;
        return ss.str();
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    ss << buffer.data();
    return ss.str();
}

std::string singular(const std::string& table) {
    std::string s = table;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

    const auto ends_with = [&](const char* suffix) {
        std::string sf(suffix);
        return s.size() > sf.size() && s.compare(s.size() - sf.size(), sf.size(), sf) == 0;
    };

    if (ends_with("ies")) return s.substr(0, s.size() - 3) + "y";
    if (ends_with("sses") || ends_with("xes") || ends_with("ches") || ends_with("shes"))
        return s.substr(0, s.size() - 2);
    if (ends_with("s") && !ends_with("ss")) return s.substr(0, s.size() - 1);
    return s;
}

} // namespace rowmap
