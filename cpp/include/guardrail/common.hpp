#ifndef GUARDRAIL_COMMON_HPP
#define GUARDRAIL_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace guardrail {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

// Number of UTF-8 code points; continuation bytes are not counted.
inline std::size_t utf8_length(std::string_view value) {
    std::size_t count = 0;
    for (unsigned char ch : value) {
        if ((ch & 0xC0) != 0x80) {
            count += 1;
        }
    }
    return count;
}

// Byte offset of the first `count` code points.
inline std::size_t utf8_prefix_bytes(std::string_view value, std::size_t count) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        const auto ch = static_cast<unsigned char>(value[i]);
        if ((ch & 0xC0) != 0x80) {
            if (seen == count) {
                return i;
            }
            seen += 1;
        }
    }
    return value.size();
}

inline std::string utf8_truncate(const std::string& value, std::size_t count) {
    return value.substr(0, utf8_prefix_bytes(value, count));
}

inline std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string output;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            output.append(separator);
        }
        output.append(parts[i]);
    }
    return output;
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

}  // namespace guardrail

#endif  // GUARDRAIL_COMMON_HPP
