// =============================================================================
// genoqc - String Helpers Implementation
// =============================================================================

#include "gqc/common/strings.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace gqc {

std::string_view trim(std::string_view str) noexcept {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpper(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::vector<std::string_view> split(std::string_view str, char delimiter) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto pos = str.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(str.substr(start));
            break;
        }
        fields.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::vector<std::string> splitCsv(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

bool isHex(std::string_view str) noexcept {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

bool isSafePathComponent(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

std::string percentEncode(std::string_view text) {
    static constexpr char kHexDigits[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size());
    for (const unsigned char c : text) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += kHexDigits[c >> 4];
            encoded += kHexDigits[c & 0x0f];
        }
    }
    return encoded;
}

std::optional<double> parseNumber(std::string_view text) {
    text = trim(text);
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c != ',') {
            cleaned.push_back(c);
        }
    }
    if (cleaned.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* end = cleaned.data() + cleaned.size();
    auto [ptr, ec] = std::from_chars(cleaned.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

}  // namespace gqc
