// =============================================================================
// genoqc - String Helpers
// =============================================================================
// Small text utilities shared by the TSV/CSV readers and report parsers.
// =============================================================================

#ifndef GQC_COMMON_STRINGS_H
#define GQC_COMMON_STRINGS_H

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gqc {

/// @brief Strip leading and trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view str) noexcept;

[[nodiscard]] std::string toLower(std::string_view str);

[[nodiscard]] std::string toUpper(std::string_view str);

/// @brief Split on a single delimiter; empty fields are kept.
[[nodiscard]] std::vector<std::string_view> split(std::string_view str, char delimiter);

/// @brief Split a CSV line, honouring double-quoted fields ("" escapes a quote).
[[nodiscard]] std::vector<std::string> splitCsv(std::string_view line);

/// @brief Check for a non-empty run of hex digits.
[[nodiscard]] bool isHex(std::string_view str) noexcept;

/// @brief Check that @p name can be used as one path component.
/// @note Rejects empty names, ".", "..", and names containing '/', '\\' or NUL.
[[nodiscard]] bool isSafePathComponent(std::string_view name) noexcept;

/// @brief Percent-encode everything except RFC 3986 unreserved characters.
[[nodiscard]] std::string percentEncode(std::string_view text);

/// @brief Parse a whole string as an unsigned integer.
template <typename T>
[[nodiscard]] std::optional<T> parseUnsigned(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

/// @brief Parse a whole string as a double; thousands separators are ignored.
[[nodiscard]] std::optional<double> parseNumber(std::string_view text);

}  // namespace gqc

#endif  // GQC_COMMON_STRINGS_H
