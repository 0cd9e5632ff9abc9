#include "shellguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace shellguard::utils {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto is_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Sequence length announced by a lead byte; 1 for ASCII and stray bytes.
auto expected_length(unsigned char lead) -> std::size_t {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 1;
}

// Length of the UTF-8 sequence starting at s[i], or 0 if it is malformed,
// truncated, overlong, a surrogate or beyond U+10FFFF.
auto utf8_sequence_length(std::string_view s, std::size_t i) -> std::size_t {
    auto byte = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
    auto lead = byte(i);
    if (lead < 0x80) return 1;

    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    if (byte(i + 1) < lo || byte(i + 1) > hi) return 0;
    for (std::size_t k = 2; k < len; ++k) {
        if (!is_continuation(s[i + k])) return 0;
    }
    return len;
}

} // namespace

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f\v");
    return std::string(s.substr(start, end - start + 1));
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto percent_decode(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            auto hi = hex_value(s[i + 1]);
            auto lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += s[i];
    }
    return result;
}

auto sanitize_utf8(std::string_view s) -> std::string {
    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    std::string result;
    result.reserve(s.size());
    for (std::size_t i = 0; i < s.size();) {
        if (auto len = utf8_sequence_length(s, i); len > 0) {
            result.append(s.substr(i, len));
            i += len;
            continue;
        }

        // One replacement covers a lead byte and the continuation bytes it
        // claimed before the sequence broke off.
        auto expected = expected_length(static_cast<unsigned char>(s[i]));
        result += kReplacement;
        ++i;
        for (std::size_t k = 1; k < expected && i < s.size() && is_continuation(s[i]); ++k) {
            ++i;
        }
    }
    return result;
}

auto utf8_floor(std::string_view s, std::size_t pos) -> std::size_t {
    pos = std::min(pos, s.size());

    auto start = pos;
    while (start > 0 && pos - start < 3 && is_continuation(s[start - 1])) {
        --start;
    }
    if (start == 0) return pos;

    auto lead = start - 1;
    if (pos - lead < expected_length(static_cast<unsigned char>(s[lead]))) {
        return lead;
    }
    return pos;
}

auto camel_to_snake(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 4);
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isupper(uc)) {
            if (!result.empty()) result += '_';
            result += static_cast<char>(std::tolower(uc));
        } else {
            result += c;
        }
    }
    return result;
}

auto parse_bool(std::string_view s) -> std::optional<bool> {
    auto v = to_lower(trim(s));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

auto parse_int(std::string_view s) -> std::optional<long long> {
    auto v = trim(s);
    if (v.empty()) return std::nullopt;

    long long value = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
    if (ec != std::errc{} || ptr != v.data() + v.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace shellguard::utils
