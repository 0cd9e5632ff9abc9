#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace shellguard::utils {

auto trim(std::string_view s) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// Decodes well-formed `%XX` sequences. Malformed sequences are kept
/// literally and `+` is not treated as a space.
auto percent_decode(std::string_view s) -> std::string;

/// Replaces every malformed UTF-8 sequence with U+FFFD. A lead byte and the
/// continuation bytes that follow it become a single replacement.
auto sanitize_utf8(std::string_view s) -> std::string;

/// Largest position <= `pos` that does not split a UTF-8 sequence of `s`.
auto utf8_floor(std::string_view s, std::size_t pos) -> std::size_t;

/// "restrictToWorkspace" -> "restrict_to_workspace".
auto camel_to_snake(std::string_view s) -> std::string;

/// Parses 1/true/yes/on and 0/false/no/off (case-insensitive).
auto parse_bool(std::string_view s) -> std::optional<bool>;

/// Parses a base-10 integer occupying the whole (trimmed) input.
auto parse_int(std::string_view s) -> std::optional<long long>;

} // namespace shellguard::utils
