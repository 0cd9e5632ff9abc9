#pragma once

#include <string>
#include <string_view>

namespace shellguard::guard {

/// Expands ANSI-C quoted spans (`$'...'`) so that deny patterns can see
/// tokens hidden behind `\xNN` hex and `\NNN` octal escapes.
///
/// Only the contents of `$'...'` spans are rewritten; the marker and quotes
/// are dropped and every other byte passes through unchanged. Malformed
/// escapes stay literal. The result is for matching only and is never
/// executed.
[[nodiscard]] auto normalize_command(std::string_view command) -> std::string;

/// Decodes hex then octal escapes inside the body of one ANSI-C span.
[[nodiscard]] auto expand_ansi_c_escapes(std::string_view body) -> std::string;

} // namespace shellguard::guard
