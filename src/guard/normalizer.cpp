#include "shellguard/guard/normalizer.hpp"

namespace shellguard::guard {

namespace {

auto hex_digit(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto is_octal_digit(char c) -> bool {
    return c >= '0' && c <= '7';
}

// \xNN, exactly two hex digits.
auto decode_hex_escapes(std::string_view in) -> std::string {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\\' && i + 3 < in.size() && in[i + 1] == 'x') {
            auto hi = hex_digit(in[i + 2]);
            auto lo = hex_digit(in[i + 3]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 3;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

// \N, \NN or \NNN with octal digits. Values above 0377 wrap to one byte,
// which is what the shell does when it expands them.
auto decode_octal_escapes(std::string_view in) -> std::string {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\\' && i + 1 < in.size() && is_octal_digit(in[i + 1])) {
            int value = 0;
            size_t digits = 0;
            while (digits < 3 && i + 1 + digits < in.size() &&
                   is_octal_digit(in[i + 1 + digits])) {
                value = value * 8 + (in[i + 1 + digits] - '0');
                ++digits;
            }
            out += static_cast<char>(value & 0xFF);
            i += digits;
            continue;
        }
        out += in[i];
    }
    return out;
}

// One left-to-right pass over `$'...'` spans. Returns false if none was found.
auto expand_spans_once(std::string_view in, std::string& out) -> bool {
    out.clear();
    out.reserve(in.size());

    bool expanded = false;
    size_t pos = 0;
    while (pos < in.size()) {
        auto marker = in.find("$'", pos);
        if (marker == std::string_view::npos) break;

        auto close = in.find('\'', marker + 2);
        if (close == std::string_view::npos) break;

        out.append(in.substr(pos, marker - pos));
        out += expand_ansi_c_escapes(in.substr(marker + 2, close - marker - 2));
        pos = close + 1;
        expanded = true;
    }
    out.append(in.substr(pos));
    return expanded;
}

} // namespace

auto expand_ansi_c_escapes(std::string_view body) -> std::string {
    return decode_octal_escapes(decode_hex_escapes(body));
}

auto normalize_command(std::string_view command) -> std::string {
    // Expand until no span is left so a decoded span cannot smuggle another
    // one past the matcher. Each pass removes at least the marker and both
    // quotes, so this terminates.
    std::string current(command);
    std::string next;
    while (expand_spans_once(current, next)) {
        current.swap(next);
    }
    return current;
}

} // namespace shellguard::guard
