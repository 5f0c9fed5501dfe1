#pragma once

// Tokenizer and cursor: the input is split once, on Unicode whitespace,
// into whitespace-free slices, then consumed front to back with at most
// one token of lookahead.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "utf8.hpp"

namespace scan {

// ============================================================================
// token - non-empty slice of the input plus its byte offset
// ============================================================================

struct token {
    std::string_view text;
    std::size_t position = 0;
};

inline auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// Byte length of the whitespace code point at `offset`, or 0 if there is
// none. Bytes that are not valid UTF-8 are never whitespace.
inline auto space_length(std::string_view input, std::size_t offset) -> std::size_t {
    if (is_space(input[offset])) return 1;
    if (static_cast<unsigned char>(input[offset]) < 0x80) return 0;

    auto cp = decode_utf8(input, offset);
    return cp.length != 0 && is_unicode_space(cp.value) ? cp.length : 0;
}

inline auto tokenize(std::string_view input) -> std::vector<token> {
    auto tokens = std::vector<token>{};
    auto i = std::size_t{0};

    while (i < input.size()) {
        auto n = std::size_t{0};
        while (i < input.size() && (n = space_length(input, i)) != 0) i += n;
        auto start = i;
        while (i < input.size() && space_length(input, i) == 0) ++i;
        if (i > start) {
            tokens.push_back({input.substr(start, i - start), start});
        }
    }
    return tokens;
}

// ============================================================================
// cursor - single-owner position over a token sequence
// ============================================================================

class cursor {
public:
    cursor(const std::vector<token>& sequence, std::size_t input_length)
        : tokens(sequence), end_position(input_length) {}

    auto peek() const -> std::optional<token> {
        if (is_exhausted()) return std::nullopt;
        return tokens[index];
    }

    // Consume the current token; `expected` names what the caller is decoding
    auto advance(std::string_view expected) -> token {
        if (is_exhausted()) {
            throw scan_error::unexpected_eof(std::string(expected), end_position);
        }
        return tokens[index++];
    }

    auto is_exhausted() const -> bool { return index >= tokens.size(); }
    auto remaining() const -> std::size_t { return tokens.size() - index; }

    // Offset of the next token, or the input length once exhausted
    auto position() const -> std::size_t {
        return is_exhausted() ? end_position : tokens[index].position;
    }

private:
    const std::vector<token>& tokens;
    std::size_t end_position;
    std::size_t index = 0;
};

} // namespace scan
