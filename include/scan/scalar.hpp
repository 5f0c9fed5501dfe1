#pragma once

// Scalar decoders: each parses the full text of exactly one token.

#include <charconv>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "error.hpp"
#include "token.hpp"
#include "utf8.hpp"

namespace scan {

// ============================================================================
// Concepts
// ============================================================================

// Integral types decoded as numbers; bool and the character types are not
template <typename T>
concept Integer = std::is_integral_v<T>
    && !std::is_same_v<T, bool>
    && !std::is_same_v<T, char>
    && !std::is_same_v<T, wchar_t>
    && !std::is_same_v<T, char8_t>
    && !std::is_same_v<T, char16_t>
    && !std::is_same_v<T, char32_t>;

template <typename T>
concept Float = std::is_floating_point_v<T>;

// ============================================================================
// Primitive names used in error messages
// ============================================================================

template <typename T>
constexpr auto type_name() -> const char* {
    if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<T, char> || std::is_same_v<T, char32_t>) {
        return "char";
    } else if constexpr (Integer<T> && std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "i8";
        else if constexpr (sizeof(T) == 2) return "i16";
        else if constexpr (sizeof(T) == 4) return "i32";
        else return "i64";
    } else if constexpr (Integer<T>) {
        if constexpr (sizeof(T) == 1) return "u8";
        else if constexpr (sizeof(T) == 2) return "u16";
        else if constexpr (sizeof(T) == 4) return "u32";
        else return "u64";
    } else if constexpr (std::is_same_v<T, float>) {
        return "f32";
    } else if constexpr (std::is_same_v<T, double>) {
        return "f64";
    } else if constexpr (Float<T>) {
        return "long double";
    } else {
        return "string";
    }
}

// ============================================================================
// Decoders
// ============================================================================

namespace detail {

// from_chars rejects a leading '+', which the textual grammar allows
inline auto strip_plus(std::string_view text) -> std::string_view {
    if (text.size() > 1 && text.front() == '+' && text[1] != '+' && text[1] != '-') {
        text.remove_prefix(1);
    }
    return text;
}

template <typename T>
[[noreturn]] void fail(const token& tok) {
    throw scan_error::parse_failure(type_name<T>(), std::string(tok.text), tok.position);
}

} // namespace detail

inline auto parse_bool(const token& tok) -> bool {
    if (tok.text == "true") return true;
    if (tok.text == "false") return false;
    detail::fail<bool>(tok);
}

template <Integer T>
auto parse_integer(const token& tok) -> T {
    auto text = detail::strip_plus(tok.text);
    auto value = T{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        detail::fail<T>(tok);
    }
    return value;
}

template <Float T>
auto parse_float(const token& tok) -> T {
    auto text = detail::strip_plus(tok.text);
    auto value = T{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        detail::fail<T>(tok);
    }
    return value;
}

// A single byte; use char32_t for any Unicode character
inline auto parse_char(const token& tok) -> char {
    if (tok.text.size() != 1) {
        detail::fail<char>(tok);
    }
    return tok.text.front();
}

// Exactly one Unicode scalar value, UTF-8 encoded
inline auto parse_char32(const token& tok) -> char32_t {
    auto cp = decode_utf8(tok.text, 0);
    if (cp.length == 0 || cp.length != tok.text.size()) {
        detail::fail<char32_t>(tok);
    }
    return cp.value;
}

inline auto parse_string(const token& tok) -> std::string {
    return std::string(tok.text);
}

} // namespace scan
