#pragma once

// Error type for the scan deserializer.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace scan {

// ============================================================================
// Error kinds
// ============================================================================

enum class error_kind {
    unexpected_eof,
    parse_failure,
    unknown_variant,
    unsupported_shape,
    trailing_data,
};

inline auto to_string(error_kind k) -> const char* {
    switch (k) {
        case error_kind::unexpected_eof:    return "unexpected end of input";
        case error_kind::parse_failure:     return "parse failure";
        case error_kind::unknown_variant:   return "unknown variant";
        case error_kind::unsupported_shape: return "unsupported shape";
        case error_kind::trailing_data:     return "trailing data";
    }
    return "unknown";
}

// ============================================================================
// scan_error - thrown by every failing decode, never carries partial values
// ============================================================================

class scan_error : public std::runtime_error {
public:
    static auto unexpected_eof(std::string expected, std::size_t position) -> scan_error {
        auto message = std::string(to_string(error_kind::unexpected_eof))
            + ": expected " + expected + " at offset " + std::to_string(position);
        auto e = scan_error(error_kind::unexpected_eof, message);
        e.expected_ = std::move(expected);
        e.position_ = position;
        return e;
    }

    static auto parse_failure(std::string expected, std::string token, std::size_t position) -> scan_error {
        auto message = std::string(to_string(error_kind::parse_failure))
            + ": expected " + expected + " at offset " + std::to_string(position)
            + ", found '" + token + "'";
        auto e = scan_error(error_kind::parse_failure, message);
        e.expected_ = std::move(expected);
        e.token_ = std::move(token);
        e.position_ = position;
        return e;
    }

    static auto unknown_variant(std::string token, std::size_t position,
                                std::vector<std::string> known) -> scan_error {
        auto message = std::string(to_string(error_kind::unknown_variant))
            + " '" + token + "' at offset " + std::to_string(position) + ", expected one of ";
        for (std::size_t i = 0; i < known.size(); ++i) {
            if (i > 0) message += ", ";
            message += "'" + known[i] + "'";
        }
        auto e = scan_error(error_kind::unknown_variant, message);
        e.token_ = std::move(token);
        e.position_ = position;
        e.known_variants_ = std::move(known);
        return e;
    }

    static auto unsupported_shape(std::string reason) -> scan_error {
        auto message = std::string(to_string(error_kind::unsupported_shape)) + ": " + reason;
        auto e = scan_error(error_kind::unsupported_shape, message);
        e.reason_ = std::move(reason);
        return e;
    }

    static auto trailing_data(std::size_t remaining, std::size_t position) -> scan_error {
        auto message = std::string(to_string(error_kind::trailing_data))
            + ": " + std::to_string(remaining) + " unconsumed token"
            + (remaining == 1 ? "" : "s") + " starting at offset " + std::to_string(position);
        auto e = scan_error(error_kind::trailing_data, message);
        e.remaining_ = remaining;
        e.position_ = position;
        return e;
    }

    auto kind() const -> error_kind { return kind_; }
    auto position() const -> std::size_t { return position_; }
    auto token() const -> const std::string& { return token_; }

    // Name of the primitive or construct being decoded (eof, parse_failure)
    auto expected() const -> const std::string& { return expected_; }

    auto known_variants() const -> const std::vector<std::string>& { return known_variants_; }
    auto reason() const -> const std::string& { return reason_; }
    auto remaining() const -> std::size_t { return remaining_; }

private:
    scan_error(error_kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    error_kind kind_;
    std::size_t position_ = 0;
    std::string token_;
    std::string expected_;
    std::vector<std::string> known_variants_;
    std::string reason_;
    std::size_t remaining_ = 0;
};

} // namespace scan
