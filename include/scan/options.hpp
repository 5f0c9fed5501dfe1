#pragma once

#include <cstddef>
#include <string_view>

namespace scan {

// ============================================================================
// Variant-name matching policy
// ============================================================================

enum class variant_match {
    exact,
    ignore_case,
};

inline auto to_string(variant_match m) -> const char* {
    switch (m) {
        case variant_match::exact:       return "exact";
        case variant_match::ignore_case: return "ignore_case";
    }
    return "unknown";
}

// ============================================================================
// options - per-call configuration of a deserializer
// ============================================================================

struct options {
    variant_match variant_matching = variant_match::exact;
};

inline auto to_lower(char c) -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline auto names_match(std::string_view name, std::string_view candidate, variant_match policy) -> bool {
    if (policy == variant_match::exact) {
        return name == candidate;
    }
    if (name.size() != candidate.size()) return false;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (to_lower(name[i]) != to_lower(candidate[i])) return false;
    }
    return true;
}

} // namespace scan
