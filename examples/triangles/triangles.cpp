#include <cstdint>
#include <iostream>
#include <stdexcept>
#include "scan/scan.hpp"

// =============================================================================
// Triangle with ADL field descriptor
// =============================================================================

struct triangle_t {
    std::uint64_t a = 0;
    std::uint64_t b = 0;
    std::uint64_t c = 0;
};

inline auto fields(triangle_t& t) {
    return std::make_tuple(
        scan::field("a", t.a),
        scan::field("b", t.b),
        scan::field("c", t.c)
    );
}

inline auto is_valid(const triangle_t& t) -> bool {
    return t.a + t.b > t.c && t.a + t.c > t.b && t.b + t.c > t.a;
}

// =============================================================================
// Main
// =============================================================================

int main() {
    try {
        auto n = scan::next_line<std::size_t>();
        auto valid = std::size_t{0};

        for (auto i = std::size_t{0}; i < n; ++i) {
            auto t = scan::next_line<triangle_t>();
            if (is_valid(t)) {
                ++valid;
            }
        }

        std::cout << valid << " out of " << n << " triangles are valid.\n";
    } catch (const std::exception& e) {
        std::cerr << "Error reading triangles: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
