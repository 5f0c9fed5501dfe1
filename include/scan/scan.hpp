#pragma once

// ============================================================================
// Scan - whitespace-separated text into statically typed values
// ============================================================================
//
// A concept-based deserializer with:
// - One token per scalar (bool, integers, floats, char, char32_t, string)
// - Fixed-arity composites: std::array, std::tuple, std::pair
// - Structs via ADL fields(), decoded positionally in declaration order
// - Enums and sum types via ADL variants(), tagged by a leading name token
// - No unbounded containers: the format cannot delimit them
//
// Basic usage:
//
//   #include "scan/scan.hpp"
//
//   struct triple {
//       unsigned a = 0, b = 0, c = 0;
//   };
//
//   auto fields(triple& t) {
//       return std::make_tuple(
//           scan::field("a", t.a),
//           scan::field("b", t.b),
//           scan::field("c", t.c)
//       );
//   }
//
//   struct quit {};
//   struct size { std::size_t w = 0, h = 0; };
//   auto fields(size& s) {
//       return std::make_tuple(scan::field("w", s.w), scan::field("h", s.h));
//   }
//
//   using command = std::variant<quit, size>;
//   auto variants(std::type_identity<command>) {
//       return std::make_tuple(
//           scan::alternative<quit>("Q"),
//           scan::alternative<size>("Size")
//       );
//   }
//
//   auto a = scan::from_str<std::array<unsigned, 3>>("1 2 3");
//   auto t = scan::from_str<triple>("1 2 3");
//   auto c = scan::from_str<command>("Size 1 2");
//
// Failures throw scan::scan_error; see error.hpp for the kinds.
//
// ============================================================================

#include <iostream>
#include <istream>
#include <string>
#include <string_view>

#include "deserializer.hpp"
#include "error.hpp"
#include "options.hpp"
#include "protocol.hpp"
#include "scalar.hpp"
#include "token.hpp"
#include "utf8.hpp"

namespace scan {

// ============================================================================
// Entry points
// ============================================================================

/**
 * Decode the whole of `input` as a T.
 *
 * The input must hold exactly the tokens T's shape consumes: running out
 * throws unexpected_eof and leftovers throw trailing_data. Types that
 * contain an unbounded container throw unsupported_shape before any
 * token is read.
 */
template <typename T>
auto from_str(std::string_view input, const options& opts = {}) -> T {
    if (!is_bounded<T>()) {
        throw scan_error::unsupported_shape("unbounded container");
    }
    auto de = deserializer(input, opts);
    auto value = T{};
    read(de, value);
    de.end();
    return value;
}

/**
 * Read one line from `is` and decode it with from_str. The line does not
 * outlive the call, so T may not hold a std::string_view.
 */
template <typename T>
auto next_line(std::istream& is = std::cin, const options& opts = {}) -> T {
    static_assert(!contains_borrowed<T>(), "next_line cannot return values that borrow from the line");
    auto line = std::string{};
    if (!std::getline(is, line)) {
        throw scan_error::unexpected_eof("line", 0);
    }
    return from_str<T>(line, opts);
}

} // namespace scan
