#pragma once

// The deserializer answers the capability calls issued by read() as it
// walks a target type, consuming tokens from a privately owned cursor.

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"
#include "options.hpp"
#include "scalar.hpp"
#include "token.hpp"

namespace scan {

// ============================================================================
// Variant table entry - one (name, payload arity) pair per enum variant
// ============================================================================

struct variant_info {
    const char* name;
    std::size_t arity = 0;
};

// ============================================================================
// deserializer
// ============================================================================

class deserializer {
public:
    explicit deserializer(std::string_view input, const options& opts = {})
        : opts(opts), tokens(tokenize(input)), cur(tokens, input.size()) {}

    deserializer(const deserializer&) = delete;
    auto operator=(const deserializer&) -> deserializer& = delete;

    // --- Scalars (one token each) ---

    void visit_bool(bool& value) {
        value = parse_bool(cur.advance(type_name<bool>()));
    }

    template <Integer T>
    void visit_integer(T& value) {
        value = parse_integer<T>(cur.advance(type_name<T>()));
    }

    template <Float T>
    void visit_float(T& value) {
        value = parse_float<T>(cur.advance(type_name<T>()));
    }

    void visit_char(char& value) {
        value = parse_char(cur.advance(type_name<char>()));
    }

    void visit_char(char32_t& value) {
        value = parse_char32(cur.advance(type_name<char32_t>()));
    }

    void visit_str(std::string& value) {
        value = parse_string(cur.advance("string"));
    }

    // Borrows from the input passed to the constructor
    void visit_str(std::string_view& value) {
        value = cur.advance("string").text;
    }

    // --- Fixed-arity composites ---

    // Calls element(i) for i in [0, length); each call consumes that
    // element's tokens. Trailing tokens are left for the enclosing shape.
    template <typename F>
    void visit_seq(std::size_t length, F&& element) {
        for (std::size_t i = 0; i < length; ++i) {
            element(i);
        }
    }

    template <typename F>
    void visit_tuple(std::size_t arity, F&& element) {
        visit_seq(arity, std::forward<F>(element));
    }

    // Field names never appear in the input; fields are positional
    template <typename F>
    void visit_struct(std::span<const char* const> field_names, F&& field) {
        visit_seq(field_names.size(), std::forward<F>(field));
    }

    // --- Enums ---

    // Consumes the variant tag and returns the index of the first matching
    // entry. The caller then decodes table[index].arity payload elements.
    auto visit_enum(std::span<const variant_info> variants) -> std::size_t {
        auto tok = cur.advance("variant name");
        for (std::size_t i = 0; i < variants.size(); ++i) {
            if (names_match(variants[i].name, tok.text, opts.variant_matching)) {
                return i;
            }
        }
        auto known = std::vector<std::string>{};
        known.reserve(variants.size());
        for (const auto& v : variants) {
            known.emplace_back(v.name);
        }
        throw scan_error::unknown_variant(std::string(tok.text), tok.position, std::move(known));
    }

    // --- Optional values ---

    auto visit_option() const -> bool {
        return cur.peek().has_value();
    }

    // --- Unsupported ---

    [[noreturn]] void visit_unbounded(const char* reason) {
        throw scan_error::unsupported_shape(reason);
    }

    // --- Top level ---

    void end() const {
        if (!cur.is_exhausted()) {
            throw scan_error::trailing_data(cur.remaining(), cur.position());
        }
    }

    auto position() const -> std::size_t { return cur.position(); }
    auto remaining() const -> std::size_t { return cur.remaining(); }

private:
    options opts;
    std::vector<token> tokens;
    cursor cur;
};

} // namespace scan
