#pragma once

// Shape descriptors and the read() functions that walk a target type,
// issuing capability calls on a deserializer in declaration order.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "deserializer.hpp"
#include "options.hpp"
#include "scalar.hpp"

namespace scan {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

// ============================================================================
// Variant helpers
// ============================================================================

// A variant with no payload; decoding it assigns `value`
template <typename U>
struct unit_variant {
    const char* name;
    U value;
};

// A variant whose payload is decoded into a default-constructed A
template <typename A>
struct alternative_variant {
    const char* name;
};

template <typename U>
constexpr auto unit(const char* name, U value) {
    return unit_variant<U>{name, value};
}

template <typename A>
constexpr auto alternative(const char* name) {
    return alternative_variant<A>{name};
}

// ============================================================================
// Shape concepts
// ============================================================================

// ADL free function fields(t) returning a tuple of field(...) pairs
template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

// ADL free function variants(std::type_identity<T>) returning a tuple of
// unit(...) / alternative<A>(...) entries. A std::variant whose alternatives
// all live in namespace std has no associated namespace to find it in; wrap
// it in a named type instead.
template <typename T>
concept HasVariants = requires {
    { variants(std::type_identity<T>{}) };
};

template <typename T>
struct is_std_array : std::false_type {};

template <typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T>
struct is_tuple_like : std::false_type {};

template <typename... Ts>
struct is_tuple_like<std::tuple<Ts...>> : std::true_type {};

template <typename T1, typename T2>
struct is_tuple_like<std::pair<T1, T2>> : std::true_type {};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

// Anything iterable whose length the text cannot bound
template <typename T>
concept UnboundedContainer = requires(T& t) {
    t.begin();
    t.end();
    t.size();
} && !is_std_array<T>::value
  && !std::is_same_v<T, std::string>
  && !std::is_same_v<T, std::string_view>;

// ============================================================================
// Static shape queries
// ============================================================================

template <typename T>
constexpr auto is_bounded() -> bool;

namespace detail {

template <typename E>
struct entry_payload {
    using type = void;
};

template <typename A>
struct entry_payload<alternative_variant<A>> {
    using type = A;
};

template <typename E>
constexpr auto entry_bounded() -> bool {
    using payload = typename entry_payload<E>::type;
    if constexpr (std::is_void_v<payload>) {
        return true;
    } else {
        return is_bounded<payload>();
    }
}

template <typename D, std::size_t... I>
constexpr auto entries_bounded(std::index_sequence<I...>) -> bool {
    return (entry_bounded<std::tuple_element_t<I, D>>() && ...);
}

template <typename D, std::size_t... I>
constexpr auto fields_bounded(std::index_sequence<I...>) -> bool {
    return (is_bounded<std::remove_cvref_t<typename std::tuple_element_t<I, D>::second_type>>() && ...);
}

template <typename T, std::size_t... I>
constexpr auto elements_bounded(std::index_sequence<I...>) -> bool {
    return (is_bounded<std::tuple_element_t<I, T>>() && ...);
}

} // namespace detail

// False when T contains an unbounded container at any depth
template <typename T>
constexpr auto is_bounded() -> bool {
    if constexpr (UnboundedContainer<T>) {
        return false;
    } else if constexpr (is_std_array<T>::value || is_optional<T>::value) {
        return is_bounded<typename T::value_type>();
    } else if constexpr (is_tuple_like<T>::value) {
        return detail::elements_bounded<T>(std::make_index_sequence<std::tuple_size_v<T>>{});
    } else if constexpr (HasFields<T>) {
        using D = std::remove_cvref_t<decltype(fields(std::declval<T&>()))>;
        return detail::fields_bounded<D>(std::make_index_sequence<std::tuple_size_v<D>>{});
    } else if constexpr (HasVariants<T>) {
        using D = std::remove_cvref_t<decltype(variants(std::type_identity<T>{}))>;
        return detail::entries_bounded<D>(std::make_index_sequence<std::tuple_size_v<D>>{});
    } else {
        return true;
    }
}

template <typename T>
constexpr auto contains_borrowed() -> bool;

namespace detail {

template <typename E>
constexpr auto entry_borrowed() -> bool {
    using payload = typename entry_payload<E>::type;
    if constexpr (std::is_void_v<payload>) {
        return false;
    } else {
        return contains_borrowed<payload>();
    }
}

template <typename D, std::size_t... I>
constexpr auto entries_borrowed(std::index_sequence<I...>) -> bool {
    return (entry_borrowed<std::tuple_element_t<I, D>>() || ...);
}

template <typename D, std::size_t... I>
constexpr auto fields_borrowed(std::index_sequence<I...>) -> bool {
    return (contains_borrowed<std::remove_cvref_t<typename std::tuple_element_t<I, D>::second_type>>() || ...);
}

template <typename T, std::size_t... I>
constexpr auto elements_borrowed(std::index_sequence<I...>) -> bool {
    return (contains_borrowed<std::tuple_element_t<I, T>>() || ...);
}

} // namespace detail

// True when T holds a std::string_view at any depth, so a decoded value
// points into the input it was decoded from
template <typename T>
constexpr auto contains_borrowed() -> bool {
    if constexpr (std::is_same_v<T, std::string_view>) {
        return true;
    } else if constexpr (UnboundedContainer<T>) {
        return false;
    } else if constexpr (is_std_array<T>::value || is_optional<T>::value) {
        return contains_borrowed<typename T::value_type>();
    } else if constexpr (is_tuple_like<T>::value) {
        return detail::elements_borrowed<T>(std::make_index_sequence<std::tuple_size_v<T>>{});
    } else if constexpr (HasFields<T>) {
        using D = std::remove_cvref_t<decltype(fields(std::declval<T&>()))>;
        return detail::fields_borrowed<D>(std::make_index_sequence<std::tuple_size_v<D>>{});
    } else if constexpr (HasVariants<T>) {
        using D = std::remove_cvref_t<decltype(variants(std::type_identity<T>{}))>;
        return detail::entries_borrowed<D>(std::make_index_sequence<std::tuple_size_v<D>>{});
    } else {
        return false;
    }
}

// Number of payload elements a variant alternative decodes
template <typename A>
constexpr auto payload_arity() -> std::size_t {
    if constexpr (HasFields<A>) {
        return std::tuple_size_v<std::remove_cvref_t<decltype(fields(std::declval<A&>()))>>;
    } else if constexpr (is_tuple_like<A>::value) {
        return std::tuple_size_v<A>;
    } else if constexpr (std::is_empty_v<A>) {
        return 0;
    } else {
        return 1;
    }
}

// ============================================================================
// Read declarations
// ============================================================================

inline void read(deserializer& de, bool& value);

template <Integer T>
void read(deserializer& de, T& value);

template <Float T>
void read(deserializer& de, T& value);

inline void read(deserializer& de, char& value);

inline void read(deserializer& de, char32_t& value);

inline void read(deserializer& de, std::string& value);

inline void read(deserializer& de, std::string_view& value);

template <typename T, std::size_t N>
void read(deserializer& de, std::array<T, N>& value);

template <typename... Ts>
void read(deserializer& de, std::tuple<Ts...>& value);

template <typename T1, typename T2>
void read(deserializer& de, std::pair<T1, T2>& value);

template <typename T>
    requires HasFields<T>
void read(deserializer& de, T& value);

template <typename T>
    requires HasVariants<T>
void read(deserializer& de, T& value);

template <typename T>
void read(deserializer& de, std::optional<T>& value);

template <typename T>
    requires UnboundedContainer<T>
void read(deserializer& de, T& value);

// ============================================================================
// Helpers
// ============================================================================

namespace detail {

// Calls f on the index-th of elems
template <typename F, typename... Ts>
void apply_nth(std::size_t index, F&& f, Ts&&... elems) {
    [[maybe_unused]] auto k = std::size_t{0};
    ((k++ == index ? f(elems) : void()), ...);
}

template <typename U>
constexpr auto entry_arity(const unit_variant<U>&) -> std::size_t {
    return 0;
}

template <typename A>
constexpr auto entry_arity(const alternative_variant<A>&) -> std::size_t {
    return payload_arity<A>();
}

template <typename D>
auto variant_table(const D& descriptor) {
    return std::apply([](const auto&... entries) {
        return std::array<variant_info, sizeof...(entries)>{
            variant_info{entries.name, entry_arity(entries)}...
        };
    }, descriptor);
}

template <typename A>
void read_payload(deserializer& de, A& payload, std::size_t arity) {
    if constexpr (HasFields<A>) {
        std::apply([&](auto&&... f) {
            de.visit_tuple(arity, [&](std::size_t i) {
                apply_nth(i, [&](auto& p) { read(de, p.second); }, f...);
            });
        }, fields(payload));
    } else if constexpr (is_tuple_like<A>::value) {
        std::apply([&](auto&... elems) {
            de.visit_tuple(arity, [&](std::size_t i) {
                apply_nth(i, [&](auto& e) { read(de, e); }, elems...);
            });
        }, payload);
    } else if constexpr (std::is_empty_v<A>) {
        de.visit_tuple(arity, [](std::size_t) {});
    } else {
        de.visit_tuple(arity, [&](std::size_t) { read(de, payload); });
    }
}

template <typename T, typename U>
void read_entry(deserializer&, T& value, const variant_info&, const unit_variant<U>& entry) {
    value = entry.value;
}

template <typename T, typename A>
void read_entry(deserializer& de, T& value, const variant_info& info, const alternative_variant<A>&) {
    auto payload = A{};
    read_payload(de, payload, info.arity);
    value = std::move(payload);
}

} // namespace detail

// ============================================================================
// Read implementations
// ============================================================================

inline void read(deserializer& de, bool& value) {
    de.visit_bool(value);
}

template <Integer T>
void read(deserializer& de, T& value) {
    de.visit_integer(value);
}

template <Float T>
void read(deserializer& de, T& value) {
    de.visit_float(value);
}

inline void read(deserializer& de, char& value) {
    de.visit_char(value);
}

inline void read(deserializer& de, char32_t& value) {
    de.visit_char(value);
}

inline void read(deserializer& de, std::string& value) {
    de.visit_str(value);
}

inline void read(deserializer& de, std::string_view& value) {
    de.visit_str(value);
}

// std::array<T, N> - N elements in order
template <typename T, std::size_t N>
void read(deserializer& de, std::array<T, N>& value) {
    de.visit_seq(N, [&](std::size_t i) { read(de, value[i]); });
}

// std::tuple<Ts...>
template <typename... Ts>
void read(deserializer& de, std::tuple<Ts...>& value) {
    std::apply([&](auto&... elems) {
        de.visit_tuple(sizeof...(Ts), [&](std::size_t i) {
            detail::apply_nth(i, [&](auto& e) { read(de, e); }, elems...);
        });
    }, value);
}

// std::pair<T1, T2> - a 2-tuple
template <typename T1, typename T2>
void read(deserializer& de, std::pair<T1, T2>& value) {
    de.visit_tuple(2, [&](std::size_t i) {
        if (i == 0) read(de, value.first);
        else read(de, value.second);
    });
}

// Compound types with fields()
template <typename T>
    requires HasFields<T>
void read(deserializer& de, T& value) {
    std::apply([&](auto&&... f) {
        auto names = std::array<const char*, sizeof...(f)>{f.first...};
        de.visit_struct(names, [&](std::size_t i) {
            detail::apply_nth(i, [&](auto& p) { read(de, p.second); }, f...);
        });
    }, fields(value));
}

// Enums and sum types with variants()
template <typename T>
    requires HasVariants<T>
void read(deserializer& de, T& value) {
    auto descriptor = variants(std::type_identity<T>{});
    auto table = detail::variant_table(descriptor);
    auto index = de.visit_enum(table);

    std::apply([&](const auto&... entries) {
        detail::apply_nth(index, [&](const auto& entry) {
            detail::read_entry(de, value, table[index], entry);
        }, entries...);
    }, descriptor);
}

// std::optional<T> - empty once the input is exhausted
template <typename T>
void read(deserializer& de, std::optional<T>& value) {
    if (!de.visit_option()) {
        value = std::nullopt;
        return;
    }
    auto temp = T{};
    read(de, temp);
    value = std::move(temp);
}

// Vectors, maps, sets, ...
template <typename T>
    requires UnboundedContainer<T>
void read(deserializer& de, T&) {
    de.visit_unbounded("unbounded container");
}

// ============================================================================
// Descriptors for scan's own enums
// ============================================================================

inline auto variants(std::type_identity<variant_match>) {
    return std::make_tuple(
        unit("exact", variant_match::exact),
        unit("ignore_case", variant_match::ignore_case)
    );
}

} // namespace scan
