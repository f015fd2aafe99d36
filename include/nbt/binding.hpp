/**
 * @file binding.hpp
 * @brief Compile-time mapping from C++ destination types to slots.
 *
 * make_slot() classifies a destination by its C++ type:
 *
 * | C++ type                                  | Kind                    |
 * |-------------------------------------------|-------------------------|
 * | bool                                      | Bool                    |
 * | std::int8_t ... std::uint64_t, long long  | Int8 ... UInt64         |
 * | std::byte                                 | UInt8                   |
 * | float, double                             | Float32, Float64        |
 * | char, wchar_t, non-exact-width long       | NativeInt / NativeUInt  |
 * | std::array<B, N>, B[N] (B a byte type)    | FixedBytes              |
 * | std::vector<T>                            | Sequence                |
 * | std::string                               | String                  |
 * | type providing nbt_fields()               | Compound                |
 *
 * `long` and `unsigned long` are rejected only where they are not the
 * exact-width 64-bit typedefs. On LP64 platforms they are std::int64_t and
 * std::uint64_t, so std::size_t and std::ptrdiff_t cannot be told apart from
 * the exact-width types there and are accepted as UInt64 and Int64.
 *
 * Byte types are std::uint8_t, std::int8_t and std::byte. Compound types
 * register their fields either with a member function
 *
 * @code
 * struct Player {
 *     std::string name;
 *     std::int32_t score = 0;
 *
 *     void nbt_fields(nbt::FieldMap& fields) {
 *         fields.bind("Name", name).bind("Score", score);
 *     }
 * };
 * @endcode
 *
 * or with a free function `void nbt_fields(nbt::FieldMap&, T&)` found by
 * argument-dependent lookup. Any other type fails to compile.
 */

#ifndef NBT_BINDING_HPP
#define NBT_BINDING_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "slot.hpp"

namespace nbt {

template <typename T> Slot make_slot(T& value) noexcept;

namespace detail {

template <typename T> struct always_false : std::false_type {};

template <typename T>
inline constexpr bool is_exact_width_v =
    std::is_same_v<T, std::int8_t> || std::is_same_v<T, std::uint8_t> ||
    std::is_same_v<T, std::int16_t> || std::is_same_v<T, std::uint16_t> ||
    std::is_same_v<T, std::int32_t> || std::is_same_v<T, std::uint32_t> ||
    std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>;

/// char has platform-defined signedness, wchar_t and long platform-defined width
template <typename T>
inline constexpr bool is_platform_int_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    ((std::is_same_v<T, long> || std::is_same_v<T, unsigned long>) && !is_exact_width_v<T>);

template <typename T>
inline constexpr bool is_character_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char8_t> ||
    std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template <typename T>
inline constexpr bool is_fixed_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                           !is_character_v<T> && !is_platform_int_v<T>;

template <typename T>
inline constexpr bool is_byte_v = std::is_same_v<T, std::uint8_t> ||
                                  std::is_same_v<T, std::int8_t> || std::is_same_v<T, std::byte>;

template <typename T> struct is_byte_array : std::false_type {};
template <typename B, std::size_t N>
struct is_byte_array<std::array<B, N>> : std::bool_constant<is_byte_v<B>> {};

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T, typename = void> struct has_member_fields : std::false_type {};
template <typename T>
struct has_member_fields<
    T, std::void_t<decltype(std::declval<T&>().nbt_fields(std::declval<FieldMap&>()))>>
    : std::true_type {};

template <typename T, typename = void> struct has_free_fields : std::false_type {};
template <typename T>
struct has_free_fields<
    T, std::void_t<decltype(nbt_fields(std::declval<FieldMap&>(), std::declval<T&>()))>>
    : std::true_type {};

template <typename T> constexpr Kind integer_kind() noexcept {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) {
            return Kind::Int8;
        } else if constexpr (sizeof(T) == 2) {
            return Kind::Int16;
        } else if constexpr (sizeof(T) == 4) {
            return Kind::Int32;
        } else {
            static_assert(sizeof(T) == 8, "unsupported integer width");
            return Kind::Int64;
        }
    } else {
        if constexpr (sizeof(T) == 1) {
            return Kind::UInt8;
        } else if constexpr (sizeof(T) == 2) {
            return Kind::UInt16;
        } else if constexpr (sizeof(T) == 4) {
            return Kind::UInt32;
        } else {
            static_assert(sizeof(T) == 8, "unsupported integer width");
            return Kind::UInt64;
        }
    }
}

/**
 * @brief SequenceOps for std::vector<T>.
 */
template <typename T, typename A> struct VectorBinding {
    using Vector = std::vector<T, A>;

    static void reset(void* sequence, std::size_t count) {
        auto& values = *static_cast<Vector*>(sequence);
        values.clear();
        values.reserve(std::min(count, LIST_RESERVE_LIMIT));
    }

    static Error append(void* sequence, ElementSink& sink) {
        T element{};
        Error status = sink.decode_element(make_slot(element));
        if (status != Error::Ok) {
            return status;
        }
        static_cast<Vector*>(sequence)->push_back(std::move(element));
        return Error::Ok;
    }

    static std::uint8_t* resize_bytes(void* sequence, std::size_t size) {
        auto& values = *static_cast<Vector*>(sequence);
        values.resize(size);
        return reinterpret_cast<std::uint8_t*>(values.data());
    }

    static constexpr SequenceOps make_ops() noexcept {
        if constexpr (is_byte_v<T>) {
            return SequenceOps{&reset, &append, &resize_bytes};
        } else {
            return SequenceOps{&reset, &append, nullptr};
        }
    }
};

template <typename T, typename A>
inline constexpr SequenceOps vector_ops = VectorBinding<T, A>::make_ops();

template <typename T> void describe_fields(void* object, FieldMap& fields) {
    T& value = *static_cast<T*>(object);
    if constexpr (has_member_fields<T>::value) {
        value.nbt_fields(fields);
    } else {
        nbt_fields(fields, value);
    }
}

} // namespace detail

/**
 * @brief Derive the slot for a destination value.
 *
 * @param value Destination, must outlive the slot
 * @return Slot describing @p value
 */
template <typename T> Slot make_slot(T& value) noexcept {
    static_assert(!std::is_const_v<T>, "nbt destinations must be mutable");

    if constexpr (std::is_same_v<T, bool>) {
        return Slot(Kind::Bool, &value);
    } else if constexpr (detail::is_platform_int_v<T>) {
        return Slot(std::is_signed_v<T> ? Kind::NativeInt : Kind::NativeUInt, &value);
    } else if constexpr (detail::is_fixed_integer_v<T>) {
        return Slot(detail::integer_kind<T>(), &value);
    } else if constexpr (std::is_same_v<T, float>) {
        static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4,
                      "float must be IEEE 754 binary32");
        return Slot(Kind::Float32, &value);
    } else if constexpr (std::is_same_v<T, double>) {
        static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8,
                      "double must be IEEE 754 binary64");
        return Slot(Kind::Float64, &value);
    } else if constexpr (std::is_same_v<T, std::byte>) {
        return Slot(Kind::UInt8, &value);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return Slot(Kind::String, &value);
    } else if constexpr (detail::is_byte_array<T>::value) {
        return Slot::fixed_bytes(reinterpret_cast<std::uint8_t*>(value.data()), value.size());
    } else if constexpr (std::rank_v<T> == 1 && detail::is_byte_v<std::remove_extent_t<T>>) {
        return Slot::fixed_bytes(reinterpret_cast<std::uint8_t*>(value), std::extent_v<T>);
    } else if constexpr (detail::is_vector<T>::value) {
        return Slot::sequence(
            &value, &detail::vector_ops<typename T::value_type, typename T::allocator_type>);
    } else if constexpr (detail::has_member_fields<T>::value || detail::has_free_fields<T>::value) {
        return Slot::compound(&value, &detail::describe_fields<T>);
    } else {
        static_assert(detail::always_false<T>::value, "unsupported nbt destination type");
    }
}

template <typename T> FieldMap& FieldMap::bind(std::string_view name, T& value) {
    return bind_slot(name, make_slot(value));
}

} // namespace nbt

#endif // NBT_BINDING_HPP
