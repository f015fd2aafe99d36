/**
 * @file test_binding.cpp
 * @brief Unit tests for make_slot classification and FieldMap.
 */

#include <catch2/catch.hpp>
#include <nbt/binding.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

using namespace nbt;

namespace {

struct MemberFields {
    std::int32_t a = 0;
    std::string b;

    void nbt_fields(FieldMap& fields) {
        fields.bind("A", a).bind("B", b);
    }
};

struct FreeFields {
    std::int16_t x = 0;
};

void nbt_fields(FieldMap& fields, FreeFields& value) {
    fields.bind("X", value.x);
}

} // namespace

TEST_CASE("make_slot scalar kinds", "[binding]") {
    bool b = false;
    std::int8_t i8 = 0;
    std::uint8_t u8 = 0;
    std::int16_t i16 = 0;
    std::uint16_t u16 = 0;
    std::int32_t i32 = 0;
    std::uint32_t u32 = 0;
    std::int64_t i64 = 0;
    std::uint64_t u64 = 0;
    long long ll = 0;
    unsigned long long ull = 0;
    float f = 0.0F;
    double d = 0.0;

    REQUIRE(make_slot(b).kind() == Kind::Bool);
    REQUIRE(make_slot(i8).kind() == Kind::Int8);
    REQUIRE(make_slot(u8).kind() == Kind::UInt8);
    REQUIRE(make_slot(i16).kind() == Kind::Int16);
    REQUIRE(make_slot(u16).kind() == Kind::UInt16);
    REQUIRE(make_slot(i32).kind() == Kind::Int32);
    REQUIRE(make_slot(u32).kind() == Kind::UInt32);
    REQUIRE(make_slot(i64).kind() == Kind::Int64);
    REQUIRE(make_slot(u64).kind() == Kind::UInt64);
    REQUIRE(make_slot(ll).kind() == Kind::Int64);
    REQUIRE(make_slot(ull).kind() == Kind::UInt64);
    REQUIRE(make_slot(f).kind() == Kind::Float32);
    REQUIRE(make_slot(d).kind() == Kind::Float64);

    std::byte raw{};
    REQUIRE(make_slot(raw).kind() == Kind::UInt8);

    REQUIRE(make_slot(i32).target() == &i32);
}

TEST_CASE("make_slot platform-width integers", "[binding]") {
    char c = 0;
    wchar_t w = 0;

    Kind char_kind = make_slot(c).kind();
    Kind wide_kind = make_slot(w).kind();
    REQUIRE((char_kind == Kind::NativeInt || char_kind == Kind::NativeUInt));
    REQUIRE((wide_kind == Kind::NativeInt || wide_kind == Kind::NativeUInt));
}

TEST_CASE("make_slot long follows the data model", "[binding]") {
    constexpr bool long_is_exact =
        std::is_same_v<long, std::int64_t> || std::is_same_v<long, std::int32_t>;
    STATIC_REQUIRE(detail::is_platform_int_v<long> == !long_is_exact);
    STATIC_REQUIRE(detail::is_platform_int_v<unsigned long> == !long_is_exact);

    long value = 0;
    unsigned long unsigned_value = 0;
    Kind kind = make_slot(value).kind();
    Kind unsigned_kind = make_slot(unsigned_value).kind();

    if constexpr (std::is_same_v<long, std::int64_t>) {
        // LP64
        REQUIRE(kind == Kind::Int64);
        REQUIRE(unsigned_kind == Kind::UInt64);
    } else if constexpr (std::is_same_v<long, std::int32_t>) {
        // ILP32
        REQUIRE(kind == Kind::Int32);
        REQUIRE(unsigned_kind == Kind::UInt32);
    } else {
        // LLP64: int32_t is int, long is a distinct 32-bit type
        REQUIRE(kind == Kind::NativeInt);
        REQUIRE(unsigned_kind == Kind::NativeUInt);
    }
}

TEST_CASE("make_slot containers", "[binding]") {
    SECTION("std::string") {
        std::string s;
        REQUIRE(make_slot(s).kind() == Kind::String);
    }

    SECTION("std::array of bytes") {
        std::array<std::uint8_t, 16> bytes{};
        Slot slot = make_slot(bytes);
        REQUIRE(slot.kind() == Kind::FixedBytes);
        REQUIRE(slot.capacity() == 16);
        REQUIRE(slot.target() == bytes.data());
    }

    SECTION("C array of bytes") {
        std::int8_t bytes[5] = {};
        Slot slot = make_slot(bytes);
        REQUIRE(slot.kind() == Kind::FixedBytes);
        REQUIRE(slot.capacity() == 5);
    }

    SECTION("std::array of std::byte") {
        std::array<std::byte, 3> bytes{};
        REQUIRE(make_slot(bytes).kind() == Kind::FixedBytes);
    }

    SECTION("vector of bytes accepts byte arrays") {
        std::vector<std::uint8_t> bytes;
        Slot slot = make_slot(bytes);
        REQUIRE(slot.kind() == Kind::Sequence);
        REQUIRE(slot.accepts_bytes());
    }

    SECTION("vector of std::byte accepts byte arrays") {
        std::vector<std::byte> bytes;
        Slot slot = make_slot(bytes);
        REQUIRE(slot.kind() == Kind::Sequence);
        REQUIRE(slot.accepts_bytes());
    }

    SECTION("vector of ints does not accept byte arrays") {
        std::vector<std::int32_t> values;
        Slot slot = make_slot(values);
        REQUIRE(slot.kind() == Kind::Sequence);
        REQUIRE_FALSE(slot.accepts_bytes());
    }

    SECTION("vector of char is a sequence of platform integers") {
        std::vector<char> values;
        Slot slot = make_slot(values);
        REQUIRE(slot.kind() == Kind::Sequence);
        REQUIRE_FALSE(slot.accepts_bytes());
    }

    SECTION("compound with member registration") {
        MemberFields value;
        REQUIRE(make_slot(value).kind() == Kind::Compound);
    }

    SECTION("compound with free registration") {
        FreeFields value;
        REQUIRE(make_slot(value).kind() == Kind::Compound);
    }
}

TEST_CASE("Sequence operations", "[binding]") {
    SECTION("reset discards contents and keeps capacity") {
        std::vector<std::int32_t> values = {9, 9, 9, 9, 9, 9, 9, 9};
        std::size_t capacity = values.capacity();
        Slot slot = make_slot(values);

        slot.sequence_ops().reset(slot.target(), 3);
        REQUIRE(values.empty());
        REQUIRE(values.capacity() == capacity);
    }

    SECTION("reset reserves a bounded amount") {
        std::vector<std::int64_t> values;
        Slot slot = make_slot(values);

        slot.sequence_ops().reset(slot.target(), 0xFFFFFFFFU);
        REQUIRE(values.capacity() >= LIST_RESERVE_LIMIT);
        REQUIRE(values.capacity() < 0xFFFFFFFFU);
    }

    SECTION("resize_bytes sets the exact size") {
        std::vector<std::uint8_t> bytes(100, 0xEE);
        Slot slot = make_slot(bytes);

        std::uint8_t* data = slot.sequence_ops().resize_bytes(slot.target(), 4);
        REQUIRE(bytes.size() == 4);
        REQUIRE(data == bytes.data());
    }
}

TEST_CASE("FieldMap", "[binding]") {
    SECTION("member registration") {
        MemberFields value;
        FieldMap fields;
        make_slot(value).describe(fields);

        REQUIRE(fields.size() == 2);
        REQUIRE(fields.duplicate().empty());

        const Slot* a = fields.find("A");
        REQUIRE(a != nullptr);
        REQUIRE(a->kind() == Kind::Int32);
        REQUIRE(a->target() == &value.a);

        const Slot* b = fields.find("B");
        REQUIRE(b != nullptr);
        REQUIRE(b->kind() == Kind::String);

        REQUIRE(fields.find("C") == nullptr);
        REQUIRE(fields.find("a") == nullptr);
    }

    SECTION("free registration") {
        FreeFields value;
        FieldMap fields;
        make_slot(value).describe(fields);

        REQUIRE(fields.size() == 1);
        REQUIRE(fields.find("X")->target() == &value.x);
    }

    SECTION("duplicate name keeps the first binding") {
        std::int32_t first = 0;
        std::int32_t second = 0;
        FieldMap fields;
        fields.bind("Score", first).bind("Score", second);

        REQUIRE(fields.size() == 1);
        REQUIRE(fields.duplicate() == "Score");
        REQUIRE(fields.find("Score")->target() == &first);
    }

    SECTION("empty map") {
        FieldMap fields;
        REQUIRE(fields.empty());
        REQUIRE(fields.find("") == nullptr);
    }
}
