/**
 * @file document_builder.hpp
 * @brief Hand-assembled NBT byte streams for the tests.
 */

#ifndef NBT_TESTS_DOCUMENT_BUILDER_HPP
#define NBT_TESTS_DOCUMENT_BUILDER_HPP

#include <nbt/stream_reader.hpp>
#include <nbt/tag.hpp>

#include <zlib.h>

#include <cstdint>
#include <cstring>
#include <string_view>
#include <vector>

namespace nbt_test {

/**
 * @brief Appends big-endian NBT fragments to a byte buffer.
 */
class DocumentBuilder {
public:
    DocumentBuilder& u8(std::uint8_t value) {
        bytes_.push_back(value);
        return *this;
    }

    DocumentBuilder& u16(std::uint16_t value) {
        return be(value, 2);
    }

    DocumentBuilder& u32(std::uint32_t value) {
        return be(value, 4);
    }

    DocumentBuilder& u64(std::uint64_t value) {
        return be(value, 8);
    }

    DocumentBuilder& f32(float value) {
        std::uint32_t raw = 0;
        std::memcpy(&raw, &value, sizeof(raw));
        return u32(raw);
    }

    DocumentBuilder& f64(double value) {
        std::uint64_t raw = 0;
        std::memcpy(&raw, &value, sizeof(raw));
        return u64(raw);
    }

    DocumentBuilder& tag(nbt::Tag tag) {
        return u8(static_cast<std::uint8_t>(tag));
    }

    /// u16 length + bytes, used for names and string payloads
    DocumentBuilder& text(std::string_view value) {
        u16(static_cast<std::uint16_t>(value.size()));
        bytes_.insert(bytes_.end(), value.begin(), value.end());
        return *this;
    }

    DocumentBuilder& raw(const std::vector<std::uint8_t>& data) {
        bytes_.insert(bytes_.end(), data.begin(), data.end());
        return *this;
    }

    /// Tag byte and name of a named entry; the payload follows
    DocumentBuilder& entry(nbt::Tag tag_value, std::string_view name) {
        return tag(tag_value).text(name);
    }

    DocumentBuilder& compound(std::string_view name) {
        return entry(nbt::Tag::Compound, name);
    }

    DocumentBuilder& end() {
        return tag(nbt::Tag::End);
    }

    DocumentBuilder& byte_entry(std::string_view name, std::uint8_t value) {
        return entry(nbt::Tag::Byte, name).u8(value);
    }

    DocumentBuilder& short_entry(std::string_view name, std::uint16_t value) {
        return entry(nbt::Tag::Short, name).u16(value);
    }

    DocumentBuilder& int_entry(std::string_view name, std::uint32_t value) {
        return entry(nbt::Tag::Int, name).u32(value);
    }

    DocumentBuilder& long_entry(std::string_view name, std::uint64_t value) {
        return entry(nbt::Tag::Long, name).u64(value);
    }

    DocumentBuilder& float_entry(std::string_view name, float value) {
        return entry(nbt::Tag::Float, name).f32(value);
    }

    DocumentBuilder& double_entry(std::string_view name, double value) {
        return entry(nbt::Tag::Double, name).f64(value);
    }

    DocumentBuilder& string_entry(std::string_view name, std::string_view value) {
        return entry(nbt::Tag::String, name).text(value);
    }

    DocumentBuilder& byte_array_entry(std::string_view name, const std::vector<std::uint8_t>& data) {
        entry(nbt::Tag::ByteArray, name).u32(static_cast<std::uint32_t>(data.size()));
        return raw(data);
    }

    /// Named list header; the caller appends `count` unnamed payloads
    DocumentBuilder& list_entry(std::string_view name, nbt::Tag inner, std::uint32_t count) {
        return entry(nbt::Tag::List, name).tag(inner).u32(count);
    }

    const std::vector<std::uint8_t>& bytes() const {
        return bytes_;
    }

    std::size_t size() const {
        return bytes_.size();
    }

private:
    DocumentBuilder& be(std::uint64_t value, int width) {
        for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
        }
        return *this;
    }

    std::vector<std::uint8_t> bytes_;
};

/**
 * @brief Wrap bytes in a gzip member or zlib stream.
 *
 * @return Compressed bytes, empty if zlib reported an error
 */
inline std::vector<std::uint8_t> compress(const std::vector<std::uint8_t>& input,
                                          nbt::Compression mode) {
    z_stream stream{};
    int window_bits = mode == nbt::Compression::GZip ? 16 + MAX_WBITS : MAX_WBITS;
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    std::vector<std::uint8_t> output(deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    int rc = deflate(&stream, Z_FINISH);
    output.resize(stream.total_out);
    deflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        return {};
    }
    return output;
}

/**
 * @brief Deterministic bytes that deflate poorly.
 */
inline std::vector<std::uint8_t> noise(std::size_t size, std::uint32_t seed = 0x12345678U) {
    std::vector<std::uint8_t> data(size);
    std::uint32_t state = seed;
    for (auto& byte : data) {
        // xorshift32
        state ^= state << 13;
        state ^= state >> 17;
        state ^= state << 5;
        byte = static_cast<std::uint8_t>(state >> 24);
    }
    return data;
}

} // namespace nbt_test

#endif // NBT_TESTS_DOCUMENT_BUILDER_HPP
