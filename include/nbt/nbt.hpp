/**
 * @file nbt.hpp
 * @brief NBT decoder main header.
 *
 * Include this header for the complete library. decode() reports failures
 * through DecodeResult; unmarshal() throws the matching exception instead.
 *
 * @code
 * struct Level {
 *     std::string name;
 *     std::int64_t seed = 0;
 *     std::vector<std::int32_t> spawn;
 *
 *     void nbt_fields(nbt::FieldMap& fields) {
 *         fields.bind("LevelName", name).bind("RandomSeed", seed).bind("Spawn", spawn);
 *     }
 * };
 *
 * std::ifstream file("level.dat", std::ios::binary);
 * Level level;
 * auto result = nbt::decode(nbt::Compression::GZip, &file, level);
 * if (!result) {
 *     std::fprintf(stderr, "%s\n", result.message.c_str());
 * }
 * @endcode
 *
 * @see https://minecraft.wiki/w/NBT_format Named Binary Tag format
 */

#ifndef NBT_HPP
#define NBT_HPP

#include <istream>
#include <string>

#include "binding.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "slot.hpp"
#include "stream_reader.hpp"
#include "tag.hpp"

namespace nbt {

/**
 * @brief Outcome of a decode call.
 */
struct DecodeResult {
    Error error = Error::Ok; ///< First error encountered
    std::string message;     ///< Diagnostic text, empty on success
    std::string root_name;   ///< Name of the root tag

    bool ok() const noexcept {
        return error == Error::Ok;
    }

    explicit operator bool() const noexcept {
        return ok();
    }
};

/**
 * @brief Decode one document from a stream.
 *
 * @param compression Transport wrapping the stream
 * @param in Input stream, not owned; nullptr is reported as Error::InvalidArg
 * @param destination Value to populate; partially written on failure
 * @param options Decoding limits
 * @return Result with error code, message and root tag name
 */
template <typename T>
DecodeResult decode(Compression compression, std::istream* in, T& destination,
                    const DecodeOptions& options = {}) {
    DecodeResult result;
    StreamReader reader;

    result.error = reader.open(compression, in);
    if (result.error != Error::Ok) {
        result.message = reader.message();
        return result;
    }

    Decoder decoder(reader, options);
    result.error = decoder.decode(destination);
    result.message = decoder.message();
    result.root_name = decoder.root_name();
    return result;
}

/**
 * @brief Decode one document from a byte buffer.
 *
 * @param compression Transport wrapping the buffer
 * @param data Buffer start
 * @param size Buffer size in bytes
 * @param destination Value to populate; partially written on failure
 * @param options Decoding limits
 */
template <typename T>
DecodeResult decode(Compression compression, const std::uint8_t* data, std::size_t size,
                    T& destination, const DecodeOptions& options = {}) {
    MemoryStream in(data, size);
    return decode(compression, &in, destination, options);
}

#if !NBT_NO_EXCEPTIONS

/**
 * @brief Decode one document from a stream, throwing on failure.
 *
 * @return Name of the root tag
 * @throws NbtException subclass matching the error code
 */
template <typename T>
std::string unmarshal(Compression compression, std::istream& in, T& destination,
                      const DecodeOptions& options = {}) {
    DecodeResult result = decode(compression, &in, destination, options);
    if (!result.ok()) {
        throw_error(result.error, result.message);
    }
    return result.root_name;
}

/**
 * @brief Decode one document from a byte buffer, throwing on failure.
 *
 * @return Name of the root tag
 * @throws NbtException subclass matching the error code
 */
template <typename T>
std::string unmarshal(Compression compression, const std::uint8_t* data, std::size_t size,
                      T& destination, const DecodeOptions& options = {}) {
    MemoryStream in(data, size);
    return unmarshal(compression, in, destination, options);
}

#endif // !NBT_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace nbt

#endif // NBT_HPP
