/**
 * @file stream_reader.hpp
 * @brief Sequential big-endian reads over a raw, gzip or zlib stream.
 *
 * The stream reader presents the (possibly compressed) input as a flat
 * byte source. Reads are exact: a short read is an error, never a partial
 * result. The stream is consumed strictly forward and never rewound.
 */

#ifndef NBT_STREAM_READER_HPP
#define NBT_STREAM_READER_HPP

#include <istream>
#include <memory>
#include <streambuf>
#include <string>
#include <type_traits>

#include "config.hpp"
#include "error.hpp"

namespace nbt {

/**
 * @brief Transport wrapping the tag stream.
 */
enum class Compression : std::uint8_t {
    None = 0, ///< Raw tag stream
    GZip = 1, ///< RFC 1952 gzip member
    ZLib = 2  ///< RFC 1950 zlib stream
};

/**
 * @brief Get the name of a compression mode.
 */
inline const char* compression_name(Compression compression) noexcept {
    switch (compression) {
    case Compression::None:
        return "none";
    case Compression::GZip:
        return "gzip";
    case Compression::ZLib:
        return "zlib";
    default:
        return "unknown";
    }
}

namespace detail {

/**
 * @brief Assemble an unsigned value from big-endian bytes.
 */
template <typename T> inline T load_be(const std::uint8_t* bytes) noexcept {
    static_assert(std::is_unsigned_v<T>, "load_be requires an unsigned type");
    T value = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | bytes[i]);
    }
    return value;
}

} // namespace detail

/**
 * @brief Read-only std::istream over a caller-owned byte buffer.
 *
 * The buffer is not copied and must outlive the stream.
 */
class MemoryStream : public std::istream {
public:
    MemoryStream(const std::uint8_t* data, std::size_t size) : std::istream(nullptr), buffer_(data, size) {
        rdbuf(&buffer_);
    }

private:
    class Buffer : public std::streambuf {
    public:
        Buffer(const std::uint8_t* data, std::size_t size) {
            // std::streambuf only exposes a mutable get area; it is never written through
            char* begin = reinterpret_cast<char*>(const_cast<std::uint8_t*>(data));
            setg(begin, begin, begin + size);
        }
    };

    Buffer buffer_;
};

/**
 * @brief Exact big-endian reader over an input stream.
 *
 * open() selects the transport and, for gzip and zlib, validates the
 * transport header immediately, so a malformed wrapper is reported before
 * any tag is read.
 */
class StreamReader {
public:
    StreamReader();
    ~StreamReader();

    StreamReader(const StreamReader&) = delete;
    StreamReader& operator=(const StreamReader&) = delete;

    /**
     * @brief Attach an input stream.
     *
     * @param compression Transport wrapping the stream
     * @param in Input stream, not owned; must outlive the reader's use
     * @return Error::Ok, Error::InvalidArg for a null stream or unknown
     *         compression, Error::InvalidData for a malformed header
     */
    Error open(Compression compression, std::istream* in);

    [[nodiscard]] bool is_open() const noexcept {
        return in_ != nullptr;
    }

    Compression compression() const noexcept {
        return compression_;
    }

    /**
     * @brief Read exactly @p size decoded bytes.
     *
     * @param data Destination buffer
     * @param size Number of bytes
     * @return Error::Ok, Error::Underflow on a short read, Error::IoFailure
     *         if the stream failed, Error::InvalidData for a corrupt body
     */
    Error read(std::uint8_t* data, std::size_t size);

    /**
     * @brief Read an unsigned big-endian value of sizeof(T) bytes.
     */
    template <typename T> Error read_fixed(T& value) {
        static_assert(std::is_unsigned_v<T> && !std::is_same_v<T, bool>,
                      "read_fixed requires an unsigned integer type");
        std::uint8_t bytes[sizeof(T)];
        Error status = read(bytes, sizeof(T));
        if (status != Error::Ok) {
            return status;
        }
        value = detail::load_be<T>(bytes);
        return Error::Ok;
    }

    /**
     * @brief Read a big-endian length of type Length followed by that many bytes.
     */
    template <typename Length> Error read_length_prefixed(std::string& value) {
        Length length = 0;
        Error status = read_fixed(length);
        if (status != Error::Ok) {
            return status;
        }
        value.resize(static_cast<std::size_t>(length));
        if (length == 0) {
            return Error::Ok;
        }
        return read(reinterpret_cast<std::uint8_t*>(value.data()), value.size());
    }

    /**
     * @brief Decoded bytes consumed so far.
     */
    [[nodiscard]] std::uint64_t position() const noexcept {
        return position_;
    }

    /**
     * @brief Description of the last error.
     */
    const std::string& message() const noexcept {
        return message_;
    }

private:
    struct Inflater;

    Error read_raw(std::uint8_t* data, std::size_t size);
    Error read_inflated(std::uint8_t* data, std::size_t size);
    Error refill();
    Error start_inflater(int window_bits);
    Error fail(Error error, std::string message);

    std::istream* in_ = nullptr;
    Compression compression_ = Compression::None;
    std::unique_ptr<Inflater> inflater_;
    std::uint64_t position_ = 0;
    std::string message_;
};

} // namespace nbt

#endif // NBT_STREAM_READER_HPP
