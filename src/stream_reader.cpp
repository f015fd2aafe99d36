/**
 * @file stream_reader.cpp
 * @brief StreamReader transport handling (raw, gzip, zlib).
 *
 * Compressed input is inflated with zlib directly into the caller's
 * buffer; the only intermediate storage is one chunk of compressed input.
 */

#include <nbt/stream_reader.hpp>

#include <zlib.h>

#include <algorithm>
#include <array>
#include <limits>

namespace nbt {

struct StreamReader::Inflater {
    z_stream stream{};
    gz_header header{};
    bool initialized = false;
    bool finished = false; // Z_STREAM_END seen
    bool eof = false;      // input stream exhausted
    std::array<std::uint8_t, INPUT_CHUNK_BYTES> input{};

    ~Inflater() {
        if (initialized) {
            inflateEnd(&stream);
        }
    }
};

StreamReader::StreamReader() = default;

StreamReader::~StreamReader() = default;

Error StreamReader::fail(Error error, std::string message) {
    message_ = std::move(message);
    return error;
}

Error StreamReader::open(Compression compression, std::istream* in) {
    in_ = nullptr;
    inflater_.reset();
    position_ = 0;
    message_.clear();

    if (in == nullptr) {
        return fail(Error::InvalidArg, "nbt: input stream is null");
    }

    switch (compression) {
    case Compression::None:
        compression_ = compression;
        in_ = in;
        return Error::Ok;

    case Compression::GZip:
    case Compression::ZLib: {
        compression_ = compression;
        in_ = in;
        Error status = start_inflater(compression == Compression::GZip ? 16 + MAX_WBITS : MAX_WBITS);
        if (status != Error::Ok) {
            in_ = nullptr;
            inflater_.reset();
        }
        return status;
    }

    default:
        return fail(Error::InvalidArg, "nbt: unknown compression type: " +
                                           std::to_string(static_cast<int>(compression)));
    }
}

Error StreamReader::start_inflater(int window_bits) {
    inflater_ = std::make_unique<Inflater>();
    z_stream& stream = inflater_->stream;
    const std::string transport = compression_name(compression_);

    int rc = inflateInit2(&stream, window_bits);
    if (rc != Z_OK) {
        return fail(Error::InvalidData,
                    "nbt: cannot initialise " + transport + " transport: " + zError(rc));
    }
    inflater_->initialized = true;

    if (compression_ == Compression::GZip) {
        rc = inflateGetHeader(&stream, &inflater_->header);
        if (rc != Z_OK) {
            return fail(Error::InvalidData,
                        "nbt: cannot initialise gzip transport: " + std::string(zError(rc)));
        }
    }

    // Run inflate with no output space until the wrapper header is consumed.
    // zlib headers are two bytes; gzip headers report completion in header.done.
    std::uint8_t no_output = 0;
    auto header_done = [this, &stream]() {
        if (compression_ == Compression::GZip) {
            return inflater_->header.done != 0;
        }
        return stream.total_in >= 2;
    };

    while (!header_done()) {
        if (stream.avail_in == 0) {
            Error status = refill();
            if (status != Error::Ok) {
                return status;
            }
            if (stream.avail_in == 0) {
                return fail(Error::InvalidData, "nbt: truncated " + transport + " header");
            }
        }

        stream.next_out = &no_output;
        stream.avail_out = 0;
        rc = inflate(&stream, Z_NO_FLUSH);

        if (rc == Z_STREAM_END) {
            inflater_->finished = true;
            break;
        }
        if (rc == Z_NEED_DICT) {
            return fail(Error::InvalidData, "nbt: zlib preset dictionaries are not supported");
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            return fail(Error::InvalidData, "nbt: invalid " + transport + " header: " +
                                                (stream.msg != nullptr ? stream.msg : zError(rc)));
        }
        if (rc == Z_BUF_ERROR && stream.avail_in != 0) {
            break;
        }
    }

    return Error::Ok;
}

Error StreamReader::refill() {
    Inflater& inflater = *inflater_;
    inflater.stream.next_in = inflater.input.data();
    inflater.stream.avail_in = 0;
    if (inflater.eof) {
        return Error::Ok;
    }

    in_->read(reinterpret_cast<char*>(inflater.input.data()),
              static_cast<std::streamsize>(inflater.input.size()));
    std::streamsize got = in_->gcount();
    if (in_->bad()) {
        return fail(Error::IoFailure, "nbt: input stream read failed");
    }
    if (static_cast<std::size_t>(got) < inflater.input.size()) {
        inflater.eof = true;
    }

    inflater.stream.avail_in = static_cast<uInt>(got);
    return Error::Ok;
}

Error StreamReader::read(std::uint8_t* data, std::size_t size) {
    if (in_ == nullptr) {
        return fail(Error::InvalidArg, "nbt: stream reader is not open");
    }
    if (size == 0) {
        return Error::Ok;
    }

    Error status =
        compression_ == Compression::None ? read_raw(data, size) : read_inflated(data, size);
    if (status == Error::Ok) {
        position_ += size;
    }
    return status;
}

Error StreamReader::read_raw(std::uint8_t* data, std::size_t size) {
    in_->read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(size));
    auto got = static_cast<std::size_t>(in_->gcount());
    if (got == size) {
        return Error::Ok;
    }

    if (in_->bad()) {
        return fail(Error::IoFailure, "nbt: input stream read failed at byte " +
                                          std::to_string(position_ + got));
    }
    return fail(Error::Underflow, "nbt: unexpected end of stream at byte " +
                                      std::to_string(position_ + got) + " (needed " +
                                      std::to_string(size) + " bytes, got " +
                                      std::to_string(got) + ")");
}

Error StreamReader::read_inflated(std::uint8_t* data, std::size_t size) {
    Inflater& inflater = *inflater_;
    z_stream& stream = inflater.stream;
    const std::string transport = compression_name(compression_);
    std::size_t done = 0;

    while (done < size) {
        if (inflater.finished) {
            return fail(Error::Underflow, "nbt: unexpected end of " + transport +
                                              " stream at byte " +
                                              std::to_string(position_ + done));
        }

        if (stream.avail_in == 0) {
            Error status = refill();
            if (status != Error::Ok) {
                return status;
            }
        }

        std::size_t want =
            std::min<std::size_t>(size - done, std::numeric_limits<uInt>::max());
        stream.next_out = data + done;
        stream.avail_out = static_cast<uInt>(want);

        int rc = inflate(&stream, Z_NO_FLUSH);
        done += want - stream.avail_out;

        switch (rc) {
        case Z_OK:
            break;
        case Z_STREAM_END:
            inflater.finished = true;
            break;
        case Z_BUF_ERROR:
            // No progress: only fatal once the input is exhausted.
            if (stream.avail_in == 0 && inflater.eof) {
                return fail(Error::Underflow, "nbt: truncated " + transport +
                                                  " stream at byte " +
                                                  std::to_string(position_ + done));
            }
            break;
        case Z_NEED_DICT:
            return fail(Error::InvalidData, "nbt: zlib preset dictionaries are not supported");
        case Z_MEM_ERROR:
            return fail(Error::IoFailure, "nbt: out of memory while inflating " + transport);
        default:
            return fail(Error::InvalidData, "nbt: corrupt " + transport + " data: " +
                                                (stream.msg != nullptr ? stream.msg : zError(rc)));
        }
    }

    return Error::Ok;
}

} // namespace nbt
