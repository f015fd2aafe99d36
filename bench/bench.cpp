/**
 * @file bench.cpp
 * @brief Decode throughput benchmarks for the NBT decoder.
 *
 * Builds a synthetic chunk-like document in memory and decodes it raw and
 * through both compressed transports. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/nbt_bench          # Run with default 100 iterations
 *   ./build/nbt_bench 1000     # Run with custom iteration count
 */

#include <nbt/nbt.hpp>
#include <zlib.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace nbt;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::uint32_t SECTION_COUNT = 16;
static constexpr std::uint32_t BLOCKS_PER_SECTION = 4096;
static constexpr std::uint32_t ENTITY_COUNT = 64;

struct Entity {
    std::string id;
    std::vector<double> pos;
    float health = 0.0F;

    void nbt_fields(FieldMap& fields) {
        fields.bind("id", id).bind("Pos", pos).bind("Health", health);
    }
};

struct Section {
    std::int8_t y = 0;
    std::vector<std::uint8_t> blocks;
    std::vector<std::uint8_t> light;

    void nbt_fields(FieldMap& fields) {
        fields.bind("Y", y).bind("Blocks", blocks).bind("BlockLight", light);
    }
};

struct Chunk {
    std::int32_t x = 0;
    std::int32_t z = 0;
    std::int64_t last_update = 0;
    std::vector<Section> sections;
    std::vector<Entity> entities;
    std::vector<std::int32_t> heights;

    void nbt_fields(FieldMap& fields) {
        fields.bind("xPos", x)
            .bind("zPos", z)
            .bind("LastUpdate", last_update)
            .bind("Sections", sections)
            .bind("Entities", entities)
            .bind("HeightMap", heights);
    }
};

/// Minimal big-endian writer for the synthetic document
class Writer {
public:
    void u8(std::uint8_t value) {
        bytes_.push_back(value);
    }

    void be(std::uint64_t value, int width) {
        for (int shift = (width - 1) * 8; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
        }
    }

    void text(const char* value) {
        std::size_t length = std::strlen(value);
        be(length, 2);
        bytes_.insert(bytes_.end(), value, value + length);
    }

    void entry(Tag tag, const char* name) {
        u8(static_cast<std::uint8_t>(tag));
        text(name);
    }

    void f64(double value) {
        std::uint64_t raw = 0;
        std::memcpy(&raw, &value, sizeof(raw));
        be(raw, 8);
    }

    void f32(float value) {
        std::uint32_t raw = 0;
        std::memcpy(&raw, &value, sizeof(raw));
        be(raw, 4);
    }

    std::vector<std::uint8_t>& bytes() {
        return bytes_;
    }

private:
    std::vector<std::uint8_t> bytes_;
};

static std::vector<std::uint8_t> build_document() {
    Writer w;
    w.entry(Tag::Compound, "Level");

    w.entry(Tag::Int, "xPos");
    w.be(12, 4);
    w.entry(Tag::Int, "zPos");
    w.be(static_cast<std::uint32_t>(-7), 4);
    w.entry(Tag::Long, "LastUpdate");
    w.be(123456789ULL, 8);

    w.entry(Tag::List, "Sections");
    w.u8(static_cast<std::uint8_t>(Tag::Compound));
    w.be(SECTION_COUNT, 4);
    for (std::uint32_t s = 0; s < SECTION_COUNT; s++) {
        w.entry(Tag::Byte, "Y");
        w.u8(static_cast<std::uint8_t>(s));
        w.entry(Tag::ByteArray, "Blocks");
        w.be(BLOCKS_PER_SECTION, 4);
        for (std::uint32_t i = 0; i < BLOCKS_PER_SECTION; i++) {
            w.u8(static_cast<std::uint8_t>((i * 7 + s) % 13));
        }
        w.entry(Tag::ByteArray, "BlockLight");
        w.be(BLOCKS_PER_SECTION / 2, 4);
        for (std::uint32_t i = 0; i < BLOCKS_PER_SECTION / 2; i++) {
            w.u8(static_cast<std::uint8_t>(i & 0xFFU));
        }
        w.u8(static_cast<std::uint8_t>(Tag::End));
    }

    w.entry(Tag::List, "Entities");
    w.u8(static_cast<std::uint8_t>(Tag::Compound));
    w.be(ENTITY_COUNT, 4);
    for (std::uint32_t e = 0; e < ENTITY_COUNT; e++) {
        w.entry(Tag::String, "id");
        w.text(e % 2 == 0 ? "minecraft:zombie" : "minecraft:sheep");
        w.entry(Tag::List, "Pos");
        w.u8(static_cast<std::uint8_t>(Tag::Double));
        w.be(3, 4);
        w.f64(static_cast<double>(e) * 1.5);
        w.f64(64.0);
        w.f64(-static_cast<double>(e));
        w.entry(Tag::Float, "Health");
        w.f32(20.0F);
        w.u8(static_cast<std::uint8_t>(Tag::End));
    }

    w.entry(Tag::List, "HeightMap");
    w.u8(static_cast<std::uint8_t>(Tag::Int));
    w.be(256, 4);
    for (std::uint32_t i = 0; i < 256; i++) {
        w.be(60 + (i % 8), 4);
    }

    w.u8(static_cast<std::uint8_t>(Tag::End));
    return w.bytes();
}

static bool deflate_document(const std::vector<std::uint8_t>& input, int window_bits,
                             std::vector<std::uint8_t>& output) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return false;
    }

    output.resize(deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = const_cast<Bytef*>(input.data());
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    int rc = deflate(&stream, Z_FINISH);
    output.resize(stream.total_out);
    deflateEnd(&stream);
    return rc == Z_STREAM_END;
}

static void bench_decode(const char* name, Compression compression,
                         const std::vector<std::uint8_t>& data, std::size_t raw_size,
                         int iterations) {
    Chunk chunk;

    // Warmup run
    DecodeResult result = decode(compression, data.data(), data.size(), chunk);
    if (!result) {
        std::printf("%-20s FAIL (%s)\n", name, result.message.c_str());
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        result = decode(compression, data.data(), data.size(), chunk);
        if (!result) {
            std::printf("%-20s FAIL (%s)\n", name, result.message.c_str());
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(raw_size) / per_iter_us;

    std::printf("%-20s %8.2f µs/iter  %8.1f MB/s  (%zu bytes in)\n",
                name, per_iter_us, throughput_mbps, data.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::vector<std::uint8_t> raw = build_document();
    std::vector<std::uint8_t> gzip;
    std::vector<std::uint8_t> zlib;
    if (!deflate_document(raw, 16 + MAX_WBITS, gzip) || !deflate_document(raw, MAX_WBITS, zlib)) {
        std::printf("Could not compress benchmark document\n");
        return 1;
    }

    std::printf("NBT Decode Benchmarks (nbt %s)\n", version());
    std::printf("==============================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Document: %zu bytes (%u sections, %u entities)\n\n",
                raw.size(), SECTION_COUNT, ENTITY_COUNT);

    std::printf("%-20s %14s  %12s  %s\n", "Test", "Time", "Throughput", "Input");
    std::printf("%-20s %14s  %12s  %s\n", "----", "----", "----------", "-----");

    bench_decode("none", Compression::None, raw, raw.size(), iterations);
    bench_decode("zlib", Compression::ZLib, zlib, raw.size(), iterations);
    bench_decode("gzip", Compression::GZip, gzip, raw.size(), iterations);

    std::printf("\nThroughput is measured against the uncompressed document size.\n");

    return 0;
}
