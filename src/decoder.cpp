/**
 * @file decoder.cpp
 * @brief Recursive tag dispatch.
 */

#include <nbt/decoder.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace nbt {

namespace {

std::string tag_label(Tag tag) {
    auto raw = static_cast<std::uint8_t>(tag);
    if (is_known_tag(raw)) {
        return tag_name(tag);
    }
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned>(raw));
    return std::string("TAG_Unknown(") + hex + ")";
}

/// Copy a fixed-width value into a destination of the same size
template <typename T> void store(const Slot& slot, T value) noexcept {
    std::memcpy(slot.target(), &value, sizeof(T));
}

} // namespace

/**
 * @brief Decodes each list element with the list's inner tag.
 */
class Decoder::ListElements final : public ElementSink {
public:
    ListElements(Decoder& decoder, Tag tag, std::size_t depth) noexcept
        : decoder_(decoder), tag_(tag), depth_(depth) {}

    Error decode_element(const Slot& element) override {
        return decoder_.read_value(tag_, element, depth_);
    }

private:
    Decoder& decoder_;
    Tag tag_;
    std::size_t depth_;
};

Error Decoder::fail(Error error, std::string message) {
    message_ = std::move(message);
    return error;
}

Error Decoder::forward(Error status) {
    if (status != Error::Ok) {
        message_ = reader_.message();
    }
    return status;
}

Error Decoder::mismatch(Tag tag, const Slot& slot) {
    return fail(Error::TypeMismatch, "nbt: tag is " + tag_label(tag) + ", but it cannot be stored in a " +
                                         kind_name(slot.kind()) + " destination");
}

Error Decoder::check_depth(std::size_t depth) {
    if (depth >= options_.max_depth) {
        return fail(Error::DepthExceeded, "nbt: nesting exceeds the limit of " +
                                              std::to_string(options_.max_depth) + " levels");
    }
    return Error::Ok;
}

Error Decoder::decode_root(const Slot& destination) {
    message_.clear();
    root_name_.clear();

    if (!reader_.is_open()) {
        return fail(Error::InvalidArg, "nbt: stream reader is not open");
    }

    Tag tag = Tag::End;
    auto status = read_entry(tag, root_name_);
    if (status != Error::Ok) {
        return status;
    }

    if (tag == Tag::End) {
        return fail(Error::UnexpectedEnd, "nbt: document starts with TAG_End instead of a named tag");
    }

    return read_value(tag, destination, 0);
}

Error Decoder::read_entry(Tag& tag, std::string& name) {
    std::uint8_t raw = 0;
    auto status = reader_.read_fixed(raw);
    if (status != Error::Ok) {
        return forward(status);
    }

    tag = static_cast<Tag>(raw);
    name.clear();
    if (tag == Tag::End) {
        return Error::Ok;
    }

    return forward(reader_.read_length_prefixed<std::uint16_t>(name));
}

Error Decoder::read_value(Tag tag, const Slot& slot, std::size_t depth) {
    // Platform-width destinations are rejected whatever the stream holds.
    if (slot.kind() == Kind::NativeInt || slot.kind() == Kind::NativeUInt) {
        return fail(Error::NotPortable,
                    std::string("nbt: ") + kind_name(slot.kind()) + " destination for " +
                        tag_label(tag) +
                        " is not supported for portability reasons, use a fixed-width type such "
                        "as int32_t or uint32_t");
    }

    switch (tag) {
    case Tag::Byte:
    case Tag::Short:
    case Tag::Int:
    case Tag::Long:
    case Tag::Float:
    case Tag::Double:
        return read_scalar(tag, slot);

    case Tag::ByteArray:
        return read_byte_array(slot);

    case Tag::String:
        return read_string(slot);

    case Tag::List:
        return read_list(slot, depth);

    case Tag::Compound:
        return read_compound(slot, depth);

    case Tag::End:
        return fail(Error::UnexpectedEnd, "nbt: TAG_End is only valid as a compound terminator");

    // Defined by the format but not decoded.
    case Tag::IntArray:
    case Tag::LongArray:
    default:
        return fail(Error::UnhandledTag, "nbt: unhandled tag " + tag_label(tag));
    }
}

Error Decoder::read_scalar(Tag tag, const Slot& slot) {
    switch (tag) {
    case Tag::Byte: {
        std::uint8_t raw = 0;
        auto status = reader_.read_fixed(raw);
        if (status != Error::Ok) {
            return forward(status);
        }
        switch (slot.kind()) {
        case Kind::Bool:
            slot.as<bool>() = raw != 0;
            return Error::Ok;
        case Kind::Int8:
            store(slot, static_cast<std::int8_t>(raw));
            return Error::Ok;
        case Kind::UInt8:
            store(slot, raw);
            return Error::Ok;
        default:
            return mismatch(tag, slot);
        }
    }

    case Tag::Short: {
        std::uint16_t raw = 0;
        auto status = reader_.read_fixed(raw);
        if (status != Error::Ok) {
            return forward(status);
        }
        switch (slot.kind()) {
        case Kind::Int16:
            store(slot, static_cast<std::int16_t>(raw));
            return Error::Ok;
        case Kind::UInt16:
            store(slot, raw);
            return Error::Ok;
        default:
            return mismatch(tag, slot);
        }
    }

    case Tag::Int: {
        std::uint32_t raw = 0;
        auto status = reader_.read_fixed(raw);
        if (status != Error::Ok) {
            return forward(status);
        }
        switch (slot.kind()) {
        case Kind::Int32:
            store(slot, static_cast<std::int32_t>(raw));
            return Error::Ok;
        case Kind::UInt32:
            store(slot, raw);
            return Error::Ok;
        default:
            return mismatch(tag, slot);
        }
    }

    case Tag::Long: {
        std::uint64_t raw = 0;
        auto status = reader_.read_fixed(raw);
        if (status != Error::Ok) {
            return forward(status);
        }
        switch (slot.kind()) {
        case Kind::Int64:
            store(slot, static_cast<std::int64_t>(raw));
            return Error::Ok;
        case Kind::UInt64:
            store(slot, raw);
            return Error::Ok;
        default:
            return mismatch(tag, slot);
        }
    }

    case Tag::Float: {
        std::uint32_t raw = 0;
        auto status = reader_.read_fixed(raw);
        if (status != Error::Ok) {
            return forward(status);
        }
        if (slot.kind() != Kind::Float32) {
            return mismatch(tag, slot);
        }
        float value = 0.0F;
        std::memcpy(&value, &raw, sizeof(value));
        slot.as<float>() = value;
        return Error::Ok;
    }

    case Tag::Double: {
        std::uint64_t raw = 0;
        auto status = reader_.read_fixed(raw);
        if (status != Error::Ok) {
            return forward(status);
        }
        if (slot.kind() != Kind::Float64) {
            return mismatch(tag, slot);
        }
        double value = 0.0;
        std::memcpy(&value, &raw, sizeof(value));
        slot.as<double>() = value;
        return Error::Ok;
    }

    default:
        return fail(Error::UnhandledTag, "nbt: unhandled tag " + tag_label(tag));
    }
}

Error Decoder::read_byte_array(const Slot& slot) {
    std::uint32_t raw_length = 0;
    auto status = reader_.read_fixed(raw_length);
    if (status != Error::Ok) {
        return forward(status);
    }
    auto length = static_cast<std::size_t>(raw_length);

    if (slot.kind() == Kind::FixedBytes) {
        if (slot.capacity() < length) {
            return fail(Error::Overflow, "nbt: TAG_Byte_Array of length " + std::to_string(length) +
                                             " does not fit in a fixed destination of length " +
                                             std::to_string(slot.capacity()));
        }
        return forward(reader_.read(static_cast<std::uint8_t*>(slot.target()), length));
    }

    if (!slot.accepts_bytes()) {
        return mismatch(Tag::ByteArray, slot);
    }

    // Grow as the bytes arrive so a forged length runs into the end of the
    // stream before it runs into the allocator.
    const SequenceOps& ops = slot.sequence_ops();
    if (length == 0) {
        ops.resize_bytes(slot.target(), 0);
        return Error::Ok;
    }

    std::size_t filled = 0;
    while (filled < length) {
        std::size_t chunk = std::min(length - filled, BYTE_ARRAY_CHUNK);
        std::uint8_t* data = ops.resize_bytes(slot.target(), filled + chunk);
        status = reader_.read(data + filled, chunk);
        if (status != Error::Ok) {
            return forward(status);
        }
        filled += chunk;
    }

    return Error::Ok;
}

Error Decoder::read_string(const Slot& slot) {
    if (slot.kind() != Kind::String) {
        return mismatch(Tag::String, slot);
    }
    return forward(reader_.read_length_prefixed<std::uint16_t>(slot.as<std::string>()));
}

Error Decoder::read_list(const Slot& slot, std::size_t depth) {
    std::uint8_t inner = 0;
    auto status = reader_.read_fixed(inner);
    if (status != Error::Ok) {
        return forward(status);
    }

    std::uint32_t count = 0;
    status = reader_.read_fixed(count);
    if (status != Error::Ok) {
        return forward(status);
    }

    if (slot.kind() != Kind::Sequence) {
        return mismatch(Tag::List, slot);
    }

    status = check_depth(depth);
    if (status != Error::Ok) {
        return status;
    }

    const SequenceOps& ops = slot.sequence_ops();
    ops.reset(slot.target(), count);

    ListElements elements(*this, static_cast<Tag>(inner), depth + 1);
    for (std::uint32_t i = 0; i < count; ++i) {
        status = ops.append(slot.target(), elements);
        if (status != Error::Ok) {
            return status;
        }
    }

    return Error::Ok;
}

Error Decoder::read_compound(const Slot& slot, std::size_t depth) {
    if (slot.kind() != Kind::Compound) {
        return mismatch(Tag::Compound, slot);
    }

    auto status = check_depth(depth);
    if (status != Error::Ok) {
        return status;
    }

    FieldMap fields;
    slot.describe(fields);
    if (!fields.duplicate().empty()) {
        return fail(Error::InvalidArg,
                    "nbt: field '" + fields.duplicate() + "' is bound more than once");
    }

    Tag tag = Tag::End;
    std::string name;
    for (;;) {
        status = read_entry(tag, name);
        if (status != Error::Ok) {
            return status;
        }

        if (tag == Tag::End) {
            return Error::Ok;
        }

        const Slot* field = fields.find(name);
        if (field == nullptr) {
            return fail(Error::UnknownField,
                        "nbt: unhandled " + tag_label(tag) + " field '" + name + "'");
        }

        status = read_value(tag, *field, depth + 1);
        if (status != Error::Ok) {
            return status;
        }
    }
}

} // namespace nbt
