/**
 * @file slot.hpp
 * @brief Type-erased destination slots and compound field maps.
 *
 * A Slot is a non-owning handle to one destination value together with its
 * Kind. The decoder works only on slots; binding.hpp derives them from C++
 * types. Compound destinations describe themselves into a FieldMap, which
 * the decoder consults by entry name.
 */

#ifndef NBT_SLOT_HPP
#define NBT_SLOT_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace nbt {

/**
 * @brief Shape of a destination value.
 */
enum class Kind : std::uint8_t {
    Bool,
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Int64,
    UInt64,
    Float32,
    Float64,
    NativeInt,  ///< Platform-defined signed integer, always rejected
    NativeUInt, ///< Platform-defined unsigned integer, always rejected
    FixedBytes, ///< Fixed-capacity byte storage
    Sequence,   ///< Growable sequence (std::vector)
    String,
    Compound
};

/**
 * @brief Get the name of a destination kind.
 */
inline const char* kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::Bool:
        return "bool";
    case Kind::Int8:
        return "int8";
    case Kind::UInt8:
        return "uint8";
    case Kind::Int16:
        return "int16";
    case Kind::UInt16:
        return "uint16";
    case Kind::Int32:
        return "int32";
    case Kind::UInt32:
        return "uint32";
    case Kind::Int64:
        return "int64";
    case Kind::UInt64:
        return "uint64";
    case Kind::Float32:
        return "float32";
    case Kind::Float64:
        return "float64";
    case Kind::NativeInt:
        return "native int";
    case Kind::NativeUInt:
        return "native uint";
    case Kind::FixedBytes:
        return "fixed byte array";
    case Kind::Sequence:
        return "sequence";
    case Kind::String:
        return "string";
    case Kind::Compound:
        return "compound";
    default:
        return "unknown";
    }
}

class Slot;
class FieldMap;

/**
 * @brief Receives each list element as it is appended.
 */
class ElementSink {
public:
    virtual Error decode_element(const Slot& element) = 0;

protected:
    ~ElementSink() = default;
};

/**
 * @brief Operations on a growable sequence destination.
 */
struct SequenceOps {
    /// Empty the sequence, keeping its capacity, and prepare for @p count elements
    void (*reset)(void* sequence, std::size_t count);

    /// Value-initialise an element, decode into it through @p sink, append on success
    Error (*append)(void* sequence, ElementSink& sink);

    /// Resize to @p size bytes and return the storage; nullptr unless elements are bytes
    std::uint8_t* (*resize_bytes)(void* sequence, std::size_t size);
};

/// Registers the fields of a compound destination
using DescribeFn = void (*)(void* object, FieldMap& fields);

/**
 * @brief Non-owning handle to a destination value.
 */
class Slot {
public:
    Slot(Kind kind, void* target) noexcept : kind_(kind), target_(target) {}

    static Slot fixed_bytes(std::uint8_t* data, std::size_t capacity) noexcept {
        Slot slot(Kind::FixedBytes, data);
        slot.capacity_ = capacity;
        return slot;
    }

    static Slot sequence(void* target, const SequenceOps* ops) noexcept {
        Slot slot(Kind::Sequence, target);
        slot.sequence_ = ops;
        return slot;
    }

    static Slot compound(void* target, DescribeFn describe) noexcept {
        Slot slot(Kind::Compound, target);
        slot.describe_ = describe;
        return slot;
    }

    Kind kind() const noexcept {
        return kind_;
    }

    void* target() const noexcept {
        return target_;
    }

    template <typename T> T& as() const noexcept {
        return *static_cast<T*>(target_);
    }

    /// Byte capacity of a FixedBytes slot
    std::size_t capacity() const noexcept {
        return capacity_;
    }

    const SequenceOps& sequence_ops() const noexcept {
        return *sequence_;
    }

    /// True for sequences whose elements are bytes (valid TAG_Byte_Array targets)
    bool accepts_bytes() const noexcept {
        return kind_ == Kind::Sequence && sequence_->resize_bytes != nullptr;
    }

    void describe(FieldMap& fields) const {
        describe_(target_, fields);
    }

private:
    Kind kind_;
    void* target_;
    std::size_t capacity_ = 0;
    const SequenceOps* sequence_ = nullptr;
    DescribeFn describe_ = nullptr;
};

/**
 * @brief Name to slot mapping for one compound destination.
 *
 * Built fresh each time a compound is decoded. Binding a name twice keeps
 * the first slot and records the name; the decoder rejects such maps.
 */
class FieldMap {
public:
    /**
     * @brief Bind a member under the entry name it is stored as.
     *
     * Defined in binding.hpp.
     */
    template <typename T> FieldMap& bind(std::string_view name, T& value);

    FieldMap& bind_slot(std::string_view name, const Slot& slot);

    /**
     * @brief Look up a field.
     * @return The bound slot, or nullptr
     */
    const Slot* find(std::string_view name) const;

    std::size_t size() const noexcept {
        return slots_.size();
    }

    bool empty() const noexcept {
        return slots_.empty();
    }

    /// First name bound more than once, empty if none
    const std::string& duplicate() const noexcept {
        return duplicate_;
    }

private:
    std::map<std::string, Slot, std::less<>> slots_;
    std::string duplicate_;
};

} // namespace nbt

#endif // NBT_SLOT_HPP
