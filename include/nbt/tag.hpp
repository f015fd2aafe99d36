/**
 * @file tag.hpp
 * @brief NBT tag type identifiers.
 *
 * Every node in a document starts with one tag byte that selects the shape
 * of the payload that follows.
 *
 * @see https://minecraft.wiki/w/NBT_format Named Binary Tag format
 */

#ifndef NBT_TAG_HPP
#define NBT_TAG_HPP

#include "config.hpp"

namespace nbt {

/**
 * @brief Payload kinds, as stored in the tag byte.
 */
enum class Tag : std::uint8_t {
    End = 0,       ///< Compound terminator, no name or payload
    Byte = 1,      ///< int8
    Short = 2,     ///< int16, big-endian
    Int = 3,       ///< int32, big-endian
    Long = 4,      ///< int64, big-endian
    Float = 5,     ///< IEEE 754 binary32, big-endian
    Double = 6,    ///< IEEE 754 binary64, big-endian
    ByteArray = 7, ///< u32 length + raw bytes
    String = 8,    ///< u16 length + raw bytes
    List = 9,      ///< inner tag + u32 count + unnamed payloads
    Compound = 10, ///< named entries terminated by End
    IntArray = 11, ///< declared by the format, not decoded
    LongArray = 12 ///< declared by the format, not decoded
};

/// Highest tag value the format defines
inline constexpr std::uint8_t MAX_TAG = static_cast<std::uint8_t>(Tag::LongArray);

/**
 * @brief Get the conventional name of a tag.
 * @param tag Tag value, possibly outside the defined range
 * @return "TAG_Byte", "TAG_Compound", ... or "TAG_Unknown"
 */
inline const char* tag_name(Tag tag) noexcept {
    switch (tag) {
    case Tag::End:
        return "TAG_End";
    case Tag::Byte:
        return "TAG_Byte";
    case Tag::Short:
        return "TAG_Short";
    case Tag::Int:
        return "TAG_Int";
    case Tag::Long:
        return "TAG_Long";
    case Tag::Float:
        return "TAG_Float";
    case Tag::Double:
        return "TAG_Double";
    case Tag::ByteArray:
        return "TAG_Byte_Array";
    case Tag::String:
        return "TAG_String";
    case Tag::List:
        return "TAG_List";
    case Tag::Compound:
        return "TAG_Compound";
    case Tag::IntArray:
        return "TAG_Int_Array";
    case Tag::LongArray:
        return "TAG_Long_Array";
    default:
        return "TAG_Unknown";
    }
}

/**
 * @brief Check whether a raw tag byte names a defined tag.
 */
inline constexpr bool is_known_tag(std::uint8_t value) noexcept {
    return value <= MAX_TAG;
}

} // namespace nbt

#endif // NBT_TAG_HPP
