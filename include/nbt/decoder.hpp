/**
 * @file decoder.hpp
 * @brief Recursive NBT tag decoder.
 *
 * The decoder reads one named root tag and materializes its payload into a
 * destination slot, descending through lists and compounds as the tag bytes
 * dictate. Every step returns an Error; the first failure aborts the whole
 * decode and leaves the destination partially written.
 *
 * Tag to destination compatibility:
 *
 * | Tag            | Destination kinds                  |
 * |----------------|------------------------------------|
 * | TAG_Byte       | Bool, Int8, UInt8                  |
 * | TAG_Short      | Int16, UInt16                      |
 * | TAG_Int        | Int32, UInt32                      |
 * | TAG_Long       | Int64, UInt64                      |
 * | TAG_Float      | Float32                            |
 * | TAG_Double     | Float64                            |
 * | TAG_Byte_Array | FixedBytes, Sequence of bytes      |
 * | TAG_String     | String                             |
 * | TAG_List       | Sequence                           |
 * | TAG_Compound   | Compound                           |
 *
 * TAG_Int_Array and TAG_Long_Array are not decoded.
 */

#ifndef NBT_DECODER_HPP
#define NBT_DECODER_HPP

#include <string>

#include "binding.hpp"
#include "config.hpp"
#include "error.hpp"
#include "slot.hpp"
#include "stream_reader.hpp"
#include "tag.hpp"

namespace nbt {

/**
 * @brief Runtime decoding limits.
 */
struct DecodeOptions {
    /// Maximum nesting of lists and compounds; the root compound is level 1
    std::size_t max_depth = MAX_DEPTH;
};

/**
 * @brief Decodes one document from an open StreamReader.
 */
class Decoder {
public:
    explicit Decoder(StreamReader& reader, DecodeOptions options = {}) noexcept
        : reader_(reader), options_(options) {}

    /**
     * @brief Decode the root tag into @p destination.
     *
     * @param destination Any type make_slot() accepts, normally a compound
     * @return Error::Ok on success
     */
    template <typename T> Error decode(T& destination) {
        return decode_root(make_slot(destination));
    }

    Error decode_root(const Slot& destination);

    /**
     * @brief Description of the last error, empty after success.
     */
    const std::string& message() const noexcept {
        return message_;
    }

    /**
     * @brief Name carried by the root tag of the last document.
     */
    const std::string& root_name() const noexcept {
        return root_name_;
    }

private:
    class ListElements;

    Error read_entry(Tag& tag, std::string& name);
    Error read_value(Tag tag, const Slot& slot, std::size_t depth);
    Error read_scalar(Tag tag, const Slot& slot);
    Error read_byte_array(const Slot& slot);
    Error read_string(const Slot& slot);
    Error read_list(const Slot& slot, std::size_t depth);
    Error read_compound(const Slot& slot, std::size_t depth);
    Error check_depth(std::size_t depth);

    Error mismatch(Tag tag, const Slot& slot);
    Error forward(Error status);
    Error fail(Error error, std::string message);

    StreamReader& reader_;
    DecodeOptions options_;
    std::string message_;
    std::string root_name_;
};

} // namespace nbt

#endif // NBT_DECODER_HPP
