/**
 * @file config.hpp
 * @brief NBT decoder compile-time configuration.
 *
 * @see https://minecraft.wiki/w/NBT_format Named Binary Tag format
 */

#ifndef NBT_CONFIG_HPP
#define NBT_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace nbt {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default nesting limit for lists and compounds (512 matches the format's reference reader)
#ifndef NBT_MAX_DEPTH
#define NBT_MAX_DEPTH 512U
#endif

inline constexpr std::size_t MAX_DEPTH = NBT_MAX_DEPTH;

/// Compressed bytes pulled from the input stream per refill
inline constexpr std::size_t INPUT_CHUNK_BYTES = 16384U;

/// Growth step for byte arrays decoded into growable destinations
inline constexpr std::size_t BYTE_ARRAY_CHUNK = 65536U;

/// Upper bound on elements reserved up front for a list
inline constexpr std::size_t LIST_RESERVE_LIMIT = 4096U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define NBT_NO_EXCEPTIONS=1 to compile out the throwing API.
 * @{
 */
#ifndef NBT_NO_EXCEPTIONS
#define NBT_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace nbt

#endif // NBT_CONFIG_HPP
