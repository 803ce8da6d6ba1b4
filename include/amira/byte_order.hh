/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for binary Amira streams
 * @author Igor
 * @date 10/10/2026
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include <amira/amira_config.h>

namespace amira {
    /**
     * @enum byte_order
     * @brief Byte order of multi-byte values in a binary data stream
     */
    enum class byte_order {
        little, ///< BINARY-LITTLE-ENDIAN files
        big     ///< BINARY files
    };

    /// Byte order of the host, detected at configure time
#if AMIRA_BIG_ENDIAN
    inline constexpr byte_order host_byte_order = byte_order::big;
#else
    inline constexpr byte_order host_byte_order = byte_order::little;
#endif

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if values in this order can be used without swapping
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
        return bo == host_byte_order;
    }

    /**
     * @brief Element types of binary streams: integers and IEEE floats of 1, 2, 4 or 8 bytes
     */
    template<typename T>
    inline constexpr bool is_byte_swappable_v =
        (std::is_integral_v<T> && !std::is_same_v<T, bool> &&
         (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8)) ||
        (std::is_floating_point_v<T> && (sizeof(T) == 4 || sizeof(T) == 8));

    /**
     * @brief Reverse the bytes of a stream element
     *
     * Works on the object representation, so floats never pass through
     * an integer conversion.
     */
    template<typename T>
    T swap_byte_order(T value) noexcept {
        static_assert(is_byte_swappable_v<T>, "swap_byte_order needs a 1, 2, 4 or 8 byte number");
        if constexpr (sizeof(T) > 1) {
            unsigned char raw[sizeof(T)];
            std::memcpy(raw, &value, sizeof(T));
            std::reverse(raw, raw + sizeof(T));
            std::memcpy(&value, raw, sizeof(T));
        }
        return value;
    }

    /**
     * @brief Convert a value read in the given byte order to host order
     */
    template<typename T>
    T to_host(T value, byte_order bo) noexcept {
        return byte_order_native(bo) ? value : swap_byte_order(value);
    }
}
