/**
 * @file stream_decode.hh
 * @brief Typed views of extracted stream payloads
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <cstddef>
#include <cstring>
#include <vector>
#include <amira/byte_order.hh>
#include <amira/exceptions.hh>
#include <amira/export_amira.h>
#include <amira/file_format.hh>
#include <amira/header.hh>

namespace amira {

    /**
     * @brief Convert a binary payload into values of type T
     * @tparam T Element type (integral or floating point, 1, 2, 4 or 8 bytes)
     * @param bytes Raw payload
     * @param order Byte order of the payload
     * @throws stream_error if the payload size is not a multiple of sizeof(T)
     */
    template<typename T>
    std::vector<T> decode_binary(const std::vector<std::byte>& bytes, byte_order order) {
        static_assert(is_byte_swappable_v<T>, "decode_binary requires a byte swappable type");
        THROW_STREAM_IF(bytes.size() % sizeof(T) != 0,
                        "Payload of ", bytes.size(), " bytes is not a multiple of ", sizeof(T));

        std::vector<T> values(bytes.size() / sizeof(T));
        if (!values.empty()) {
            std::memcpy(values.data(), bytes.data(), bytes.size());
        }
        for (auto& v : values) {
            v = to_host(v, order);
        }
        return values;
    }

    /**
     * @brief Split an ASCII payload into numbers
     * @throws stream_error on a token which is not a number
     */
    AMIRA_EXPORT std::vector<double> decode_ascii(const std::vector<std::byte>& bytes);

    /**
     * @brief Decode the payload of a data definition into doubles
     *
     * The element type is taken from data_type. Payloads of compressed
     * streams (HxByteRLE, HxZip) are not decoded.
     *
     * @param def Data definition carrying the payload in stream_data
     * @param encoding Encoding announced by the designation line
     * @throws stream_error if the definition carries no payload or the type is unknown
     */
    AMIRA_EXPORT std::vector<double> decode_values(const data_definition& def, data_encoding encoding);

} // namespace amira
