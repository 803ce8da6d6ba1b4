/**
 * @file file_format.hh
 * @brief Amira file kinds and data encodings
 * @author Igor
 * @date 10/10/2026
 */

#pragma once

#include <string_view>
#include <amira/byte_order.hh>

namespace amira {

    /**
     * @enum file_format
     * @brief Kind of Amira file as announced by the designation line
     */
    enum class file_format {
        undefined,
        amira_mesh,
        hyper_surface
    };

    /**
     * @enum data_encoding
     * @brief Encoding of the data streams following the header
     */
    enum class data_encoding {
        unknown,
        ascii,
        binary,               ///< BINARY, big-endian
        binary_little_endian  ///< BINARY-LITTLE-ENDIAN
    };

    /**
     * @brief Name of the file format as written in the designation line
     * @return "AmiraMesh", "HyperSurface" or "Undefined"
     */
    constexpr std::string_view to_string(file_format ff) {
        switch (ff) {
            case file_format::amira_mesh:
                return "AmiraMesh";
            case file_format::hyper_surface:
                return "HyperSurface";
            case file_format::undefined:
                break;
        }
        return "Undefined";
    }

    constexpr std::string_view to_string(data_encoding enc) {
        switch (enc) {
            case data_encoding::ascii:
                return "ASCII";
            case data_encoding::binary:
                return "BINARY";
            case data_encoding::binary_little_endian:
                return "BINARY-LITTLE-ENDIAN";
            case data_encoding::unknown:
                break;
        }
        return "";
    }

    inline bool is_binary(data_encoding enc) {
        return enc == data_encoding::binary || enc == data_encoding::binary_little_endian;
    }

    /**
     * @brief Byte order of binary stream payloads
     *
     * Plain BINARY files are written big-endian.
     */
    inline byte_order encoding_byte_order(data_encoding enc) {
        return enc == data_encoding::binary_little_endian ? byte_order::little : byte_order::big;
    }

} // namespace amira
