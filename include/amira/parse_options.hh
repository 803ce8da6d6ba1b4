/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for Amira files
 * @author Igor
 * @date 10/10/2026
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstddef>
#include <cstdint>

namespace amira {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing Amira files
     *
     * Controls read chunk sizes, safety limits and diagnostic reporting.
     */
    struct parse_options {
        /**
         * @brief Minimum number of bytes inspected to detect the file format
         *
         * Values below 50 are raised to 50.
         */
        std::size_t format_bytes = 50;

        /**
         * @brief Chunk size used while searching for the end of the header
         */
        std::size_t header_bytes = 16384;

        /**
         * @brief Chunk size used while walking the data streams
         */
        std::size_t stream_bytes = 32768;

        /**
         * @brief Maximum accepted header size in bytes
         *
         * A header which does not end within this many bytes is rejected
         * with a parse_error. Default is 64MB.
         */
        std::uint64_t max_header_size = std::uint64_t(64) << 20;

        /**
         * @brief Maximum accepted size of a binary data stream in bytes
         *
         * Streams whose announced size exceeds this limit, or cannot be
         * computed without overflow, are rejected with a stream_error.
         * Default is 4GB.
         */
        std::uint64_t max_stream_size = std::uint64_t(1) << 32;

        /**
         * @brief Report progress messages through on_warning
         *
         * Messages are reported with the category "verbose".
         */
        bool verbose = false;

        /**
         * @brief Record stream offsets only
         *
         * When true, data definitions receive their stream offsets but
         * payload bytes are skipped instead of being copied.
         */
        bool drop_data = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for diagnostics
         * @param offset File offset the diagnostic refers to
         * @param category Diagnostic category (e.g., "verbose", "stream")
         * @param message Human-readable message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional diagnostic handler callback
         *
         * If not set, diagnostics are silently dropped.
         */
        warning_handler on_warning;
    };

} // namespace amira
