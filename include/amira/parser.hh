/**
 * @file parser.hh
 * @brief Entry points for reading Amira files
 * @author Igor
 * @date 13/10/2026
 *
 * Reading a file runs in stages, each available on its own:
 * detect_format() classifies the file, get_header() splits the header
 * from the data streams, parse_header() turns the header text into a
 * parsed_header and parse_hypersurface_data() walks the data streams of
 * HyperSurface files. parse() and parse_file() run all stages.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>
#include <amira/export_amira.h>
#include <amira/file_format.hh>
#include <amira/header.hh>
#include <amira/header_parser.hh>
#include <amira/parse_options.hh>

namespace amira {

    /**
     * @struct format_detection
     * @brief Detected file format and the bytes inspected to find it
     */
    struct format_detection {
        file_format format = file_format::undefined;
        std::vector<std::byte> bytes;   ///< Bytes consumed from the stream
    };

    /**
     * @brief Detect the Amira file format
     *
     * Reads max(50, options.format_bytes) bytes. The stream position
     * advances by exactly the number of bytes returned.
     *
     * @param stream Input stream positioned at the start of the file
     * @param options Parse options (format_bytes, verbose)
     * @return Detected format and bytes read
     * @throws io_error on read failure
     */
    AMIRA_EXPORT format_detection detect_format(std::istream& stream, const parse_options& options = {});

    /**
     * @brief Detect the format of a file on disk
     * @throws io_error if the file cannot be opened or read
     */
    AMIRA_EXPORT file_format detect_format(const std::filesystem::path& path, const parse_options& options = {});

    /**
     * @struct header_scan
     * @brief Result of splitting a file into header and data streams
     */
    struct header_scan {
        file_format format = file_format::undefined;
        std::string header;                 ///< Header text, UTF-8
        std::vector<std::byte> remainder;   ///< Bytes read past the header, starting at the first stream marker
        std::uint64_t header_size = 0;      ///< Header size in bytes
    };

    /**
     * @brief Locate the end of the header
     *
     * The header ends at the first data stream marker: "@<n>" for
     * AmiraMesh files, a known stream keyword for HyperSurface files.
     * A file without any marker is all header.
     *
     * @param stream Input stream positioned at the start of the file
     * @param options Parse options (header_bytes, max_header_size, verbose)
     * @throws format_error if the file format is undefined
     * @throws parse_error if the header exceeds max_header_size
     * @throws io_error on read failure
     */
    AMIRA_EXPORT header_scan get_header(std::istream& stream, const parse_options& options = {});

    /**
     * @brief Index the data streams of a HyperSurface file
     *
     * Appends the array declarations and data definitions found in the
     * data streams to the header.
     *
     * @param stream Input stream positioned right behind `remainder`
     * @param header Header parsed from the same file
     * @param remainder Bytes read past the header (header_scan::remainder)
     * @param remainder_offset File offset of the first remainder byte
     * @param options Parse options (stream_bytes, drop_data, verbose)
     * @throws stream_error on any structural violation of the data streams
     * @throws io_error on read failure
     */
    AMIRA_EXPORT void parse_hypersurface_data(std::istream& stream,
                                              parsed_header& header,
                                              std::vector<std::byte> remainder,
                                              std::uint64_t remainder_offset,
                                              const parse_options& options = {});

    /**
     * @struct parse_result
     * @brief Everything known about a file after a full parse
     */
    struct parse_result {
        std::string header;                 ///< Header text
        parsed_header tree;                 ///< Parsed header, extended by the data streams
        std::uint64_t header_length = 0;    ///< Header size in bytes
        file_format format = file_format::undefined;
    };

    /**
     * @brief Parse header and data streams of an Amira file
     * @param stream Input stream positioned at the start of the file
     * @param options Parse options
     */
    AMIRA_EXPORT parse_result parse(std::istream& stream, const parse_options& options = {});

    /**
     * @brief Parse header and data streams of an Amira file on disk
     * @throws io_error if the file cannot be opened
     */
    AMIRA_EXPORT parse_result parse_file(const std::filesystem::path& path, const parse_options& options = {});

} // namespace amira
