/**
 * @file header.hh
 * @brief In-memory representation of a parsed Amira header
 * @author Igor
 * @date 11/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <amira/export_amira.h>
#include <amira/file_format.hh>

namespace amira {

    /**
     * @struct designation_line
     * @brief First header line: file kind, encoding and version
     */
    struct designation_line {
        file_format filetype = file_format::undefined;
        std::string dimension;                      ///< "3D" if present
        data_encoding format = data_encoding::unknown;
        std::string version;
        std::string content_type;                   ///< "hxsurface" if present
    };

    /**
     * @struct comment_line
     * @brief A '#' comment following the designation line
     */
    struct comment_line {
        std::string text;
        std::optional<std::string> creation_date;   ///< Set for "# CreationDate: ..." lines
    };

    /**
     * @typedef stream_value
     * @brief Value attached to a declaration or definition
     *
     * Empty, a scalar taken from a stream marker (item counts), a textual
     * token (region names) or the raw payload bytes of a data stream.
     */
    using stream_value = std::variant<std::monostate, std::int64_t, std::string, std::vector<std::byte>>;

    /**
     * @struct array_link
     * @brief Position of a synthesized item array within its list group
     */
    struct array_link {
        std::string parent;         ///< Name of the list group, e.g. "Patches"
        std::size_t item_id = 0;    ///< 1-based item index
    };

    /**
     * @struct array_declaration
     * @brief "define <name> <dims>" line or an array synthesized from the streams
     */
    struct array_declaration {
        std::string name;
        std::vector<std::uint64_t> dimension;   ///< Empty when the array has no extent
        bool is_list = false;                   ///< Group of items (Patches, Surfaces, ...)
        std::optional<array_link> link;         ///< Set for group items (Patch1, ...)
        stream_value value;                     ///< Inline scalar streams (NBranchingPoints, ...)
        std::string value_type;
        std::optional<std::uint64_t> stream_offset;
    };

    /**
     * @struct data_definition
     * @brief "<array> { <type> <name> } @<n>" line or a HyperSurface data stream
     */
    struct data_definition {
        std::string array_reference;
        std::string data_type;
        std::optional<std::uint64_t> data_dimension;    ///< Components per element ("float[3]")
        std::string data_name;
        std::int64_t data_index = -1;                   ///< @<n> stream index, -1 for HyperSurface
        std::string interpolation;                      ///< "Linear", "Constant", "EdgeElem"
        std::string data_format;                        ///< "HxByteRLE", "HxZip" or empty
        std::optional<std::uint64_t> data_length;       ///< Compressed payload size
        std::optional<std::uint64_t> data_shape;        ///< Item count announced by the stream
        std::optional<std::uint64_t> stream_offset;     ///< File offset of the payload
        stream_value stream_data;
    };

    /**
     * @struct parameter
     * @brief Entry of a "Parameters { ... }" block
     *
     * Leaf parameters carry their raw value text; nested blocks carry
     * children instead.
     */
    struct parameter {
        std::string name;
        std::string value;
        std::vector<parameter> children;
        bool is_group = false;
    };

    /**
     * @struct parsed_header
     * @brief Structured content of an Amira header
     *
     * The HyperSurface stream walker appends to array_declarations and
     * data_definitions while it discovers the data streams.
     */
    struct AMIRA_EXPORT parsed_header {
        designation_line designation;
        std::vector<comment_line> comments;
        std::vector<array_declaration> array_declarations;
        std::vector<parameter> parameters;
        std::vector<parameter> materials;
        std::vector<data_definition> data_definitions;

        [[nodiscard]] const array_declaration* find_array(std::string_view name) const;
        [[nodiscard]] const data_definition* find_data(std::string_view array, std::string_view name) const;
        [[nodiscard]] const data_definition* find_stream(std::int64_t index) const;

        /**
         * @brief Look up a parameter by path
         * @param path Names separated by '.', e.g. "Materials.Exterior.Id"
         * @return Parameter or nullptr
         */
        [[nodiscard]] const parameter* find_parameter(std::string_view path) const;
    };

} // namespace amira
