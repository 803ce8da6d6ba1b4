/**
 * @file stream_table.hh
 * @brief Static description of the HyperSurface data streams
 * @author Igor
 * @date 11/10/2026
 *
 * Layout of HyperSurface files according to the Amira Reference Guide
 * (pp. 519-525). Each stream keyword maps to one definition per group
 * context it may appear in.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <amira/export_amira.h>

namespace amira {

    /**
     * @enum element_type
     * @brief Element type of a HyperSurface stream
     */
    enum class element_type {
        byte_type,
        short_type,
        int_type,
        long_type,
        float_type,
        double_type,
        char_type,
        group       ///< Stream opens a list of items
    };

    /// Keyword of the element type as used in data definitions ("int", "float", ...)
    AMIRA_EXPORT std::string_view to_string(element_type type);

    /// Size of one element in bytes, 0 for groups
    AMIRA_EXPORT std::size_t type_size(element_type type);

    /**
     * @brief Size of an AmiraMesh data type in bytes
     * @param name Type keyword as written in a data definition
     * @return Size or nullopt for unknown types
     */
    AMIRA_EXPORT std::optional<std::size_t> type_size(std::string_view name);

    /// Context of streams which are not part of any group
    inline constexpr std::string_view top_level_context = "array_declarations";

    /**
     * @struct stream_definition
     * @brief Meaning of a stream keyword within one group context
     */
    struct stream_definition {
        std::string context;                        ///< Owning group item base ("Patch") or top_level_context
        std::string block_name;                     ///< Data name, or the item base name for groups
        std::optional<std::size_t> multiplicity;    ///< Components per item, nullopt for scalar/text streams
        element_type type = element_type::int_type;
        bool optional = false;
    };

    /**
     * @struct stream_descriptor
     * @brief All definitions of one stream keyword
     */
    struct stream_descriptor {
        std::string keyword;
        std::vector<stream_definition> definitions;

        /**
         * @brief Definition valid within the given context
         * @return Definition or nullptr if the keyword may not appear there
         */
        [[nodiscard]] const stream_definition* in_context(std::string_view context) const;

        /// Definition opening a group, or nullptr
        [[nodiscard]] const stream_definition* group_definition() const;
    };

    /**
     * @class stream_table
     * @brief Immutable keyword to descriptor lookup table
     *
     * Keyword order is significant: delimiter patterns try keywords in
     * table order.
     */
    class AMIRA_EXPORT stream_table {
    public:
        explicit stream_table(std::vector<stream_descriptor> descriptors);

        /**
         * @brief Built-in HyperSurface table
         * @return Table shared by all parses, constructed on first use
         */
        static const stream_table& hyper_surface();

        [[nodiscard]] const stream_descriptor* find(std::string_view keyword) const;
        [[nodiscard]] std::vector<std::string> keywords() const;
        [[nodiscard]] const std::vector<stream_descriptor>& descriptors() const { return m_descriptors; }

        /**
         * @brief Keywords of the non-optional streams of a context, groups included
         * @param context Group item base name or top_level_context
         */
        [[nodiscard]] std::vector<std::string> mandatory_in(std::string_view context) const;

    private:
        std::vector<stream_descriptor> m_descriptors;
    };

    /**
     * @brief Number of trailing bytes rescanned after every read
     *
     * Longest keyword plus 16, rounded up to a multiple of 16.
     */
    AMIRA_EXPORT std::size_t rescan_overlap_for(const std::vector<std::string>& keywords);

} // namespace amira
