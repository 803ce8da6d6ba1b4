/**
 * @file amiramesh_streams.hh
 * @brief Iteration over the "@<n>" data streams of AmiraMesh files
 * @author Igor
 * @date 15/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <vector>
#include <amira/export_amira.h>
#include <amira/header.hh>
#include <amira/parse_options.hh>

namespace amira {

    /**
     * @class stream_iterator
     * @brief Forward iterator over the data streams following the header
     *
     * Streams are visited in file order. The iterator borrows the input
     * stream and the header for its whole lifetime.
     */
    class AMIRA_EXPORT stream_iterator {
    public:
        /**
         * @brief Create an iterator for the streams of an AmiraMesh file
         * @param stream Input stream positioned right behind `remainder`
         * @param header Header parsed from the same file
         * @param remainder Bytes read past the header (header_scan::remainder)
         * @param remainder_offset File offset of the first remainder byte
         * @param options Parse options (stream_bytes, drop_data, verbose)
         * @return Iterator positioned on the first stream, or at end if there is none
         */
        static std::unique_ptr<stream_iterator> get_iterator(std::istream& stream,
                                                             const parsed_header& header,
                                                             std::vector<std::byte> remainder,
                                                             std::uint64_t remainder_offset,
                                                             const parse_options& options = {});

        /**
         * @struct stream_info
         * @brief The stream the iterator is positioned on
         */
        struct stream_info {
            std::int64_t index = -1;                        ///< Number following '@'
            std::uint64_t offset = 0;                       ///< File offset of the first payload byte
            std::uint64_t length = 0;                       ///< Payload bytes, comments excluded
            std::vector<std::byte> data;                    ///< Payload, empty with drop_data
            const data_definition* definition = nullptr;    ///< Matching data definition, if any
        };

        virtual ~stream_iterator() = default;

        const stream_info& current() const { return m_current; }
        stream_info& current() { return m_current; }

        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    protected:
        stream_iterator() : m_current{}, m_ended(true) {}

        virtual void advance() = 0;

        stream_info m_current;
        bool m_ended;
    };

} // namespace amira
