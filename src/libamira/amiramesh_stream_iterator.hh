//
// Created by igor on 15/10/2026.
//

#pragma once

#include <amira/amiramesh_streams.hh>
#include "byte_cursor.hh"
#include "input.hh"
#include <memory>
#include <optional>

namespace amira {

    // Payload size announced by the header, nullopt if it cannot be derived
    std::optional<std::uint64_t> expected_stream_size(const parsed_header& header, const data_definition& def);

    // AmiraMesh "@<n>" streams (internal implementation)
    class amiramesh_stream_iterator : public stream_iterator {
    public:
        amiramesh_stream_iterator(std::istream& stream,
                                  const parsed_header& header,
                                  std::vector<std::byte> remainder,
                                  std::uint64_t remainder_offset,
                                  const parse_options& options);

        ~amiramesh_stream_iterator() override;

    protected:
        void advance() override;

    private:
        // Positions the cursor behind the next marker, false at end of data
        bool find_marker(std::int64_t& index);

        bool read_next_stream();

        std::unique_ptr<reader_base> m_reader;
        std::unique_ptr<byte_cursor> m_cursor;
        const parsed_header& m_header;
        parse_options m_options;
        bool m_binary = false;
    };
}
