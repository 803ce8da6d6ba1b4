//
// Created by igor on 14/10/2026.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <amira/header.hh>
#include <amira/parse_options.hh>
#include <amira/stream_table.hh>
#include "byte_cursor.hh"

namespace amira {

    class delimiter_set;
    class reader_base;
    struct delimiter_match;

    // Walks the data streams following a HyperSurface header and records
    // them in the header tree. One instance per file.
    class hypersurface_walker {
        public:
            hypersurface_walker(reader_base& source,
                                parsed_header& header,
                                std::vector<std::byte> remainder,
                                std::uint64_t remainder_offset,
                                const parse_options& options,
                                const stream_table& table,
                                const delimiter_set& delimiters);

            hypersurface_walker(const hypersurface_walker&) = delete;
            hypersurface_walker& operator = (const hypersurface_walker&) = delete;

            void run();

        private:
            // Nesting of list groups, at most one level deep
            struct group_state {
                int level = 0;
                std::uint64_t max_items = 0;
                std::uint64_t item_count = 0;
                std::string group_name;     // "Patches"
                std::string item_base;      // "Patch"
                std::string item_name;      // "Patch2"
                std::set<std::string> seen; // streams of the current item
            };

            [[nodiscard]] std::string_view context() const;

            void handle_closes(std::size_t span_end);
            void close_item(bool reopen, std::uint64_t offset);
            void open_item(std::uint64_t offset);
            void check_mandatory(std::string_view ctx, const std::set<std::string>& seen, std::string_view owner) const;

            void enter_group(const delimiter_match& m, const stream_definition& def);
            void read_stream(const delimiter_match& m, const stream_definition& def);
            std::vector<std::byte> collect_ascii(const std::string& keyword);
            void finish();

            byte_cursor m_cursor;
            parsed_header& m_header;
            const parse_options& m_options;
            const stream_table& m_table;
            const delimiter_set& m_delimiters;
            bool m_binary;
            group_state m_group;
            std::set<std::string> m_top_seen;
    };

    // Walks the streams with an explicit table and delimiter set
    void walk_hypersurface(reader_base& source,
                           parsed_header& header,
                           std::vector<std::byte> remainder,
                           std::uint64_t remainder_offset,
                           const parse_options& options,
                           const stream_table& table,
                           const delimiter_set& delimiters);
}
