//
// Created by igor on 14/10/2026.
//

#include "hypersurface_walker.hh"
#include "delimiters.hh"
#include "diagnostics.hh"
#include "input.hh"
#include "payload.hh"
#include <amira/exceptions.hh>
#include <algorithm>
#include <utility>

namespace amira {

    namespace {
        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        std::size_t count_tokens(const std::vector<std::byte>& payload) {
            std::size_t tokens = 0;
            bool in_token = false;
            for (auto b : payload) {
                bool space = is_space(static_cast<char>(b));
                if (!space && !in_token) {
                    tokens++;
                }
                in_token = !space;
            }
            return tokens;
        }
    }

    hypersurface_walker::hypersurface_walker(reader_base& source,
                                             parsed_header& header,
                                             std::vector<std::byte> remainder,
                                             std::uint64_t remainder_offset,
                                             const parse_options& options,
                                             const stream_table& table,
                                             const delimiter_set& delimiters)
        : m_cursor(source, delimiters.rescan_overlap(), std::move(remainder), remainder_offset)
        , m_header(header)
        , m_options(options)
        , m_table(table)
        , m_delimiters(delimiters)
        , m_binary(false) {
        const auto format = header.designation.format;
        THROW_STREAM_IF(format == data_encoding::unknown,
                        "Header does not represent valid HyperSurface data definitions");
        m_binary = is_binary(format);
    }

    std::string_view hypersurface_walker::context() const {
        return m_group.level > 0 ? std::string_view(m_group.item_base) : top_level_context;
    }

    void hypersurface_walker::run() {
        const auto& marker = m_delimiters.hypersurface_stream();
        const std::size_t overlap = m_cursor.rescan_overlap();
        std::size_t from = 0;

        for (;;) {
            while (!m_cursor.exhausted() && m_cursor.size() < from + overlap) {
                m_cursor.read_chunk(m_options.stream_bytes);
            }
            auto found = marker.search(m_cursor.text(), from, m_cursor.exhausted());
            if (!found.match) {
                if (m_cursor.exhausted()) {
                    break;
                }
                from = std::max(from, std::min(m_cursor.rescan_from(m_cursor.size()), found.resume));
                m_cursor.read_chunk(m_options.stream_bytes);
                continue;
            }
            from = 0;

            const delimiter_match m = std::move(*found.match);
            handle_closes(m.start);

            const auto* descriptor = m_table.find(m.stream);
            THROW_STREAM_IF(descriptor == nullptr, "'", m.stream, "' unknown HyperSurface stream at offset ",
                            m_cursor.offset_of(m.start));
            trace(m_options, m_cursor.offset_of(m.start), "Found '", m.stream, "' stream");

            const auto* def = descriptor->in_context(context());
            if (def != nullptr && def->type != element_type::group) {
                read_stream(m, *def);
                continue;
            }
            const auto* group = descriptor->group_definition();
            if (group != nullptr) {
                enter_group(m, *group);
                continue;
            }
            THROW_STREAM("'", m.stream, "' stream not expected on '",
                         m_group.level > 0 ? m_group.item_name : std::string(top_level_context), "' group");
        }
        finish();
    }

    // Every '}' between two streams closes the current group item
    void hypersurface_walker::handle_closes(std::size_t span_end) {
        const auto span = m_cursor.text().substr(0, span_end);
        const auto& close = m_delimiters.group_close();

        std::size_t pos = 0;
        std::size_t stray = 0;
        for (;;) {
            auto found = close.search(span, pos, true);
            const std::size_t segment_end = found.match ? found.match->start : span.size();
            for (std::size_t i = pos; i < segment_end; i++) {
                if (!is_space(span[i]) && span[i] != '{') {
                    stray++;
                }
            }
            if (!found.match) {
                break;
            }
            const auto offset = m_cursor.offset_of(found.match->start);
            if (m_group.level > 0) {
                close_item(found.match->reopen, offset);
            } else {
                warn(m_options, offset, "stream", "Ignoring '}' outside of any group");
            }
            pos = found.match->end;
        }
        if (stray > 0) {
            warn(m_options, m_cursor.offset_of(0), "stream",
                 build_error_msg("Ignoring ", stray, " unexpected bytes between streams"));
        }
    }

    void hypersurface_walker::open_item(std::uint64_t offset) {
        m_group.item_count++;
        m_group.item_name = m_group.item_base + std::to_string(m_group.item_count);
        m_group.seen.clear();
        m_header.array_declarations.push_back(array_declaration{
            .name = m_group.item_name,
            .link = array_link{.parent = m_group.group_name, .item_id = m_group.item_count}
        });
        trace(m_options, offset, "Item '", m_group.item_name, "' of '", m_group.group_name, "' group");
    }

    void hypersurface_walker::close_item(bool reopen, std::uint64_t offset) {
        check_mandatory(m_group.item_base, m_group.seen, m_group.item_name);
        if (reopen) {
            THROW_STREAM_IF(m_group.item_count >= m_group.max_items,
                            "More items than declared in '", m_group.group_name, "' group (",
                            m_group.max_items, ")");
            open_item(offset);
            return;
        }
        THROW_STREAM_IF(m_group.item_count < m_group.max_items,
                        m_group.max_items - m_group.item_count, " items of '", m_group.group_name,
                        "' group missing");
        trace(m_options, offset, "End of '", m_group.group_name, "' group");
        m_group = group_state{};
    }

    void hypersurface_walker::check_mandatory(std::string_view ctx, const std::set<std::string>& seen,
                                              std::string_view owner) const {
        for (const auto& keyword : m_table.mandatory_in(ctx)) {
            THROW_STREAM_IF(seen.count(keyword) == 0, "Mandatory '", keyword, "' stream missing on '", owner, "'");
        }
    }

    void hypersurface_walker::enter_group(const delimiter_match& m, const stream_definition& def) {
        if (m_group.level > 0) {
            THROW_STREAM_IF(m_group.item_count < m_group.max_items,
                            m_group.max_items - m_group.item_count, " items of '", m_group.group_name,
                            "' group missing");
            THROW_STREAM("Nested groups not supported: '", m.stream, "' within '", m_group.item_name, "'");
        }
        THROW_STREAM_IF(def.context != top_level_context,
                        "Nested groups not supported: '", m.stream, "' belongs to '", def.context, "'");
        THROW_STREAM_UNLESS(m.count, "Item count not readable on stream '", m.stream, "'");

        const auto offset = m_cursor.offset_of(m.start);
        const auto items = *m.count;
        m_cursor.consume(m.end);
        if (items == 0) {
            THROW_STREAM_UNLESS(def.optional, "'", m.stream, "' group is mandatory");
            trace(m_options, offset, "Skipping empty '", m.stream, "' group");
            return;
        }

        m_top_seen.insert(m.stream);
        m_group.level = 1;
        m_group.max_items = items;
        m_group.item_count = 0;
        m_group.group_name = m.stream;
        m_group.item_base = def.block_name;
        m_header.array_declarations.push_back(array_declaration{
            .name = m.stream,
            .dimension = {items},
            .is_list = true,
            .value_type = std::string(to_string(element_type::group))
        });
        open_item(offset);
    }

    void hypersurface_walker::read_stream(const delimiter_match& m, const stream_definition& def) {
        const std::string& keyword = m.stream;
        stream_value value;
        std::uint64_t offset = 0;
        std::optional<std::uint64_t> shape;

        if (def.multiplicity) {
            THROW_STREAM_UNLESS(m.count, "'", keyword, "' stream has element count but does not provide number of items");
            shape = *m.count;
            const auto values = checked_multiply(*m.count, *def.multiplicity);
            const auto size = values ? checked_multiply(*values, type_size(def.type)) : std::nullopt;
            THROW_STREAM_UNLESS(size, "'", keyword, "' stream size overflows: ", *m.count, " items of ",
                                *def.multiplicity, " values");
            offset = m_cursor.offset_of(m.end);
            m_cursor.consume(m.end);
            if (m_binary) {
                const std::uint64_t bytes = *size;
                THROW_STREAM_IF(bytes > m_options.max_stream_size, "'", keyword, "' stream of ", bytes,
                                " bytes exceeds maximum allowed size of ", m_options.max_stream_size, " bytes");
                std::uint64_t extracted = 0;
                auto data = m_cursor.extract(bytes, !m_options.drop_data, extracted, m_options.stream_bytes);
                THROW_STREAM_IF(extracted < bytes, "'", keyword, "' stream truncated: ", extracted, " of ",
                                bytes, " bytes available");
                if (!m_options.drop_data) {
                    value = std::move(data);
                }
            } else {
                auto payload = collect_ascii(keyword);
                const auto tokens = count_tokens(payload);
                THROW_STREAM_IF(tokens != *values, "'", keyword, "' stream holds ", tokens, " values, ",
                                *values, " expected");
                if (!m_options.drop_data) {
                    value = std::move(payload);
                }
            }
        } else if (m.count) {
            value = static_cast<std::int64_t>(*m.count);
            offset = m_cursor.offset_of(m.value_start);
            m_cursor.consume(m.end);
        } else {
            THROW_STREAM_UNLESS(m.string, "'", keyword, "' stream provides no value");
            value = *m.string;
            offset = m_cursor.offset_of(m.value_start);
            m_cursor.consume(m.end);
        }

        if (m_group.level == 0) {
            m_top_seen.insert(keyword);
            if (def.multiplicity) {
                m_header.array_declarations.push_back(array_declaration{
                    .name = keyword,
                    .dimension = {*shape}
                });
                m_header.data_definitions.push_back(data_definition{
                    .array_reference = keyword,
                    .data_type = std::string(to_string(def.type)),
                    .data_dimension = *def.multiplicity,
                    .data_name = def.block_name,
                    .data_shape = shape,
                    .stream_offset = offset,
                    .stream_data = std::move(value)
                });
            } else {
                m_header.array_declarations.push_back(array_declaration{
                    .name = def.block_name,
                    .value = std::move(value),
                    .value_type = std::string(to_string(def.type)),
                    .stream_offset = offset
                });
            }
            return;
        }

        if (!m_group.seen.insert(keyword).second) {
            warn(m_options, offset, "stream",
                 build_error_msg("'", keyword, "' stream repeated on '", m_group.item_name, "'"));
        }
        std::optional<std::uint64_t> dimension;
        if (def.multiplicity) {
            dimension = *def.multiplicity;
        }
        m_header.data_definitions.push_back(data_definition{
            .array_reference = m_group.item_name,
            .data_type = std::string(to_string(def.type)),
            .data_dimension = dimension,
            .data_name = def.block_name,
            .data_shape = shape,
            .stream_offset = offset,
            .stream_data = std::move(value)
        });
    }

    // ASCII payload up to the next terminator, comments stripped
    std::vector<std::byte> hypersurface_walker::collect_ascii(const std::string& keyword) {
        auto scan = collect_payload(m_cursor, m_delimiters.hypersurface_ascii(), true, m_options.stream_bytes);
        THROW_STREAM_UNLESS(scan.terminated, "'", keyword, "' stream not terminated before end of data");
        return std::move(scan.data);
    }

    void hypersurface_walker::finish() {
        handle_closes(m_cursor.size());
        m_cursor.consume(m_cursor.size());

        if (m_group.level > 0) {
            THROW_STREAM_IF(m_group.item_count < m_group.max_items,
                            m_group.max_items - m_group.item_count, " items of '", m_group.group_name,
                            "' group missing");
            THROW_STREAM("'", m_group.group_name, "' group not closed");
        }
        if (!m_top_seen.empty()) {
            check_mandatory(top_level_context, m_top_seen, top_level_context);
        }
    }

    void walk_hypersurface(reader_base& source,
                           parsed_header& header,
                           std::vector<std::byte> remainder,
                           std::uint64_t remainder_offset,
                           const parse_options& options,
                           const stream_table& table,
                           const delimiter_set& delimiters) {
        hypersurface_walker walker(source, header, std::move(remainder), remainder_offset, options, table, delimiters);
        walker.run();
    }
}
