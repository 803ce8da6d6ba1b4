//
// Created by igor on 15/10/2026.
//

#include "amiramesh_stream_iterator.hh"
#include "delimiters.hh"
#include "diagnostics.hh"
#include "payload.hh"
#include <amira/exceptions.hh>
#include <amira/stream_table.hh>
#include <algorithm>
#include <charconv>
#include <utility>

namespace amira {

    namespace {
        std::size_t count_stray(std::string_view text) {
            return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
                return !(c == ' ' || c == '\t' || c == '\n' || c == '\r');
            }));
        }
    }

    std::optional<std::uint64_t> expected_stream_size(const parsed_header& header, const data_definition& def) {
        if (!def.data_format.empty()) {
            // compressed payloads announce their size
            return def.data_length;
        }
        auto size = type_size(def.data_type);
        const auto* array = header.find_array(def.array_reference);
        if (!size || array == nullptr || array->dimension.empty()) {
            return std::nullopt;
        }
        auto total = checked_multiply(*size, def.data_dimension.value_or(1));
        for (auto d : array->dimension) {
            total = total ? checked_multiply(*total, d) : std::nullopt;
        }
        THROW_STREAM_UNLESS(total, "Size of stream @", def.data_index, " overflows");
        return total;
    }

    std::unique_ptr<stream_iterator> stream_iterator::get_iterator(std::istream& stream,
                                                                   const parsed_header& header,
                                                                   std::vector<std::byte> remainder,
                                                                   std::uint64_t remainder_offset,
                                                                   const parse_options& options) {
        if (header.designation.filetype != file_format::amira_mesh) {
            THROW_PARSE("Stream iteration requires an AmiraMesh header, got ", to_string(header.designation.filetype));
        }
        return std::make_unique<amiramesh_stream_iterator>(stream, header, std::move(remainder),
                                                           remainder_offset, options);
    }

    amiramesh_stream_iterator::amiramesh_stream_iterator(std::istream& stream,
                                                         const parsed_header& header,
                                                         std::vector<std::byte> remainder,
                                                         std::uint64_t remainder_offset,
                                                         const parse_options& options)
        : stream_iterator()
        , m_reader(std::make_unique<reader>(stream))
        , m_header(header)
        , m_options(options) {
        check_options(m_options);
        THROW_STREAM_IF(header.designation.format == data_encoding::unknown,
                        "Header does not announce a data format");
        m_binary = is_binary(header.designation.format);
        m_cursor = std::make_unique<byte_cursor>(*m_reader, delimiter_set::hyper_surface().rescan_overlap(),
                                                 std::move(remainder), remainder_offset);
        m_ended = !read_next_stream();
    }

    amiramesh_stream_iterator::~amiramesh_stream_iterator() = default;

    void amiramesh_stream_iterator::advance() {
        if (m_ended) {
            return;
        }
        if (!read_next_stream()) {
            m_ended = true;
        }
    }

    bool amiramesh_stream_iterator::find_marker(std::int64_t& index) {
        const auto& marker = delimiter_set::hyper_surface().amiramesh_stream();
        auto& cursor = *m_cursor;
        std::size_t from = 0;

        for (;;) {
            while (!cursor.exhausted() && cursor.size() < from + cursor.rescan_overlap()) {
                cursor.read_chunk(m_options.stream_bytes);
            }
            auto found = marker.search(cursor.text(), from, cursor.exhausted());
            if (found.match) {
                const auto& m = *found.match;
                if (auto stray = count_stray(cursor.text().substr(0, m.start)); stray > 0) {
                    warn(m_options, cursor.offset_of(0), "stream",
                         build_error_msg("Ignoring ", stray, " unexpected bytes before stream @", m.stream));
                }
                auto first = m.stream.data();
                auto last = first + m.stream.size();
                auto [ptr, ec] = std::from_chars(first, last, index);
                THROW_STREAM_IF(ec != std::errc() || ptr != last, "Invalid stream index @", m.stream);
                trace(m_options, cursor.offset_of(m.start), "Found stream @", index);
                cursor.consume(m.end);
                return true;
            }
            if (cursor.exhausted()) {
                if (auto stray = count_stray(cursor.text()); stray > 0) {
                    warn(m_options, cursor.offset_of(0), "stream",
                         build_error_msg("Ignoring ", stray, " bytes behind the last stream"));
                }
                cursor.consume(cursor.size());
                return false;
            }
            from = std::max(from, std::min(cursor.rescan_from(cursor.size()), found.resume));
            cursor.read_chunk(m_options.stream_bytes);
        }
    }

    bool amiramesh_stream_iterator::read_next_stream() {
        std::int64_t index = -1;
        if (!find_marker(index)) {
            return false;
        }

        const auto& delimiters = delimiter_set::hyper_surface();
        auto& cursor = *m_cursor;
        const bool keep = !m_options.drop_data;

        stream_info info;
        info.index = index;
        info.offset = cursor.offset_of(0);
        info.definition = m_header.find_stream(index);
        if (info.definition == nullptr) {
            warn(m_options, info.offset, "stream", build_error_msg("No data definition for stream @", index));
        }

        std::optional<std::uint64_t> size;
        if (m_binary && info.definition != nullptr) {
            size = expected_stream_size(m_header, *info.definition);
        }

        if (size) {
            THROW_STREAM_IF(*size > m_options.max_stream_size, "Stream @", index, " of ", *size,
                            " bytes exceeds maximum allowed size of ", m_options.max_stream_size, " bytes");
            std::uint64_t extracted = 0;
            info.data = cursor.extract(*size, keep, extracted, m_options.stream_bytes);
            THROW_STREAM_IF(extracted < *size, "Stream @", index, " truncated: ", extracted, " of ",
                            *size, " bytes available");
            info.length = *size;
        } else {
            if (m_binary) {
                trace(m_options, info.offset, "Size of stream @", index, " unknown, scanning for next marker");
            }
            const auto& until = m_binary ? delimiters.amiramesh_stream() : delimiters.amiramesh_ascii();
            auto scan = collect_payload(cursor, until, keep, m_options.stream_bytes);
            info.data = std::move(scan.data);
            info.length = scan.length;
        }

        m_current = std::move(info);
        return true;
    }
}
