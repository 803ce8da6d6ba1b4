//
// Created by igor on 13/10/2026.
//

#include "header_scanner.hh"
#include "byte_cursor.hh"
#include "delimiters.hh"
#include "diagnostics.hh"
#include "format_detector.hh"
#include "input.hh"
#include <algorithm>
#include <utility>

namespace amira {

    header_scan scan_header(reader_base& source, const parse_options& options) {
        check_options(options);
        const auto& delimiters = delimiter_set::hyper_surface();
        const std::size_t overlap = delimiters.rescan_overlap();

        const auto base = source.position();
        auto detected = detect_format(source, std::max(options.header_bytes, overlap), options);
        if (detected.format == file_format::undefined) {
            THROW_FORMAT("Unable to parse undefined file");
        }

        const delimiter& header_end = delimiters.header_end(detected.format);
        trace(options, base, "Using pattern: ", header_end.name());

        header_scan result;
        result.format = detected.format;

        byte_cursor cursor(source, overlap, std::move(detected.bytes), base);
        std::size_t from = 0;
        for (;;) {
            auto found = header_end.search(cursor.text(), from, cursor.exhausted());
            if (found.match) {
                THROW_PARSE_IF(found.match->start > options.max_header_size,
                               "Header exceeds ", options.max_header_size, " bytes");
                auto header = cursor.take(found.match->start);
                result.header = to_utf8({reinterpret_cast<const char*>(header.data()), header.size()});
                result.header_size = header.size();
                result.remainder = cursor.release();
                break;
            }
            if (cursor.exhausted()) {
                // no data streams at all
                THROW_PARSE_IF(cursor.size() > options.max_header_size,
                               "Header exceeds ", options.max_header_size, " bytes");
                result.header = to_utf8(cursor.text());
                result.header_size = cursor.size();
                break;
            }
            THROW_PARSE_IF(cursor.size() > options.max_header_size,
                           "Header exceeds ", options.max_header_size, " bytes");
            from = std::min(cursor.rescan_from(cursor.size()), found.resume);
            cursor.read_chunk(options.header_bytes);
        }

        trace(options, base + result.header_size, "Header size ", result.header_size, " bytes");
        return result;
    }

    header_scan get_header(std::istream& stream, const parse_options& options) {
        reader source(stream);
        return scan_header(source, options);
    }
}
