//
// Created by igor on 13/10/2026.
//

#pragma once

#include <cstddef>
#include <string_view>

#include <amira/parser.hh>

namespace amira {

    class reader_base;

    // Reads at least max(50, min_bytes) bytes from the source and classifies them
    format_detection detect_format(reader_base& source, std::size_t min_bytes, const parse_options& options);

    // Designation rule applied to the first bytes of a file
    file_format classify(std::string_view head);

    // Header bytes as UTF-8, invalid sequences replaced by U+FFFD
    std::string to_utf8(std::string_view bytes);
}
