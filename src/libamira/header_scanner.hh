//
// Created by igor on 13/10/2026.
//

#pragma once

#include <amira/parser.hh>

namespace amira {

    class reader_base;

    // Splits header and data streams, reading from an existing source
    header_scan scan_header(reader_base& source, const parse_options& options);
}
