//
// Created by igor on 15/10/2026.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace amira {

    class byte_cursor;
    class delimiter;

    struct payload_scan {
        std::vector<std::byte> data;    // empty unless kept
        std::uint64_t length = 0;       // payload bytes without comments
        bool terminated = false;        // stopped at a delimiter, not at end of data
    };

    // Collects bytes up to the first match of `until` which is not a comment.
    // Comment matches are cut out of the payload. The terminating match stays
    // in the window.
    payload_scan collect_payload(byte_cursor& cursor, const delimiter& until, bool keep, std::size_t chunk_size);
}
