//
// Created by igor on 15/10/2026.
//

#include "payload.hh"
#include "byte_cursor.hh"
#include "delimiters.hh"

namespace amira {

    payload_scan collect_payload(byte_cursor& cursor, const delimiter& until, bool keep, std::size_t chunk_size) {
        payload_scan result;

        auto take = [&](std::size_t n) {
            if (keep) {
                result.data.insert(result.data.end(), cursor.data(), cursor.data() + n);
            }
            result.length += n;
            cursor.consume(n);
        };

        for (;;) {
            auto found = until.search(cursor.text(), 0, cursor.exhausted());
            if (found.match) {
                take(found.match->start);
                if (!found.match->comment) {
                    result.terminated = true;
                    break;
                }
                cursor.consume(found.match->end - found.match->start);
                continue;
            }
            if (cursor.exhausted()) {
                take(cursor.size());
                break;
            }
            take(found.resume);
            cursor.read_chunk(chunk_size);
        }
        return result;
    }
}
