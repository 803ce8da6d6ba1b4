//
// Created by igor on 12/10/2026.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace amira {

    class reader_base;

    // Growable window over a byte source.
    //
    // The window holds the bytes read from the source which have not been
    // consumed yet. Consumed bytes are never read again. Scanning code
    // rescans the last rescan_overlap() bytes of the window after every
    // read so that a delimiter cut by the end of the previous read is
    // still found.
    class byte_cursor {
        public:
            // `initial` holds bytes already taken from the source, `initial_offset`
            // is the absolute file offset of its first byte
            byte_cursor(reader_base& source, std::size_t rescan_overlap,
                        std::vector<std::byte> initial, std::uint64_t initial_offset);

            byte_cursor(const byte_cursor&) = delete;
            byte_cursor& operator = (const byte_cursor&) = delete;

            // Pulls at least min_bytes new bytes unless the source runs dry.
            // Returns the number of bytes appended, 0 marks the source exhausted.
            std::size_t read_chunk(std::size_t min_bytes);

            // Reads until at least `bytes` are buffered or the source is exhausted
            void fill(std::size_t bytes, std::size_t chunk_size);

            [[nodiscard]] bool exhausted() const { return m_exhausted; }
            [[nodiscard]] bool empty() const { return size() == 0; }
            [[nodiscard]] std::size_t size() const { return m_buffer.size() - m_begin; }
            [[nodiscard]] std::size_t rescan_overlap() const { return m_rescan_overlap; }

            // Unconsumed bytes as characters, valid until the next read or consume
            [[nodiscard]] std::string_view text() const;
            [[nodiscard]] const std::byte* data() const { return m_buffer.data() + m_begin; }

            // Absolute file offset of the unconsumed byte at `pos`
            [[nodiscard]] std::uint64_t offset_of(std::size_t pos) const { return m_offset + pos; }

            // First position a scan must revisit once more bytes arrive
            [[nodiscard]] std::size_t rescan_from(std::size_t scanned_length) const {
                return scanned_length > m_rescan_overlap ? scanned_length - m_rescan_overlap : 0;
            }

            void consume(std::size_t n);
            [[nodiscard]] std::vector<std::byte> take(std::size_t n);

            // Takes exactly `count` bytes, reading the missing ones directly from
            // the source in steps of `chunk_size`. Returns fewer bytes only if the
            // source is exhausted, so memory grows with the bytes delivered, not
            // with `count`. With `keep` false the bytes are skipped and an empty
            // vector returned.
            std::vector<std::byte> extract(std::uint64_t count, bool keep, std::uint64_t& extracted,
                                           std::size_t chunk_size);

            // Hands out all unconsumed bytes
            [[nodiscard]] std::vector<std::byte> release();

        private:
            void compact();

            reader_base& m_source;
            std::size_t m_rescan_overlap;
            std::vector<std::byte> m_buffer;
            std::size_t m_begin;        // first unconsumed byte in m_buffer
            std::uint64_t m_offset;     // file offset of m_buffer[m_begin]
            bool m_exhausted;
    };
}
