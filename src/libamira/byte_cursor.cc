//
// Created by igor on 12/10/2026.
//

#include "byte_cursor.hh"
#include "input.hh"
#include <algorithm>
#include <utility>

namespace amira {

    byte_cursor::byte_cursor(reader_base& source, std::size_t rescan_overlap,
                             std::vector<std::byte> initial, std::uint64_t initial_offset)
        : m_source(source)
        , m_rescan_overlap(rescan_overlap)
        , m_buffer(std::move(initial))
        , m_begin(0)
        , m_offset(initial_offset)
        , m_exhausted(false) {
    }

    std::size_t byte_cursor::read_chunk(std::size_t min_bytes) {
        if (m_exhausted || min_bytes == 0) {
            return 0;
        }
        compact();

        std::size_t total = 0;
        while (total < min_bytes) {
            std::size_t actual = m_source.read_append(m_buffer, min_bytes - total);
            if (actual == 0) {
                m_exhausted = true;
                break;
            }
            total += actual;
        }
        return total;
    }

    void byte_cursor::fill(std::size_t bytes, std::size_t chunk_size) {
        while (size() < bytes && !m_exhausted) {
            read_chunk(std::max(chunk_size, bytes - size()));
        }
    }

    std::string_view byte_cursor::text() const {
        return {reinterpret_cast<const char*>(m_buffer.data() + m_begin), size()};
    }

    void byte_cursor::consume(std::size_t n) {
        n = std::min(n, size());
        m_begin += n;
        m_offset += n;
    }

    std::vector<std::byte> byte_cursor::take(std::size_t n) {
        n = std::min(n, size());
        std::vector<std::byte> result(data(), data() + n);
        consume(n);
        return result;
    }

    std::vector<std::byte> byte_cursor::extract(std::uint64_t count, bool keep, std::uint64_t& extracted,
                                                std::size_t chunk_size) {
        std::vector<std::byte> result;
        if (count <= size()) {
            auto n = static_cast<std::size_t>(count);
            if (keep) {
                result.assign(data(), data() + n);
            }
            consume(n);
            extracted = count;
            return result;
        }

        // payload reaches beyond the window: take what is buffered and read
        // the rest straight from the source, never more than chunk_size at once
        std::uint64_t missing = count - size();
        extracted = size();
        if (keep) {
            result.assign(data(), data() + size());
        }
        consume(size());
        compact();

        if (!m_exhausted) {
            std::uint64_t got = 0;
            if (keep) {
                const std::uint64_t step = std::max<std::size_t>(chunk_size, 1);
                while (got < missing) {
                    auto want = static_cast<std::size_t>(std::min(missing - got, step));
                    auto actual = m_source.read_append(result, want);
                    if (actual == 0) {
                        break;
                    }
                    got += actual;
                }
            } else {
                got = m_source.skip(missing);
            }
            if (got < missing) {
                m_exhausted = true;
            }
            extracted += got;
            m_offset += got;
        }
        return result;
    }

    std::vector<std::byte> byte_cursor::release() {
        std::vector<std::byte> result(data(), data() + size());
        consume(size());
        compact();
        return result;
    }

    void byte_cursor::compact() {
        if (m_begin == 0) {
            return;
        }
        if (m_begin == m_buffer.size()) {
            m_buffer.clear();
        } else {
            m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_begin));
        }
        m_begin = 0;
    }
}
