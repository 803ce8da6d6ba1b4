//
// Created by igor on 12/10/2026.
//

#include <istream>
#include <array>
#include <algorithm>

#include "input.hh"

namespace amira {
    // reader_base implementation
    std::size_t reader_base::read_append(std::vector<std::byte>& buffer, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        const std::size_t old_size = buffer.size();
        buffer.resize(old_size + size);
        std::size_t actual = 0;
        try {
            actual = read(buffer.data() + old_size, size);
        } catch (const io_error&) {
            buffer.resize(old_size);
            throw;
        }
        buffer.resize(old_size + actual);
        return actual;
    }

    std::uint64_t reader_base::skip(std::uint64_t size) {
        std::array<std::byte, 4096> scratch;
        std::uint64_t skipped = 0;
        while (skipped < size) {
            auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(scratch.size(), size - skipped));
            std::size_t actual = read(scratch.data(), chunk);
            if (actual == 0) {
                break;
            }
            skipped += actual;
        }
        return skipped;
    }

    // reader implementation
    reader::reader(std::istream& is)
        : m_stream(is), m_position(0) {
        auto pos = m_stream.tellg();
        if (pos != std::streampos(-1)) {
            m_position = static_cast<std::uint64_t>(pos);
        }
        // tellg() sets failbit on streams which are not seekable
        if (!m_stream.bad()) {
            m_stream.clear(m_stream.rdstate() & std::ios::eofbit);
        }
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state at offset ", m_position);

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position);
        m_position += bytes_read;
        return bytes_read;
    }
}
