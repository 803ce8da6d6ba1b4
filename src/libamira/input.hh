//
// Created by igor on 12/10/2026.
//

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <amira/exceptions.hh>

namespace amira {

    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Reads up to size bytes, returns 0 at end of source - throws on error
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            // Absolute offset of the next byte to be read
            virtual std::uint64_t position() const = 0;

            // Appends up to size bytes to buffer, returns the number appended
            std::size_t read_append(std::vector<std::byte>& buffer, std::size_t size);

            // Reads and drops up to size bytes, returns the number skipped
            std::uint64_t skip(std::uint64_t size);
    };

    // Main reader class - reads from stream without limits
    class reader : public reader_base {
        public:
            explicit reader(std::istream& is);
            ~reader() override = default;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t position() const override { return m_position; }

        private:
            std::istream& m_stream;
            std::uint64_t m_position;
    };
}
