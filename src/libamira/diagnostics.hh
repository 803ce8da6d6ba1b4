//
// Created by igor on 13/10/2026.
//

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <utility>

#include <amira/exceptions.hh>
#include <amira/parse_options.hh>

namespace amira {

    inline void warn(const parse_options& options, std::uint64_t offset,
                     std::string_view category, std::string_view message) {
        if (options.on_warning) {
            options.on_warning(offset, category, message);
        }
    }

    // Progress messages, reported only in verbose mode
    template<typename... Args>
    void trace(const parse_options& options, std::uint64_t offset, Args&&... args) {
        if (options.verbose && options.on_warning) {
            options.on_warning(offset, "verbose", build_error_msg(std::forward<Args>(args)...));
        }
    }

    // a * b, nullopt if the product does not fit
    inline std::optional<std::uint64_t> checked_multiply(std::uint64_t a, std::uint64_t b) {
        if (b != 0 && a > std::numeric_limits<std::uint64_t>::max() / b) {
            return std::nullopt;
        }
        return a * b;
    }

    inline void check_options(const parse_options& options) {
        THROW_PARSE_IF(options.header_bytes == 0, "header_bytes must be positive");
        THROW_PARSE_IF(options.stream_bytes == 0, "stream_bytes must be positive");
        THROW_PARSE_IF(options.format_bytes == 0, "format_bytes must be positive");
    }
}
