//
// Created by igor on 12/10/2026.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <amira/file_format.hh>

namespace amira {

    class stream_table;

    // Result of applying a delimiter pattern to a window of bytes
    struct delimiter_match {
        std::size_t start = 0;
        std::size_t end = 0;
        std::string stream;                     // keyword or stream index digits
        std::optional<std::uint64_t> count;
        std::optional<std::string> string;
        std::size_t value_start = 0;            // start of the count or string token
        std::size_t value_end = 0;              // end of the count or string token
        bool group = false;                     // group-open '{' on the marker line
        bool stop = false;                      // '}' terminator
        bool reopen = false;                    // '}' followed by '{'
        bool comment = false;
    };

    // Either a match or the position a later scan has to resume from.
    // `resume` lies before text.size() only if a candidate was cut by the
    // end of the window and may still match once more bytes arrive.
    struct search_result {
        std::optional<delimiter_match> match;
        std::size_t resume = 0;
    };

    // A delimiter pattern. search() returns the leftmost match starting at
    // or after `from`, never one to its left. `complete` tells the pattern
    // that no more bytes will follow the window.
    class delimiter {
        public:
            virtual ~delimiter() = default;

            [[nodiscard]] virtual search_result search(std::string_view text, std::size_t from, bool complete) const = 0;
            [[nodiscard]] virtual std::string_view name() const = 0;
    };

    // "@<n>" on a line of its own
    class amiramesh_marker : public delimiter {
        public:
            search_result search(std::string_view text, std::size_t from, bool complete) const override;
            std::string_view name() const override { return "amiramesh stream marker"; }
    };

    // "<keyword> [<count>|<token>] [{]" on a line of its own
    class hypersurface_marker : public delimiter {
        public:
            explicit hypersurface_marker(std::vector<std::string> keywords);
            search_result search(std::string_view text, std::size_t from, bool complete) const override;
            std::string_view name() const override { return "hypersurface stream marker"; }

        private:
            std::vector<std::string> m_keywords;
    };

    // "#" up to the end of the line, the newline is not part of the match
    class comment_marker : public delimiter {
        public:
            search_result search(std::string_view text, std::size_t from, bool complete) const override;
            std::string_view name() const override { return "comment"; }
    };

    // End of an ASCII payload: "}" optionally followed by "{" closing a line,
    // or the start of any keyword regardless of case
    class hypersurface_terminator : public delimiter {
        public:
            explicit hypersurface_terminator(std::vector<std::string> keywords);
            search_result search(std::string_view text, std::size_t from, bool complete) const override;
            std::string_view name() const override { return "hypersurface stream terminator"; }

        private:
            std::vector<std::string> m_keywords;
    };

    // Bare "}" optionally followed by "{"
    class close_brace : public delimiter {
        public:
            search_result search(std::string_view text, std::size_t from, bool complete) const override;
            std::string_view name() const override { return "close brace"; }
    };

    // Leftmost match of two patterns, ties go to the first
    class alternation : public delimiter {
        public:
            alternation(const delimiter& first, const delimiter& second);
            search_result search(std::string_view text, std::size_t from, bool complete) const override;
            std::string_view name() const override { return m_name; }

        private:
            const delimiter& m_first;
            const delimiter& m_second;
            std::string m_name;
    };

    // All patterns used for one stream table. Immutable once constructed.
    class delimiter_set {
        public:
            explicit delimiter_set(std::vector<std::string> keywords);
            explicit delimiter_set(const stream_table& table);

            delimiter_set(const delimiter_set&) = delete;
            delimiter_set& operator = (const delimiter_set&) = delete;

            // Patterns for the built-in HyperSurface stream table
            static const delimiter_set& hyper_surface();

            [[nodiscard]] const std::vector<std::string>& keywords() const { return m_keywords; }
            [[nodiscard]] std::size_t rescan_overlap() const { return m_rescan_overlap; }

            [[nodiscard]] const delimiter& amiramesh_stream() const { return m_amiramesh; }
            [[nodiscard]] const delimiter& hypersurface_stream() const { return m_hypersurface; }
            [[nodiscard]] const delimiter& comment() const { return m_comment; }
            [[nodiscard]] const delimiter& hypersurface_stop() const { return m_terminator; }
            [[nodiscard]] const delimiter& group_close() const { return m_close; }

            // stream marker or comment, for ASCII AmiraMesh payloads
            [[nodiscard]] const delimiter& amiramesh_ascii() const { return m_amiramesh_ascii; }
            // terminator or comment, for ASCII HyperSurface payloads
            [[nodiscard]] const delimiter& hypersurface_ascii() const { return m_hypersurface_ascii; }

            // Pattern marking the end of the header
            [[nodiscard]] const delimiter& header_end(file_format ff) const;

        private:
            std::vector<std::string> m_keywords;
            std::size_t m_rescan_overlap;
            amiramesh_marker m_amiramesh;
            hypersurface_marker m_hypersurface;
            comment_marker m_comment;
            hypersurface_terminator m_terminator;
            close_brace m_close;
            alternation m_amiramesh_ascii;
            alternation m_hypersurface_ascii;
    };
}
