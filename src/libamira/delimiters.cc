//
// Created by igor on 12/10/2026.
//

#include "delimiters.hh"
#include <amira/exceptions.hh>
#include <amira/stream_table.hh>
#include <algorithm>
#include <charconv>
#include <utility>

namespace amira {

    namespace {
        constexpr auto npos = std::string_view::npos;

        enum class attempt {
            matched,
            failed,
            incomplete
        };

        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        bool is_hspace(char c) {
            return c != '\n' && is_space(c);
        }

        bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        char to_lower(char c) {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        bool iequals(std::string_view a, std::string_view b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(),
                              [](char x, char y) { return to_lower(x) == to_lower(y); });
        }

        std::size_t skip_space(std::string_view text, std::size_t pos) {
            while (pos < text.size() && is_space(text[pos])) {
                ++pos;
            }
            return pos;
        }

        std::size_t skip_hspace(std::string_view text, std::size_t pos) {
            while (pos < text.size() && is_hspace(text[pos])) {
                ++pos;
            }
            return pos;
        }

        // end of data counts as end of line once no more bytes will follow
        attempt at_end(bool complete, delimiter_match& m, std::size_t n) {
            if (!complete) {
                return attempt::incomplete;
            }
            m.end = n;
            return attempt::matched;
        }

        // Tries every line start at or after `from`. The very first byte of
        // the window counts as a line start only when scanning starts there.
        template<typename Try>
        search_result scan_line_starts(std::string_view text, std::size_t from, Try&& try_at) {
            const std::size_t n = text.size();
            std::size_t pos = from;
            bool first = (from == 0);
            while (pos < n || first) {
                std::size_t candidate;
                if (first) {
                    candidate = 0;
                    first = false;
                } else {
                    candidate = text.find('\n', pos);
                    if (candidate == npos) {
                        break;
                    }
                }
                if (candidate >= n) {
                    break;
                }

                delimiter_match m;
                m.start = candidate;
                // position past the leading whitespace; line starts before it
                // lead to the same keyword and need no second look
                std::size_t next = candidate + 1;
                switch (try_at(candidate, m, next)) {
                    case attempt::matched:
                        return {std::move(m), 0};
                    case attempt::incomplete:
                        return {std::nullopt, candidate};
                    case attempt::failed:
                        break;
                }
                pos = std::max(next, candidate + 1);
            }
            return {std::nullopt, n};
        }

        search_result leftmost(search_result a, search_result b) {
            if (a.match && b.match) {
                return b.match->start < a.match->start ? std::move(b) : std::move(a);
            }
            if (a.match) {
                if (b.resume < a.match->start) {
                    return {std::nullopt, b.resume};
                }
                return a;
            }
            if (b.match) {
                if (a.resume <= b.match->start) {
                    return {std::nullopt, a.resume};
                }
                return b;
            }
            return {std::nullopt, std::min(a.resume, b.resume)};
        }
    }

    // amiramesh_marker

    search_result amiramesh_marker::search(std::string_view text, std::size_t from, bool complete) const {
        const std::size_t n = text.size();
        return scan_line_starts(text, from,
            [&](std::size_t candidate, delimiter_match& m, std::size_t& next) {
                std::size_t q = skip_space(text, candidate);
                next = q;
                if (q == n) {
                    return complete ? attempt::failed : attempt::incomplete;
                }
                if (text[q] != '@') {
                    return attempt::failed;
                }
                std::size_t d = q + 1;
                while (d < n && is_digit(text[d])) {
                    ++d;
                }
                if (d == q + 1) {
                    return (d == n && !complete) ? attempt::incomplete : attempt::failed;
                }
                m.stream = std::string(text.substr(q + 1, d - q - 1));
                m.value_start = q + 1;
                m.value_end = d;
                std::size_t i = skip_hspace(text, d);
                if (i == n) {
                    return at_end(complete, m, n);
                }
                if (text[i] != '\n') {
                    return attempt::failed;
                }
                m.end = i + 1;
                return attempt::matched;
            });
    }

    // hypersurface_marker

    hypersurface_marker::hypersurface_marker(std::vector<std::string> keywords)
        : m_keywords(std::move(keywords)) {
    }

    search_result hypersurface_marker::search(std::string_view text, std::size_t from, bool complete) const {
        const std::size_t n = text.size();

        auto rest_of_line = [&](std::size_t k, delimiter_match& m) {
            if (k == n) {
                return at_end(complete, m, n);
            }
            char c = text[k];
            if (!is_hspace(c) && c != '\n' && c != '{') {
                return attempt::failed;
            }

            std::size_t h = skip_hspace(text, k);
            if (h == n) {
                return at_end(complete, m, n);
            }

            std::size_t i = h;
            if (h > k && text[h] != '\n' && text[h] != '{') {
                std::size_t v = h;
                while (v < n && text[v] != '\n' && text[v] != '{') {
                    ++v;
                }
                if (v == n && !complete) {
                    return attempt::incomplete;
                }
                std::size_t e = v;
                while (e > h && is_hspace(text[e - 1])) {
                    --e;
                }
                auto token = text.substr(h, e - h);
                std::uint64_t count = 0;
                auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), count);
                if (ec == std::errc() && ptr == token.data() + token.size()) {
                    m.count = count;
                } else {
                    m.string = std::string(token);
                }
                m.value_start = h;
                m.value_end = e;
                i = v;
            } else {
                m.value_start = k;
                m.value_end = k;
            }

            if (i < n && text[i] == '{') {
                m.group = true;
                i = skip_hspace(text, i + 1);
            }
            if (i == n) {
                return at_end(complete, m, n);
            }
            if (text[i] != '\n') {
                return attempt::failed;
            }
            m.end = i + 1;
            return attempt::matched;
        };

        return scan_line_starts(text, from,
            [&](std::size_t candidate, delimiter_match& m, std::size_t& next) {
                std::size_t q = skip_space(text, candidate);
                next = q;
                if (q == n) {
                    return complete ? attempt::failed : attempt::incomplete;
                }
                bool pending = false;
                for (const auto& kw : m_keywords) {
                    std::size_t avail = n - q;
                    if (avail < kw.size()) {
                        if (!complete && text.substr(q) == std::string_view(kw).substr(0, avail)) {
                            pending = true;
                        }
                        continue;
                    }
                    if (text.compare(q, kw.size(), kw) != 0) {
                        continue;
                    }
                    delimiter_match attempt_match = m;
                    attempt_match.stream = kw;
                    auto result = rest_of_line(q + kw.size(), attempt_match);
                    if (result == attempt::matched) {
                        m = std::move(attempt_match);
                        return attempt::matched;
                    }
                    if (result == attempt::incomplete) {
                        return attempt::incomplete;
                    }
                }
                return pending ? attempt::incomplete : attempt::failed;
            });
    }

    // comment_marker

    search_result comment_marker::search(std::string_view text, std::size_t from, bool complete) const {
        const std::size_t n = text.size();
        std::size_t pos = from < n ? text.find('#', from) : npos;
        if (pos == npos) {
            return {std::nullopt, n};
        }
        std::size_t nl = text.find('\n', pos);
        if (nl == npos) {
            if (!complete) {
                return {std::nullopt, pos};
            }
            nl = n;
        }
        delimiter_match m;
        m.start = pos;
        m.end = nl;
        m.comment = true;
        return {std::move(m), 0};
    }

    // hypersurface_terminator

    hypersurface_terminator::hypersurface_terminator(std::vector<std::string> keywords)
        : m_keywords(std::move(keywords)) {
    }

    search_result hypersurface_terminator::search(std::string_view text, std::size_t from, bool complete) const {
        const std::size_t n = text.size();

        // "}" closing a line, optionally re-opened by "{"
        search_result brace{std::nullopt, n};
        for (std::size_t b = from < n ? text.find('}', from) : npos; b != npos; b = text.find('}', b + 1)) {
            std::size_t s = b;
            while (s > from && is_space(text[s - 1])) {
                --s;
            }
            delimiter_match m;
            m.start = s;
            m.stop = true;

            std::size_t t = skip_space(text, b + 1);
            if (t == n && !complete) {
                brace.resume = s;
                break;
            }
            if (t < n && text[t] == '{') {
                std::size_t u = skip_hspace(text, t + 1);
                if (u == n && !complete) {
                    brace.resume = s;
                    break;
                }
                if (u == n || text[u] == '\n') {
                    m.reopen = true;
                    m.end = u == n ? n : u + 1;
                    brace.match = std::move(m);
                    break;
                }
            }
            std::size_t i = skip_hspace(text, b + 1);
            if (i == n && !complete) {
                brace.resume = s;
                break;
            }
            if (i == n || text[i] == '\n') {
                m.end = i == n ? n : i + 1;
                brace.match = std::move(m);
                break;
            }
        }
        if (!brace.match && brace.resume == n && !complete) {
            // trailing whitespace may turn out to lead a "}" not read yet
            std::size_t r = n;
            while (r > from && is_space(text[r - 1])) {
                --r;
            }
            if (r < n) {
                brace.resume = r;
            }
        }

        // any keyword, regardless of case, anywhere
        search_result keyword{std::nullopt, n};
        std::size_t limit = brace.match ? brace.match->start : brace.resume;
        for (std::size_t i = from; i < n && i < limit && !keyword.match && keyword.resume == n; ++i) {
            for (const auto& kw : m_keywords) {
                std::size_t avail = n - i;
                if (avail < kw.size()) {
                    if (!complete && iequals(text.substr(i), std::string_view(kw).substr(0, avail))) {
                        keyword.resume = i;
                        break;
                    }
                    continue;
                }
                if (iequals(text.substr(i, kw.size()), kw)) {
                    delimiter_match m;
                    m.start = i;
                    m.end = i + kw.size();
                    m.stream = kw;
                    m.stop = true;
                    keyword.match = std::move(m);
                    break;
                }
            }
        }

        return leftmost(std::move(brace), std::move(keyword));
    }

    // close_brace

    search_result close_brace::search(std::string_view text, std::size_t from, bool) const {
        const std::size_t n = text.size();
        std::size_t b = from < n ? text.find('}', from) : npos;
        if (b == npos) {
            return {std::nullopt, n};
        }
        delimiter_match m;
        m.start = b;
        m.end = b + 1;
        m.stop = true;
        std::size_t t = skip_space(text, b + 1);
        if (t < n && text[t] == '{') {
            m.reopen = true;
            m.end = t + 1;
        }
        return {std::move(m), 0};
    }

    // alternation

    alternation::alternation(const delimiter& first, const delimiter& second)
        : m_first(first)
        , m_second(second)
        , m_name(std::string(first.name()) + " or " + std::string(second.name())) {
    }

    search_result alternation::search(std::string_view text, std::size_t from, bool complete) const {
        return leftmost(m_first.search(text, from, complete), m_second.search(text, from, complete));
    }

    // delimiter_set

    delimiter_set::delimiter_set(std::vector<std::string> keywords)
        : m_keywords(std::move(keywords))
        , m_rescan_overlap(rescan_overlap_for(m_keywords))
        , m_amiramesh()
        , m_hypersurface(m_keywords)
        , m_comment()
        , m_terminator(m_keywords)
        , m_close()
        , m_amiramesh_ascii(m_amiramesh, m_comment)
        , m_hypersurface_ascii(m_terminator, m_comment) {
    }

    delimiter_set::delimiter_set(const stream_table& table)
        : delimiter_set(table.keywords()) {
    }

    const delimiter_set& delimiter_set::hyper_surface() {
        static const delimiter_set set(stream_table::hyper_surface());
        return set;
    }

    const delimiter& delimiter_set::header_end(file_format ff) const {
        switch (ff) {
            case file_format::amira_mesh:
                return m_amiramesh;
            case file_format::hyper_surface:
                return m_hypersurface;
            case file_format::undefined:
                break;
        }
        THROW_FORMAT("Unable to parse undefined file");
    }
}
