//
// Created by igor on 14/10/2026.
//

#include <amira/header_parser.hh>
#include <amira/exceptions.hh>
#include "diagnostics.hh"
#include <algorithm>
#include <charconv>
#include <limits>
#include <utility>

namespace amira {

    namespace {

        bool is_alpha(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
        }

        bool is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        bool is_name_char(char c) {
            return is_alpha(c) || is_digit(c) || c == '-';
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) {
                s.remove_prefix(1);
            }
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
                s.remove_suffix(1);
            }
            return s;
        }

        // Hand-written descent over the header text. Every production either
        // consumes its input or leaves the position untouched.
        class header_grammar {
            public:
                header_grammar(std::string_view text, const parse_options& options)
                    : m_text(text), m_pos(0), m_options(options) {
                }

                parsed_header parse() {
                    parsed_header result;
                    designation(result.designation);
                    trace(m_options, 0, "Designation: ", to_string(result.designation.filetype),
                          " ", to_string(result.designation.format), " ", result.designation.version);

                    for (;;) {
                        skip_tsn();
                        if (at_end()) {
                            break;
                        }
                        if (peek() == '#') {
                            result.comments.push_back(comment());
                        } else if (keyword("define")) {
                            result.array_declarations.push_back(define_declaration());
                        } else if (keyword("Parameters")) {
                            parameter_block(result.parameters);
                        } else if (keyword("Materials")) {
                            materials(result.materials);
                        } else if (auto decl = short_declaration()) {
                            result.array_declarations.push_back(std::move(*decl));
                        } else {
                            result.data_definitions.push_back(data_definition_line());
                        }
                    }
                    trace(m_options, 0, "Parsed ", result.array_declarations.size(), " array declarations, ",
                          result.data_definitions.size(), " data definitions");
                    return result;
                }

            private:
                [[noreturn]] void fail(const std::string& msg) const {
                    auto line = static_cast<std::size_t>(std::count(m_text.begin(), m_text.begin() + m_pos, '\n')) + 1;
                    throw syntax_error(msg, line, std::string(m_text.substr(m_pos)));
                }

                bool at_end() const { return m_pos >= m_text.size(); }
                char peek() const { return at_end() ? '\0' : m_text[m_pos]; }

                void skip_ts() {
                    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
                        m_pos++;
                    }
                }

                void skip_tsn() {
                    while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r' || peek() == '\n')) {
                        m_pos++;
                    }
                }

                bool accept(char c) {
                    if (peek() == c) {
                        m_pos++;
                        return true;
                    }
                    return false;
                }

                void expect(char c, std::string_view what) {
                    if (!accept(c)) {
                        fail(build_error_msg("Expected '", c, "' ", what));
                    }
                }

                bool literal(std::string_view s) {
                    if (m_text.substr(m_pos, s.size()) == s) {
                        m_pos += s.size();
                        return true;
                    }
                    return false;
                }

                // literal word not followed by a name character
                bool keyword(std::string_view s) {
                    if (m_text.substr(m_pos, s.size()) != s) {
                        return false;
                    }
                    std::size_t e = m_pos + s.size();
                    if (e < m_text.size() && is_name_char(m_text[e])) {
                        return false;
                    }
                    m_pos = e;
                    return true;
                }

                std::string_view rest_of_line() {
                    std::size_t e = m_text.find('\n', m_pos);
                    if (e == std::string_view::npos) {
                        e = m_text.size();
                    }
                    auto line = m_text.substr(m_pos, e - m_pos);
                    m_pos = e;
                    return trim(line);
                }

                void end_of_line(std::string_view what) {
                    skip_ts();
                    if (!at_end() && !accept('\n')) {
                        fail(build_error_msg("Unexpected text after ", what));
                    }
                }

                std::string_view name() {
                    if (!is_alpha(peek())) {
                        return {};
                    }
                    std::size_t s = m_pos;
                    while (!at_end() && is_name_char(peek())) {
                        m_pos++;
                    }
                    return m_text.substr(s, m_pos - s);
                }

                std::string_view expect_name(std::string_view what) {
                    auto n = name();
                    if (n.empty()) {
                        fail(build_error_msg("Expected ", what));
                    }
                    return n;
                }

                std::optional<std::uint64_t> number() {
                    std::uint64_t value = 0;
                    auto first = m_text.data() + m_pos;
                    auto last = m_text.data() + m_text.size();
                    auto [ptr, ec] = std::from_chars(first, last, value);
                    if (ec != std::errc() || ptr == first) {
                        return std::nullopt;
                    }
                    m_pos += static_cast<std::size_t>(ptr - first);
                    return value;
                }

                std::uint64_t expect_number(std::string_view what) {
                    auto n = number();
                    if (!n) {
                        fail(build_error_msg("Expected ", what));
                    }
                    return *n;
                }

                // "# AmiraMesh [3D] <format> <version> [<hxsurface>]" or "# HyperSurface <version> <format>"
                void designation(designation_line& d) {
                    skip_tsn();
                    expect('#', "at start of designation line");
                    skip_ts();
                    if (keyword("AmiraMesh")) {
                        d.filetype = file_format::amira_mesh;
                    } else if (keyword("HyperSurface")) {
                        d.filetype = file_format::hyper_surface;
                    } else {
                        fail("Unknown file type in designation line");
                    }
                    skip_ts();
                    if (keyword("3D")) {
                        d.dimension = "3D";
                        skip_ts();
                    }
                    if (is_digit(peek())) {
                        d.version = std::string(version());
                        skip_ts();
                        d.format = encoding();
                    } else {
                        d.format = encoding();
                        skip_ts();
                        d.version = std::string(version());
                        skip_ts();
                        if (literal("<hxsurface>")) {
                            d.content_type = "hxsurface";
                        }
                    }
                    end_of_line("designation");
                }

                data_encoding encoding() {
                    // BINARY is a prefix of BINARY-LITTLE-ENDIAN
                    if (literal("BINARY-LITTLE-ENDIAN")) {
                        return data_encoding::binary_little_endian;
                    }
                    if (literal("BINARY")) {
                        return data_encoding::binary;
                    }
                    if (literal("ASCII")) {
                        return data_encoding::ascii;
                    }
                    fail("Unknown data format in designation line");
                }

                std::string_view version() {
                    std::size_t s = m_pos;
                    while (!at_end() && (is_digit(peek()) || peek() == '.')) {
                        m_pos++;
                    }
                    if (s == m_pos) {
                        fail("Expected version number");
                    }
                    return m_text.substr(s, m_pos - s);
                }

                comment_line comment() {
                    expect('#', "at start of comment");
                    skip_ts();
                    comment_line c;
                    if (literal("CreationDate:")) {
                        skip_ts();
                        c.creation_date = std::string(rest_of_line());
                        c.text = "CreationDate: " + *c.creation_date;
                    } else {
                        c.text = std::string(rest_of_line());
                    }
                    return c;
                }

                std::vector<std::uint64_t> dimensions() {
                    std::vector<std::uint64_t> dims;
                    dims.push_back(expect_number("array dimension"));
                    for (;;) {
                        skip_ts();
                        auto n = number();
                        if (!n) {
                            break;
                        }
                        dims.push_back(*n);
                    }
                    return dims;
                }

                // "define <name> <dim>..."
                array_declaration define_declaration() {
                    skip_ts();
                    array_declaration decl;
                    decl.name = std::string(expect_name("array name"));
                    skip_ts();
                    decl.dimension = dimensions();
                    end_of_line("array declaration");
                    return decl;
                }

                // "n<name> <dim>...", as written by old HyperSurface exporters
                std::optional<array_declaration> short_declaration() {
                    if (peek() != 'n') {
                        return std::nullopt;
                    }
                    std::size_t saved = m_pos;
                    m_pos++;
                    auto n = name();
                    skip_ts();
                    if (n.empty() || !is_digit(peek())) {
                        m_pos = saved;
                        return std::nullopt;
                    }
                    array_declaration decl;
                    decl.name = std::string(n);
                    decl.dimension = dimensions();
                    end_of_line("array declaration");
                    return decl;
                }

                // raw value text up to the end of the line, a ',' or '}' outside quotes
                std::string parameter_value() {
                    std::size_t s = m_pos;
                    bool quoted = false;
                    while (!at_end()) {
                        char c = peek();
                        if (c == '\n') {
                            break;
                        }
                        if (c == '"') {
                            quoted = !quoted;
                        } else if (!quoted && (c == ',' || c == '}')) {
                            break;
                        }
                        m_pos++;
                    }
                    if (quoted) {
                        fail("Unterminated quoted value");
                    }
                    auto value = trim(m_text.substr(s, m_pos - s));
                    if (value.size() >= 2 && value.front() == '"' && value.back() == '"' &&
                        value.find('"', 1) == value.size() - 1) {
                        value = value.substr(1, value.size() - 2);
                    }
                    return std::string(value);
                }

                void parameter_list(std::vector<parameter>& out) {
                    expect('{', "to open parameter block");
                    for (;;) {
                        skip_tsn();
                        if (at_end()) {
                            fail("Unterminated parameter block");
                        }
                        if (accept('}')) {
                            return;
                        }
                        if (peek() == '#') {
                            rest_of_line();
                            continue;
                        }
                        out.push_back(parameter_entry());
                    }
                }

                parameter parameter_entry() {
                    parameter p;
                    p.name = std::string(expect_name("parameter name"));
                    skip_ts();
                    if (peek() == '{') {
                        p.is_group = true;
                        parameter_list(p.children);
                    } else {
                        p.value = parameter_value();
                    }
                    skip_ts();
                    accept(',');
                    return p;
                }

                void parameter_block(std::vector<parameter>& out) {
                    skip_ts();
                    parameter_list(out);
                }

                // "Materials { { ... } { ... } }", every inner block is one material
                void materials(std::vector<parameter>& out) {
                    skip_tsn();
                    expect('{', "to open materials block");
                    for (;;) {
                        skip_tsn();
                        if (at_end()) {
                            fail("Unterminated materials block");
                        }
                        if (accept('}')) {
                            return;
                        }
                        parameter material;
                        material.is_group = true;
                        parameter_list(material.children);
                        auto named = std::find_if(material.children.begin(), material.children.end(),
                                                  [](const parameter& p) { return p.name == "Name"; });
                        material.name = named != material.children.end()
                                            ? named->value
                                            : "Material" + std::to_string(out.size() + 1);
                        out.push_back(std::move(material));
                    }
                }

                // "<array> { <type>[<n>] <name> } [=] [<interpolation>] [(]@<n>[)] [(<format>[,<length>])]"
                data_definition data_definition_line() {
                    data_definition def;
                    def.array_reference = std::string(expect_name("array reference or section keyword"));
                    skip_ts();
                    expect('{', "after array reference");
                    skip_ts();
                    def.data_type = std::string(expect_name("data type"));
                    if (accept('[')) {
                        def.data_dimension = expect_number("data dimension");
                        expect(']', "after data dimension");
                    }
                    skip_ts();
                    def.data_name = std::string(expect_name("data name"));
                    skip_ts();
                    expect('}', "after data name");
                    skip_ts();
                    if (accept('=')) {
                        skip_ts();
                    }
                    for (std::string_view method : {"Linear", "Constant", "EdgeElem"}) {
                        if (keyword(method)) {
                            def.interpolation = std::string(method);
                            skip_ts();
                            break;
                        }
                    }
                    bool wrapped = accept('(');
                    expect('@', "before data index");
                    const auto index = expect_number("data index");
                    if (index > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                        fail("Data index out of range");
                    }
                    def.data_index = static_cast<std::int64_t>(index);
                    if (wrapped) {
                        expect(')', "after data index");
                    }
                    skip_ts();
                    if (accept('(')) {
                        skip_ts();
                        for (std::string_view fmt : {"HxByteRLE", "HxZip"}) {
                            if (keyword(fmt)) {
                                def.data_format = std::string(fmt);
                                break;
                            }
                        }
                        if (def.data_format.empty()) {
                            fail("Unknown data format");
                        }
                        skip_ts();
                        if (accept(',')) {
                            skip_ts();
                            def.data_length = expect_number("data length");
                            skip_ts();
                        }
                        expect(')', "after data format");
                    }
                    end_of_line("data definition");
                    return def;
                }

                std::string_view m_text;
                std::size_t m_pos;
                const parse_options& m_options;
        };
    }

    parsed_header parse_header(std::string_view text, const parse_options& options) {
        return header_grammar(text, options).parse();
    }
}
