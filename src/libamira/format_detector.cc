//
// Created by igor on 13/10/2026.
//

#include "format_detector.hh"
#include "diagnostics.hh"
#include "input.hh"
#include <algorithm>
#include <fstream>

namespace amira {

    namespace {
        constexpr std::size_t minimal_format_bytes = 50;

        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        // length of the UTF-8 sequence starting at text[i], 0 if invalid
        std::size_t utf8_sequence(std::string_view text, std::size_t i) {
            auto lead = static_cast<unsigned char>(text[i]);
            std::size_t length;
            std::uint32_t min_code;
            if (lead < 0x80) {
                return 1;
            }
            if ((lead & 0xE0) == 0xC0) {
                length = 2;
                min_code = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                length = 3;
                min_code = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                length = 4;
                min_code = 0x10000;
            } else {
                return 0;
            }
            if (i + length > text.size()) {
                return 0;
            }
            std::uint32_t code = lead & (0x7F >> length);
            for (std::size_t k = 1; k < length; k++) {
                auto c = static_cast<unsigned char>(text[i + k]);
                if ((c & 0xC0) != 0x80) {
                    return 0;
                }
                code = (code << 6) | (c & 0x3F);
            }
            if (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
                return 0;
            }
            return length;
        }
    }

    file_format classify(std::string_view head) {
        std::size_t i = 0;
        while (i < head.size() && is_space(head[i])) {
            i++;
        }
        if (i == head.size() || head[i] != '#') {
            return file_format::undefined;
        }
        i++;
        while (i < head.size() && is_space(head[i])) {
            i++;
        }
        for (auto ff : {file_format::amira_mesh, file_format::hyper_surface}) {
            auto name = to_string(ff);
            if (head.substr(i, name.size()) != name) {
                continue;
            }
            std::size_t e = i + name.size();
            if (e == head.size() || is_space(head[e])) {
                return ff;
            }
        }
        return file_format::undefined;
    }

    std::string to_utf8(std::string_view bytes) {
        std::string result;
        result.reserve(bytes.size());
        std::size_t i = 0;
        while (i < bytes.size()) {
            std::size_t n = utf8_sequence(bytes, i);
            if (n == 0) {
                result += "\xEF\xBF\xBD";
                i++;
            } else {
                result.append(bytes.substr(i, n));
                i += n;
            }
        }
        return result;
    }

    format_detection detect_format(reader_base& source, std::size_t min_bytes, const parse_options& options) {
        const auto offset = source.position();
        const std::size_t wanted = std::max(minimal_format_bytes, min_bytes);

        format_detection result;
        result.bytes.reserve(wanted);
        while (result.bytes.size() < wanted) {
            if (source.read_append(result.bytes, wanted - result.bytes.size()) == 0) {
                break;
            }
        }

        std::string_view head(reinterpret_cast<const char*>(result.bytes.data()), result.bytes.size());
        result.format = classify(head);
        trace(options, offset, to_string(result.format), " file detected");
        return result;
    }

    format_detection detect_format(std::istream& stream, const parse_options& options) {
        check_options(options);
        reader source(stream);
        return detect_format(source, options.format_bytes, options);
    }

    file_format detect_format(const std::filesystem::path& path, const parse_options& options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file.is_open(), "Cannot open file: ", path.string());
        return detect_format(file, options).format;
    }
}
