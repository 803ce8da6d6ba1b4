//
// Created by igor on 15/10/2026.
//

#include <amira/stream_decode.hh>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <variant>

namespace amira {

    namespace {
        bool is_space(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        template<typename T>
        std::vector<double> widen(const std::vector<std::byte>& bytes, byte_order order) {
            auto values = decode_binary<T>(bytes, order);
            return {values.begin(), values.end()};
        }
    }

    std::vector<double> decode_ascii(const std::vector<std::byte>& bytes) {
        std::vector<double> values;
        const std::string text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        std::size_t i = 0;
        while (i < text.size()) {
            while (i < text.size() && is_space(text[i])) {
                i++;
            }
            if (i == text.size()) {
                break;
            }
            std::size_t e = i;
            while (e < text.size() && !is_space(text[e])) {
                e++;
            }
            const std::string token = text.substr(i, e - i);
            char* end = nullptr;
            double value = std::strtod(token.c_str(), &end);
            THROW_STREAM_IF(end != token.c_str() + token.size(), "Not a number: '", token, "'");
            values.push_back(value);
            i = e;
        }
        return values;
    }

    std::vector<double> decode_values(const data_definition& def, data_encoding encoding) {
        const auto* bytes = std::get_if<std::vector<std::byte>>(&def.stream_data);
        THROW_STREAM_IF(bytes == nullptr, "'", def.array_reference, ".", def.data_name, "' carries no payload");
        THROW_STREAM_IF(!def.data_format.empty(), "Cannot decode ", def.data_format, " compressed payload");

        if (!is_binary(encoding)) {
            return decode_ascii(*bytes);
        }
        const auto order = encoding_byte_order(encoding);
        const auto& type = def.data_type;
        if (type == "byte" || type == "char") {
            return widen<std::int8_t>(*bytes, order);
        }
        if (type == "ubyte") {
            return widen<std::uint8_t>(*bytes, order);
        }
        if (type == "short") {
            return widen<std::int16_t>(*bytes, order);
        }
        if (type == "ushort") {
            return widen<std::uint16_t>(*bytes, order);
        }
        if (type == "int") {
            return widen<std::int32_t>(*bytes, order);
        }
        if (type == "long" || type == "int64") {
            return widen<std::int64_t>(*bytes, order);
        }
        if (type == "float") {
            return widen<float>(*bytes, order);
        }
        if (type == "double") {
            return widen<double>(*bytes, order);
        }
        THROW_STREAM("Unknown data type '", type, "'");
    }
}
