#pragma once

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <algorithm>
#include <string_view>
#include <amira/header.hh>
#include <amira/parser.hh>
#include "unittest_config.h"

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    bool has_message(std::string_view text) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [text](const warning_info& w) { return w.message.find(text) != std::string::npos; });
    }

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};

// Utility function to load test files from the data directory
inline std::vector<std::byte> load_test_data(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_DATA_FILES);
    std::ifstream stream(root / name, std::ios::binary);
    if (!stream.good()) {
        throw std::runtime_error("Cannot open test file: " + name);
    }
    std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    std::vector<std::byte> data(content.size());
    std::memcpy(data.data(), content.data(), content.size());
    return data;
}

inline std::string test_file_path(const std::string& name) {
    return (std::filesystem::path(UNITTEST_PATH_TO_DATA_FILES) / name).string();
}

inline std::vector<std::byte> to_bytes(std::string_view text) {
    std::vector<std::byte> data(text.size());
    std::memcpy(data.data(), text.data(), text.size());
    return data;
}

inline std::string to_text(const std::vector<std::byte>& data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

inline std::istringstream make_stream(const std::vector<std::byte>& data) {
    return std::istringstream(to_text(data), std::ios::binary);
}

// Appends a value in big or little endian byte order
template<typename T>
void append_value(std::string& out, T value, bool big_endian) {
    unsigned char raw[sizeof(T)];
    std::memcpy(raw, &value, sizeof(T));
    const std::uint16_t one = 1;
    const bool host_little = *reinterpret_cast<const unsigned char*>(&one) == 1;
    if (host_little == big_endian) {
        for (std::size_t i = 0; i < sizeof(T) / 2; i++) {
            std::swap(raw[i], raw[sizeof(T) - 1 - i]);
        }
    }
    out.append(reinterpret_cast<const char*>(raw), sizeof(T));
}

inline amira::parse_result parse_bytes(const std::vector<std::byte>& data, const amira::parse_options& options = {}) {
    auto stream = make_stream(data);
    return amira::parse(stream, options);
}

// Flat textual rendering of everything the stream walkers produce
inline std::string describe(const amira::parsed_header& tree) {
    std::ostringstream os;
    auto value = [&os](const amira::stream_value& v) {
        if (const auto* n = std::get_if<std::int64_t>(&v)) {
            os << " int=" << *n;
        } else if (const auto* s = std::get_if<std::string>(&v)) {
            os << " str=" << *s;
        } else if (const auto* b = std::get_if<std::vector<std::byte>>(&v)) {
            os << " bytes=" << b->size() << ":" << to_text(*b);
        }
    };
    for (const auto& a : tree.array_declarations) {
        os << "array " << a.name;
        for (auto d : a.dimension) {
            os << " " << d;
        }
        if (a.is_list) {
            os << " list";
        }
        if (a.link) {
            os << " link=" << a.link->parent << "/" << a.link->item_id;
        }
        if (a.stream_offset) {
            os << " @" << *a.stream_offset;
        }
        value(a.value);
        os << "\n";
    }
    for (const auto& d : tree.data_definitions) {
        os << "data " << d.array_reference << "." << d.data_name << " " << d.data_type;
        if (d.data_dimension) {
            os << "[" << *d.data_dimension << "]";
        }
        if (d.data_shape) {
            os << " shape=" << *d.data_shape;
        }
        if (d.stream_offset) {
            os << " @" << *d.stream_offset;
        }
        value(d.stream_data);
        os << "\n";
    }
    return os.str();
}

// Binary HyperSurface file with one patch of one triangle
inline std::vector<std::byte> make_binary_surface(bool big_endian = true) {
    std::string s = big_endian ? "# HyperSurface 0.1 BINARY\n\n" : "# HyperSurface 0.1 BINARY-LITTLE-ENDIAN\n\n";
    s += "Parameters {\n    Materials {\n        Exterior {\n            Id 1\n        }\n    }\n}\n\n";
    s += "Vertices 3\n";
    const float coords[] = {0.0f, 0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f, 10.0f, 125.0f};
    for (float f : coords) {
        append_value(s, f, big_endian);
    }
    s += "\nNBranchingPoints 0\nNVerticesOnCurves 0\nBoundaryCurves 0\nPatches 1\n{\n";
    s += "InnerRegion Inside\nOuterRegion Exterior\nBoundaryID 0\nBranchingPoints 0\n\n";
    s += "Triangles 1\n";
    // 10 and 125 are the byte values of '\n' and '}'
    const std::int32_t triangle[] = {10, 125, 3};
    for (auto v : triangle) {
        append_value(s, v, big_endian);
    }
    s += "\n}\n";
    return to_bytes(s);
}
