//
// Test splitting files into header and data streams
//

#include <doctest/doctest.h>
#include <amira/parser.hh>
#include <amira/exceptions.hh>
#include "test_utils.hh"
#include <sstream>

using namespace amira;

namespace {
    // Little-endian lattice of 250 floats; the payload holds a line which
    // looks like a stream marker
    std::string make_lattice_file() {
        std::string s = "# AmiraMesh BINARY-LITTLE-ENDIAN 2.1\n\n\n"
                        "define Lattice 250\n\n"
                        "Parameters {\n"
                        "    Content \"250 float, uniform coordinates\",\n"
                        "    BoundingBox 0 249 0 0 0 0,\n"
                        "    CoordType \"uniform\"\n"
                        "}\n\n"
                        "Lattice { float Data } @1\n\n"
                        "# Data section follows\n"
                        "@1\n";
        std::string payload(1000, '\0');
        payload.replace(400, 4, "\n@2\n");
        return s + payload + "\n";
    }

    header_scan scan(const std::string& content, const parse_options& options = {}) {
        std::istringstream stream(content, std::ios::binary);
        return get_header(stream, options);
    }
}

TEST_CASE("AmiraMesh header") {
    const std::string content = make_lattice_file();
    const auto header_end = content.find("\n@1\n");

    auto result = scan(content);
    CHECK(result.format == file_format::amira_mesh);
    CHECK(result.header_size == header_end);
    CHECK(result.header == content.substr(0, header_end));
    CHECK(result.header.find("# Data section follows") != std::string::npos);
    CHECK(to_text(result.remainder).substr(0, 4) == "\n@1\n");
    CHECK(result.header_size + result.remainder.size() == content.size());

    SUBCASE("independent of the chunk size") {
        for (std::size_t chunk : {1, 3, 16, 47, 48, 49, 64, 1000, 65536}) {
            CAPTURE(chunk);
            parse_options options;
            options.header_bytes = chunk;
            auto chunked = scan(content, options);
            CHECK(chunked.format == result.format);
            CHECK(chunked.header == result.header);
            CHECK(chunked.header_size == result.header_size);
            CHECK(to_text(chunked.remainder).substr(0, 4) == "\n@1\n");
        }
    }

    SUBCASE("repeated scans give the same result") {
        auto again = scan(content);
        CHECK(again.header == result.header);
        CHECK(again.header_size == result.header_size);
        CHECK(again.remainder == result.remainder);
    }
}

TEST_CASE("Remainder continues the stream") {
    const std::string content = make_lattice_file();
    std::istringstream stream(content, std::ios::binary);
    parse_options options;
    options.header_bytes = 64;
    auto result = get_header(stream, options);

    std::string rest((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    CHECK(result.header + to_text(result.remainder) + rest == content);
}

TEST_CASE("HyperSurface header") {
    const std::string content = to_text(load_test_data("surface_ascii.surf"));
    const auto header_end = content.find("\n\nVertices 4\n");

    auto result = scan(content);
    CHECK(result.format == file_format::hyper_surface);
    CHECK(result.header_size == header_end);
    CHECK(result.header.substr(0, 26) == "# HyperSurface 0.1 ASCII\n\n");
    CHECK(result.header.back() == '}');
    CHECK(to_text(result.remainder).substr(0, 13) == "\n\nVertices 4\n");

    SUBCASE("chunked") {
        for (std::size_t chunk : {1, 7, 64, 1024}) {
            CAPTURE(chunk);
            parse_options options;
            options.header_bytes = chunk;
            auto chunked = scan(content, options);
            CHECK(chunked.header == result.header);
            CHECK(chunked.header_size == result.header_size);
        }
    }

    SUBCASE("binary payload behind the header") {
        const auto binary = to_text(make_binary_surface());
        auto bin = scan(binary);
        CHECK(bin.header_size == binary.find("\n\nVertices 3\n"));
        CHECK(bin.header.find("Exterior") != std::string::npos);
    }
}

TEST_CASE("Header without data streams") {
    const std::string content = "# AmiraMesh ASCII 2.0\n\ndefine Nodes 3\n\nParameters {\n}\n";
    parse_options options;
    options.header_bytes = 5;
    auto result = scan(content, options);
    CHECK(result.header == content);
    CHECK(result.header_size == content.size());
    CHECK(result.remainder.empty());
}

TEST_CASE("Header size limit") {
    const std::string content = make_lattice_file();
    parse_options options;
    options.header_bytes = 32;

    SUBCASE("header above the limit") {
        options.max_header_size = 100;
        CHECK_THROWS_AS(scan(content, options), parse_error);
    }

    SUBCASE("header within the limit") {
        options.max_header_size = 1000;
        CHECK_NOTHROW(scan(content, options));
    }

    SUBCASE("file without marker above the limit") {
        options.max_header_size = 20;
        CHECK_THROWS_WITH_AS(scan("# AmiraMesh ASCII 2.0\n\ndefine Nodes 3\n", options),
                             "Header exceeds 20 bytes", parse_error);
    }
}

TEST_CASE("Invalid chunk sizes") {
    parse_options options;
    options.header_bytes = 0;
    CHECK_THROWS_AS(scan(make_lattice_file(), options), parse_error);
}

TEST_CASE("Scanner progress messages") {
    warning_tracker tracker;
    parse_options options;
    options.verbose = true;
    options.on_warning = std::ref(tracker);

    scan(make_lattice_file(), options);
    CHECK(tracker.has_message("Using pattern: amiramesh stream marker"));
    CHECK(tracker.count_category("verbose") == tracker.warnings.size());
}
