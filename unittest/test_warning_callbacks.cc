//
// Test warning callback functionality across different scenarios
//

#include <doctest/doctest.h>
#include <amira/parser.hh>
#include <amira/parse_options.hh>
#include <amira/exceptions.hh>
#include "test_utils.hh"
#include <functional>

using namespace amira;

namespace {
    const std::string surface_head = "# HyperSurface 0.1 ASCII\n\nParameters {\n}\n\n";
    const std::string vertices = "Vertices 3\n0 0 0\n1 0 0\n0 1 0\n";
    const std::string patch = "{\nInnerRegion Inside\nOuterRegion Exterior\nTriangles 1\n1 2 3\n}\n";

    warning_tracker parse_tracked(const std::string& content, bool verbose = false) {
        warning_tracker tracker;
        parse_options options;
        options.verbose = verbose;
        options.on_warning = std::ref(tracker);
        parse_bytes(to_bytes(content), options);
        return tracker;
    }
}

TEST_CASE("Warning callbacks - verbose messages") {
    SUBCASE("HyperSurface") {
        auto tracker = parse_tracked(surface_head + vertices + "Patches 1\n" + patch, true);
        CHECK(tracker.has_message("HyperSurface file detected"));
        CHECK(tracker.has_message("Using pattern: hypersurface stream marker"));
        CHECK(tracker.has_message("Header size "));
        CHECK(tracker.has_message("Found 'Vertices' stream"));
        CHECK(tracker.has_message("Item 'Patch1' of 'Patches' group"));
        CHECK(tracker.has_message("End of 'Patches' group"));
        CHECK(tracker.count_category("verbose") == tracker.warnings.size());
    }

    SUBCASE("AmiraMesh") {
        auto tracker = parse_tracked("# AmiraMesh ASCII 2.0\n\ndefine Nodes 2\n\n"
                                     "Nodes { float X } @1\n\n@1\n0.5 1.5\n", true);
        CHECK(tracker.has_message("AmiraMesh file detected"));
        CHECK(tracker.has_message("Using pattern: amiramesh stream marker"));
        CHECK(tracker.has_message("Found stream @1"));
        CHECK_FALSE(tracker.has_warning("stream"));
    }

    SUBCASE("silent without verbose") {
        auto tracker = parse_tracked(surface_head + vertices + "Patches 1\n" + patch);
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("Warning callbacks - HyperSurface streams") {
    SUBCASE("value count mismatch is an error") {
        warning_tracker tracker;
        parse_options options;
        options.on_warning = std::ref(tracker);
        CHECK_THROWS_WITH_AS(parse_bytes(to_bytes(surface_head + "Vertices 3\n0 0 0\n1 0 0\nPatches 1\n" + patch),
                                         options),
                             "'Vertices' stream holds 6 values, 9 expected", stream_error);
        CHECK(tracker.warnings.empty());
    }

    SUBCASE("unexpected bytes between streams") {
        auto tracker = parse_tracked(surface_head + vertices +
                                     "NBranchingPoints 0\ngarbage\nNVerticesOnCurves 0\nPatches 1\n" + patch);
        CHECK(tracker.has_message("Ignoring 7 unexpected bytes between streams"));
    }

    SUBCASE("closing brace outside of a group") {
        auto tracker = parse_tracked(surface_head + vertices + "Patches 1\n" + patch + "}\n");
        CHECK(tracker.has_message("Ignoring '}' outside of any group"));
    }

    SUBCASE("repeated stream") {
        auto tracker = parse_tracked(surface_head + vertices +
                                     "Patches 1\n{\nInnerRegion Inside\nInnerRegion Other\n"
                                     "OuterRegion Exterior\nTriangles 1\n1 2 3\n}\n");
        CHECK(tracker.has_message("'InnerRegion' stream repeated on 'Patch1'"));
    }

    SUBCASE("warnings carry file offsets") {
        const std::string content = surface_head + vertices +
                                    "NBranchingPoints 0\ngarbage\nNVerticesOnCurves 0\nPatches 1\n" + patch;
        auto tracker = parse_tracked(content);
        REQUIRE(tracker.warnings.size() == 1);
        CHECK(tracker.warnings[0].offset == content.find("garbage"));
    }
}

TEST_CASE("Warning callbacks - AmiraMesh streams") {
    const std::string head = "# AmiraMesh BINARY-LITTLE-ENDIAN 2.1\n\ndefine Nodes 1\n\nNodes { int X } @1\n\n@1\n";

    SUBCASE("bytes behind the last stream") {
        auto tracker = parse_tracked(head + std::string("\x01\x00\x00\x00", 4) + "\njunk\n");
        REQUIRE(tracker.count_category("stream") == 1);
        CHECK(tracker.warnings[0].message == "Ignoring 4 bytes behind the last stream");
    }

    SUBCASE("bytes before a stream marker") {
        auto tracker = parse_tracked("# AmiraMesh BINARY-LITTLE-ENDIAN 2.1\n\ndefine Nodes 1\n\n"
                                     "Nodes { int X } @1\nNodes { int Y } @2\n\n@1\n" +
                                     std::string("\x01\x00\x00\x00", 4) + "\nxx\n@2\n" +
                                     std::string("\x02\x00\x00\x00", 4) + "\n");
        CHECK(tracker.has_message("Ignoring 2 unexpected bytes before stream @2"));
    }
}

TEST_CASE("Warning callbacks - no handler") {
    parse_options options;
    options.verbose = true;
    CHECK_NOTHROW(parse_bytes(to_bytes(surface_head + vertices + "NBranchingPoints 0\nx\nPatches 1\n" + patch), options));
}

TEST_CASE("Warning callbacks - errors are not warnings") {
    warning_tracker tracker;
    parse_options options;
    options.on_warning = std::ref(tracker);
    CHECK_THROWS_AS(parse_bytes(to_bytes(surface_head + vertices + "Patches 2\n" + patch), options), stream_error);
    CHECK_FALSE(tracker.has_warning("stream"));
}
