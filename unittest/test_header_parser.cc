//
// Test the header grammar
//

#include <doctest/doctest.h>
#include <amira/header_parser.hh>
#include <amira/parser.hh>
#include <amira/exceptions.hh>
#include "test_utils.hh"

using namespace amira;

TEST_CASE("Designation line") {
    SUBCASE("AmiraMesh with dimension") {
        auto h = parse_header("# AmiraMesh 3D ASCII 2.0\n");
        CHECK(h.designation.filetype == file_format::amira_mesh);
        CHECK(h.designation.dimension == "3D");
        CHECK(h.designation.format == data_encoding::ascii);
        CHECK(h.designation.version == "2.0");
        CHECK(h.designation.content_type.empty());
    }

    SUBCASE("AmiraMesh little endian") {
        auto h = parse_header("# AmiraMesh BINARY-LITTLE-ENDIAN 2.1");
        CHECK(h.designation.dimension.empty());
        CHECK(h.designation.format == data_encoding::binary_little_endian);
        CHECK(h.designation.version == "2.1");
    }

    SUBCASE("AmiraMesh surface content") {
        auto h = parse_header("# AmiraMesh BINARY 2.1 <hxsurface>\n");
        CHECK(h.designation.format == data_encoding::binary);
        CHECK(h.designation.content_type == "hxsurface");
    }

    SUBCASE("HyperSurface puts the version first") {
        auto h = parse_header("  # HyperSurface 0.1 BINARY\n");
        CHECK(h.designation.filetype == file_format::hyper_surface);
        CHECK(h.designation.version == "0.1");
        CHECK(h.designation.format == data_encoding::binary);
    }

    SUBCASE("unknown data format") {
        CHECK_THROWS_AS(parse_header("# AmiraMesh 3D UTF8 2.0\n"), syntax_error);
    }

    SUBCASE("unknown file type") {
        CHECK_THROWS_AS(parse_header("# Avizo BINARY 2.1\n"), syntax_error);
    }

    SUBCASE("trailing text") {
        CHECK_THROWS_AS(parse_header("# AmiraMesh ASCII 2.0 extra\n"), syntax_error);
    }
}

TEST_CASE("Comments") {
    auto h = parse_header("# AmiraMesh ASCII 2.0\n\n"
                          "# CreationDate: Thu Oct 15 10:00:00 2026\n"
                          "#   written by hand   \n"
                          "define Nodes 1\n"
                          "# Data section follows");
    REQUIRE(h.comments.size() == 3);
    REQUIRE(h.comments[0].creation_date);
    CHECK(*h.comments[0].creation_date == "Thu Oct 15 10:00:00 2026");
    CHECK(h.comments[1].text == "written by hand");
    CHECK_FALSE(h.comments[1].creation_date);
    CHECK(h.comments[2].text == "Data section follows");
}

TEST_CASE("Array declarations") {
    auto h = parse_header("# AmiraMesh BINARY 2.1\n"
                          "define Lattice 64 64 32\n"
                          "define Nodes 1000\n"
                          "nTetrahedra 500\n");
    const std::vector<std::uint64_t> lattice = {64, 64, 32};
    const std::vector<std::uint64_t> nodes = {1000};
    const std::vector<std::uint64_t> tetrahedra = {500};

    REQUIRE(h.array_declarations.size() == 3);
    CHECK(h.array_declarations[0].name == "Lattice");
    CHECK(h.array_declarations[0].dimension == lattice);
    CHECK(h.array_declarations[1].dimension == nodes);
    CHECK(h.array_declarations[2].name == "Tetrahedra");
    CHECK(h.array_declarations[2].dimension == tetrahedra);

    REQUIRE(h.find_array("Nodes"));
    CHECK(h.find_array("Nodes")->dimension.front() == 1000);
    CHECK(h.find_array("Faces") == nullptr);

    CHECK_THROWS_AS(parse_header("# AmiraMesh BINARY 2.1\ndefine Lattice\n"), syntax_error);
}

TEST_CASE("Parameters") {
    auto h = parse_header("# AmiraMesh BINARY-LITTLE-ENDIAN 2.1\n\n"
                          "Parameters {\n"
                          "    Content \"64x64x32 byte, uniform coordinates\",\n"
                          "    BoundingBox 0 63 0 63 0 31,\n"
                          "    # comment inside a block\n"
                          "    Units {\n"
                          "        Coordinates \"mm\"\n"
                          "    }\n"
                          "    Seeds { Count 2, Mode \"a, b\" }\n"
                          "    CoordType \"uniform\"\n"
                          "}\n");
    REQUIRE(h.parameters.size() == 5);
    CHECK(h.parameters[0].name == "Content");
    CHECK(h.parameters[0].value == "64x64x32 byte, uniform coordinates");
    CHECK(h.parameters[1].value == "0 63 0 63 0 31");
    CHECK(h.parameters[2].is_group);
    REQUIRE(h.parameters[2].children.size() == 1);
    CHECK(h.parameters[2].children[0].value == "mm");

    REQUIRE(h.find_parameter("Seeds.Mode"));
    CHECK(h.find_parameter("Seeds.Mode")->value == "a, b");
    CHECK(h.find_parameter("Seeds.Count")->value == "2");
    CHECK(h.find_parameter("CoordType")->value == "uniform");
    CHECK(h.find_parameter("Units")->is_group);
    CHECK(h.find_parameter("Units.Scale") == nullptr);
    CHECK(h.find_parameter("Missing") == nullptr);

    SUBCASE("unterminated block") {
        CHECK_THROWS_AS(parse_header("# AmiraMesh ASCII 2.0\nParameters {\n  Content \"x\"\n"), syntax_error);
    }

    SUBCASE("unterminated quote") {
        CHECK_THROWS_AS(parse_header("# AmiraMesh ASCII 2.0\nParameters {\n  Content \"x\n}\n"), syntax_error);
    }
}

TEST_CASE("Materials") {
    auto h = parse_header("# AmiraMesh 3D ASCII 2.0\n\n"
                          "Materials {\n"
                          "    {\n"
                          "        Name \"Exterior\",\n"
                          "        Id 1\n"
                          "    }\n"
                          "    {\n"
                          "        Id 2,\n"
                          "        Color 0.8 0.2 0.2\n"
                          "    }\n"
                          "}\n");
    REQUIRE(h.materials.size() == 2);
    CHECK(h.materials[0].name == "Exterior");
    CHECK(h.materials[1].name == "Material2");
    CHECK(h.find_parameter("Materials.Exterior.Id")->value == "1");
    CHECK(h.find_parameter("Materials.Material2.Color")->value == "0.8 0.2 0.2");
    CHECK(h.find_parameter("Materials") == nullptr);
}

TEST_CASE("Materials as parameters") {
    const auto content = to_text(load_test_data("surface_ascii.surf"));
    auto h = parse_header(content.substr(0, content.find("\nVertices")));
    CHECK(h.materials.empty());
    REQUIRE(h.find_parameter("Materials.Exterior.Id"));
    CHECK(h.find_parameter("Materials.Exterior.Id")->value == "1");
    CHECK(h.find_parameter("Materials.Inside.Color")->value == "0.8 0.2 0.2");
    CHECK(h.find_parameter("BoundaryIds.Name")->value == "BoundaryConditions");
}

TEST_CASE("Data definitions") {
    auto h = parse_header("# AmiraMesh BINARY-LITTLE-ENDIAN 2.1\n"
                          "define Lattice 10 10 10\n"
                          "Lattice { byte Labels } @1(HxByteRLE,3127)\n"
                          "Lattice { float[3] Vectors } = Linear @2\n"
                          "Lattice { short Data } (@3) ( HxZip , 200 )\n"
                          "Lattice { ushort Mask } Constant @4\n");
    REQUIRE(h.data_definitions.size() == 4);

    const auto& labels = h.data_definitions[0];
    CHECK(labels.array_reference == "Lattice");
    CHECK(labels.data_type == "byte");
    CHECK_FALSE(labels.data_dimension);
    CHECK(labels.data_name == "Labels");
    CHECK(labels.data_index == 1);
    CHECK(labels.data_format == "HxByteRLE");
    CHECK(labels.data_length == 3127u);

    const auto& vectors = h.data_definitions[1];
    CHECK(vectors.data_dimension == 3u);
    CHECK(vectors.interpolation == "Linear");
    CHECK(vectors.data_index == 2);
    CHECK(vectors.data_format.empty());

    CHECK(h.data_definitions[2].data_format == "HxZip");
    CHECK(h.data_definitions[2].data_length == 200u);
    CHECK(h.data_definitions[3].interpolation == "Constant");

    CHECK(h.find_stream(2) == &h.data_definitions[1]);
    CHECK(h.find_stream(9) == nullptr);
    CHECK(h.find_stream(-1) == nullptr);
    CHECK(h.find_data("Lattice", "Mask") == &h.data_definitions[3]);
    CHECK(h.find_data("Lattice", "Other") == nullptr);

    CHECK_THROWS_AS(parse_header("# AmiraMesh BINARY 2.1\nLattice { byte Labels } @1(HxGzip)\n"), syntax_error);

    SUBCASE("data index range") {
        auto largest = parse_header("# AmiraMesh BINARY 2.1\nLattice { byte Labels } @9223372036854775807\n");
        CHECK(largest.data_definitions.front().data_index == 9223372036854775807);
        CHECK_THROWS_WITH_AS(parse_header("# AmiraMesh BINARY 2.1\nLattice { byte Labels } @9223372036854775808\n"),
                             "Data index out of range (line 2)", syntax_error);
        CHECK_THROWS_WITH_AS(parse_header("# AmiraMesh BINARY 2.1\nLattice { byte Labels } @18446744073709551615\n"),
                             "Data index out of range (line 2)", syntax_error);
    }
}

TEST_CASE("Syntax error position") {
    const std::string text = "# AmiraMesh ASCII 2.0\n\n"
                             "define Nodes 4\n"
                             "Nodes { float Coordinates @1\n";
    try {
        parse_header(text);
        FAIL("syntax_error expected");
    } catch (const syntax_error& e) {
        CHECK(e.line() == 4);
        CHECK(e.remainder() == "@1\n");
        CHECK(std::string(e.what()).find("line 4") != std::string::npos);
    }
}

TEST_CASE("Fixture headers") {
    SUBCASE("tetrahedral grid") {
        const auto content = to_text(load_test_data("tetra_ascii.am"));
        std::istringstream stream(content, std::ios::binary);
        auto scan = get_header(stream);
        auto h = parse_header(scan.header);

        CHECK(h.designation.filetype == file_format::amira_mesh);
        CHECK(h.array_declarations.size() == 2);
        CHECK(h.find_parameter("ContentType")->value == "HxTetraGrid");
        CHECK(h.find_parameter("BoundingBox")->value == "0 1 0 1 0 1");
        REQUIRE(h.materials.size() == 2);
        CHECK(h.find_parameter("Materials.Inside.Id")->value == "2");
        REQUIRE(h.data_definitions.size() == 3);
        CHECK(h.data_definitions[0].data_dimension == 3u);
        CHECK(h.data_definitions[2].data_type == "byte");
        REQUIRE(h.comments.size() == 2);
        CHECK(h.comments[0].creation_date);
    }

    SUBCASE("surface") {
        const auto content = to_text(load_test_data("surface_ascii.surf"));
        std::istringstream stream(content, std::ios::binary);
        auto scan = get_header(stream);
        auto h = parse_header(scan.header);

        CHECK(h.designation.filetype == file_format::hyper_surface);
        CHECK(h.designation.format == data_encoding::ascii);
        CHECK(h.array_declarations.empty());
        CHECK(h.data_definitions.empty());
        CHECK(h.parameters.size() == 2);
    }
}

TEST_CASE("Parser progress messages") {
    warning_tracker tracker;
    parse_options options;
    options.verbose = true;
    options.on_warning = std::ref(tracker);
    parse_header("# AmiraMesh ASCII 2.0\ndefine Nodes 4\n", options);
    CHECK(tracker.has_message("Designation: AmiraMesh ASCII 2.0"));
    CHECK(tracker.has_message("Parsed 1 array declarations, 0 data definitions"));
}
