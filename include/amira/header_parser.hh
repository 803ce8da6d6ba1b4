/**
 * @file header_parser.hh
 * @brief Recursive-descent parser for Amira header text
 * @author Igor
 * @date 14/10/2026
 */

#pragma once

#include <string_view>
#include <amira/export_amira.h>
#include <amira/header.hh>
#include <amira/parse_options.hh>

namespace amira {

    /**
     * @brief Parse the header text of an AmiraMesh or HyperSurface file
     *
     * The text is the header as returned by get_header(): designation line,
     * comments, array declarations ("define Nodes 100"), "Parameters" and
     * "Materials" blocks and data definitions
     * ("Nodes { float[3] Coordinates } @1"). Sections following the
     * designation may appear in any order.
     *
     * @param text Header text
     * @param options Parse options (verbose)
     * @return Structured header
     * @throws syntax_error with line number and unconsumed remainder
     */
    AMIRA_EXPORT parsed_header parse_header(std::string_view text, const parse_options& options = {});

} // namespace amira
