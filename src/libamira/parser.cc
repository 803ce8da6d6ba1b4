//
// Created by igor on 15/10/2026.
//

#include <amira/parser.hh>
#include <amira/amiramesh_streams.hh>
#include <amira/exceptions.hh>
#include "delimiters.hh"
#include "diagnostics.hh"
#include "header_scanner.hh"
#include "hypersurface_walker.hh"
#include "input.hh"
#include <fstream>
#include <utility>

namespace amira {

    namespace {
        void attach_amiramesh_streams(std::istream& stream, parsed_header& tree, header_scan& scan,
                                      std::uint64_t remainder_offset, const parse_options& options) {
            auto it = stream_iterator::get_iterator(stream, tree, std::move(scan.remainder), remainder_offset, options);
            for (; it->has_next(); it->next()) {
                auto& info = it->current();
                bool attached = false;
                for (auto& def : tree.data_definitions) {
                    if (def.data_index != info.index) {
                        continue;
                    }
                    def.stream_offset = info.offset;
                    if (!options.drop_data) {
                        def.stream_data = info.data;
                    }
                    attached = true;
                }
                if (!attached) {
                    warn(options, info.offset, "stream", build_error_msg("Stream @", info.index, " is not referenced"));
                }
            }
        }
    }

    void parse_hypersurface_data(std::istream& stream,
                                 parsed_header& header,
                                 std::vector<std::byte> remainder,
                                 std::uint64_t remainder_offset,
                                 const parse_options& options) {
        check_options(options);
        reader source(stream);
        walk_hypersurface(source, header, std::move(remainder), remainder_offset, options,
                          stream_table::hyper_surface(), delimiter_set::hyper_surface());
    }

    parse_result parse(std::istream& stream, const parse_options& options) {
        check_options(options);
        reader source(stream);
        const auto base = source.position();

        auto scan = scan_header(source, options);
        parse_result result;
        result.format = scan.format;
        result.header_length = scan.header_size;
        result.tree = parse_header(scan.header, options);

        const auto remainder_offset = base + scan.header_size;
        switch (scan.format) {
            case file_format::hyper_surface:
                walk_hypersurface(source, result.tree, std::move(scan.remainder), remainder_offset, options,
                                  stream_table::hyper_surface(), delimiter_set::hyper_surface());
                break;
            case file_format::amira_mesh:
                attach_amiramesh_streams(stream, result.tree, scan, remainder_offset, options);
                break;
            case file_format::undefined:
                break;
        }
        result.header = std::move(scan.header);
        return result;
    }

    parse_result parse_file(const std::filesystem::path& path, const parse_options& options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file.is_open(), "Cannot open file: ", path.string());
        return parse(file, options);
    }
}
