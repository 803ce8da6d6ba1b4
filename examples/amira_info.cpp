/**
 * @file amira_info.cpp
 * @brief Prints the header and data streams of an Amira file
 *
 * This example shows how to parse an AmiraMesh or HyperSurface file and
 * walk the resulting header tree.
 */

#include <amira/parser.hh>
#include <amira/exceptions.hh>
#include <amira/stream_decode.hh>
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <string>
#include <variant>
#include <vector>

class AmiraInfo {
public:
    int run(const std::string& filename, bool verbose, bool show_values) {
        amira::parse_options options;
        options.verbose = verbose;
        options.on_warning = [](uint64_t offset,
                                std::string_view category,
                                std::string_view message) {
            std::cerr << "[" << category << "] offset " << offset << ": " << message << "\n";
        };

        try {
            auto result = amira::parse_file(filename, options);
            print_summary(filename, result);
            print_arrays(result.tree);
            print_parameters(result.tree.parameters, 1);
            print_data(result.tree, show_values);
        } catch (const amira::syntax_error& e) {
            std::cerr << "Syntax error: " << e.what() << "\n";
            std::cerr << "Unparsed: " << e.remainder().substr(0, 80) << "\n";
            return 1;
        } catch (const amira::amira_error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

private:
    void print_summary(const std::string& filename, const amira::parse_result& result) {
        const auto& d = result.tree.designation;
        std::cout << "File: " << filename << "\n";
        std::cout << "=========================================\n";
        std::cout << "Format:   " << amira::to_string(result.format) << "\n";
        std::cout << "Encoding: " << amira::to_string(d.format) << "\n";
        std::cout << "Version:  " << d.version << "\n";
        std::cout << "Header:   " << result.header_length << " bytes\n";
        for (const auto& c : result.tree.comments) {
            if (c.creation_date) {
                std::cout << "Created:  " << *c.creation_date << "\n";
            }
        }
        std::cout << "\n";
    }

    void print_arrays(const amira::parsed_header& tree) {
        std::cout << "Arrays:\n";
        for (const auto& a : tree.array_declarations) {
            std::cout << "  " << a.name;
            for (auto dim : a.dimension) {
                std::cout << " " << dim;
            }
            if (a.is_list) {
                std::cout << " [list]";
            }
            if (a.link) {
                std::cout << " (item " << a.link->item_id << " of " << a.link->parent << ")";
            }
            if (const auto* n = std::get_if<std::int64_t>(&a.value)) {
                std::cout << " = " << *n;
            } else if (const auto* s = std::get_if<std::string>(&a.value)) {
                std::cout << " = " << *s;
            }
            std::cout << "\n";
        }
        std::cout << "\n";
    }

    void print_parameters(const std::vector<amira::parameter>& params, int depth) {
        if (depth == 1 && !params.empty()) {
            std::cout << "Parameters:\n";
        }
        for (const auto& p : params) {
            std::cout << std::string(depth * 2, ' ') << p.name;
            if (p.is_group) {
                std::cout << "\n";
                print_parameters(p.children, depth + 1);
            } else {
                std::cout << " " << p.value << "\n";
            }
        }
        if (depth == 1 && !params.empty()) {
            std::cout << "\n";
        }
    }

    void print_data(const amira::parsed_header& tree, bool show_values) {
        std::cout << "Data:\n";
        for (const auto& d : tree.data_definitions) {
            std::cout << "  " << d.array_reference << " { " << d.data_type;
            if (d.data_dimension) {
                std::cout << "[" << *d.data_dimension << "]";
            }
            std::cout << " " << d.data_name << " }";
            if (d.data_index >= 0) {
                std::cout << " @" << d.data_index;
            }
            if (d.stream_offset) {
                std::cout << " at 0x" << std::hex << *d.stream_offset << std::dec;
            }
            if (const auto* bytes = std::get_if<std::vector<std::byte>>(&d.stream_data)) {
                std::cout << ", " << bytes->size() << " bytes";
                if (show_values && d.data_format.empty()) {
                    print_values(d, tree.designation.format);
                }
            } else if (const auto* s = std::get_if<std::string>(&d.stream_data)) {
                std::cout << " = " << *s;
            } else if (const auto* n = std::get_if<std::int64_t>(&d.stream_data)) {
                std::cout << " = " << *n;
            }
            std::cout << "\n";
        }
    }

    void print_values(const amira::data_definition& d, amira::data_encoding encoding) {
        auto values = amira::decode_values(d, encoding);
        std::cout << " [";
        const std::size_t shown = std::min<std::size_t>(values.size(), 6);
        for (std::size_t i = 0; i < shown; i++) {
            std::cout << (i ? " " : "") << values[i];
        }
        if (values.size() > shown) {
            std::cout << " ...";
        }
        std::cout << "]";
    }
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " [-v] [-x] <amira-file>\n";
        std::cerr << "  -v  report progress on stderr\n";
        std::cerr << "  -x  print the first values of every stream\n";
        return 1;
    }

    bool verbose = false;
    bool show_values = false;
    std::string filename;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-v") {
            verbose = true;
        } else if (arg == "-x") {
            show_values = true;
        } else {
            filename = arg;
        }
    }
    if (filename.empty()) {
        std::cerr << "No input file given\n";
        return 1;
    }

    AmiraInfo info;
    return info.run(filename, verbose, show_values);
}
