//
// Created by igor on 14/10/2026.
//

#include <amira/header.hh>
#include <algorithm>

namespace amira {

    const array_declaration* parsed_header::find_array(std::string_view name) const {
        auto itr = std::find_if(array_declarations.begin(), array_declarations.end(),
                                [name](const array_declaration& a) { return a.name == name; });
        return itr == array_declarations.end() ? nullptr : &*itr;
    }

    const data_definition* parsed_header::find_data(std::string_view array, std::string_view name) const {
        auto itr = std::find_if(data_definitions.begin(), data_definitions.end(),
                                [&](const data_definition& d) {
                                    return d.array_reference == array && d.data_name == name;
                                });
        return itr == data_definitions.end() ? nullptr : &*itr;
    }

    const data_definition* parsed_header::find_stream(std::int64_t index) const {
        if (index < 0) {
            return nullptr;
        }
        auto itr = std::find_if(data_definitions.begin(), data_definitions.end(),
                                [index](const data_definition& d) { return d.data_index == index; });
        return itr == data_definitions.end() ? nullptr : &*itr;
    }

    const parameter* parsed_header::find_parameter(std::string_view path) const {
        const std::vector<parameter>* level = &parameters;
        const parameter* found = nullptr;

        // "Materials" at the start of a path may also name the Materials section
        if (path.substr(0, path.find('.')) == "Materials" && !materials.empty()) {
            auto rest = path.find('.') == std::string_view::npos ? std::string_view{} : path.substr(path.find('.') + 1);
            if (rest.empty()) {
                return nullptr;
            }
            level = &materials;
            path = rest;
        }

        while (!path.empty()) {
            auto dot = path.find('.');
            auto part = path.substr(0, dot);
            auto itr = std::find_if(level->begin(), level->end(),
                                    [part](const parameter& p) { return p.name == part; });
            if (itr == level->end()) {
                return nullptr;
            }
            found = &*itr;
            if (dot == std::string_view::npos) {
                break;
            }
            level = &itr->children;
            path.remove_prefix(dot + 1);
        }
        return found;
    }
}
