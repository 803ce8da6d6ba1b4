//
// Created by igor on 11/10/2026.
//

#include <amira/stream_table.hh>
#include <amira/exceptions.hh>
#include <algorithm>
#include <array>
#include <utility>

namespace amira {

    namespace {
        constexpr std::string_view patch_item = "Patch";
        constexpr std::string_view boundary_curve_item = "BoundaryCurve";
        constexpr std::string_view surface_item = "Surface";

        stream_definition def(std::string_view context, std::string_view block,
                              std::optional<std::size_t> multiplicity, element_type type, bool optional) {
            return stream_definition{
                .context = std::string(context),
                .block_name = std::string(block),
                .multiplicity = multiplicity,
                .type = type,
                .optional = optional
            };
        }

        std::vector<stream_descriptor> hyper_surface_descriptors() {
            constexpr auto none = std::nullopt;
            return {
                // Vertices { float[3] Coordinates }, inside BoundaryCurve<n> { int Vertices }
                {"Vertices", {
                    def(top_level_context, "Coordinates", 3, element_type::float_type, false),
                    def(boundary_curve_item, "Vertices", 1, element_type::int_type, false)
                }},
                {"NBranchingPoints", {
                    def(top_level_context, "NBranchingPoints", none, element_type::int_type, true)
                }},
                {"NVerticesOnCurves", {
                    def(top_level_context, "NVerticesOnCurves", none, element_type::int_type, true)
                }},
                // list of BoundaryCurve<n>, inside Patch<n> { int BoundaryCurves }
                {"BoundaryCurves", {
                    def(top_level_context, boundary_curve_item, 1, element_type::group, true),
                    def(patch_item, "BoundaryCurves", 1, element_type::int_type, true)
                }},
                // list of Patch<n>, inside Surface<n> { int Patches }
                {"Patches", {
                    def(top_level_context, patch_item, 1, element_type::group, false),
                    def(surface_item, "Patches", 1, element_type::int_type, false)
                }},
                {"InnerRegion", {
                    def(patch_item, "InnerRegion", none, element_type::char_type, false)
                }},
                {"OuterRegion", {
                    def(patch_item, "OuterRegion", none, element_type::char_type, false)
                }},
                {"BoundaryID", {
                    def(patch_item, "BoundaryID", none, element_type::int_type, true)
                }},
                {"Triangles", {
                    def(patch_item, "Triangles", 3, element_type::int_type, false)
                }},
                {"BranchingPoints", {
                    def(patch_item, "BranchingPoints", 1, element_type::int_type, true)
                }},
                {"Surfaces", {
                    def(top_level_context, surface_item, 1, element_type::group, true)
                }},
                {"Region", {
                    def(surface_item, "Region", none, element_type::char_type, false)
                }},
            };
        }
    }

    std::string_view to_string(element_type type) {
        switch (type) {
            case element_type::byte_type:   return "byte";
            case element_type::short_type:  return "short";
            case element_type::int_type:    return "int";
            case element_type::long_type:   return "long";
            case element_type::float_type:  return "float";
            case element_type::double_type: return "double";
            case element_type::char_type:   return "char";
            case element_type::group:       return "group";
        }
        return "";
    }

    std::size_t type_size(element_type type) {
        switch (type) {
            case element_type::byte_type:
            case element_type::char_type:
                return 1;
            case element_type::short_type:
                return 2;
            case element_type::int_type:
            case element_type::float_type:
                return 4;
            case element_type::long_type:
            case element_type::double_type:
                return 8;
            case element_type::group:
                break;
        }
        return 0;
    }

    std::optional<std::size_t> type_size(std::string_view name) {
        static constexpr std::array<std::pair<std::string_view, std::size_t>, 10> sizes = {{
            {"byte", 1}, {"char", 1}, {"ubyte", 1},
            {"short", 2}, {"ushort", 2},
            {"int", 4}, {"float", 4},
            {"long", 8}, {"int64", 8}, {"double", 8}
        }};
        for (const auto& [type, size] : sizes) {
            if (type == name) {
                return size;
            }
        }
        return std::nullopt;
    }

    const stream_definition* stream_descriptor::in_context(std::string_view context) const {
        for (const auto& d : definitions) {
            if (d.context == context) {
                return &d;
            }
        }
        return nullptr;
    }

    const stream_definition* stream_descriptor::group_definition() const {
        for (const auto& d : definitions) {
            if (d.type == element_type::group) {
                return &d;
            }
        }
        return nullptr;
    }

    stream_table::stream_table(std::vector<stream_descriptor> descriptors)
        : m_descriptors(std::move(descriptors)) {
        for (const auto& d : m_descriptors) {
            THROW_PARSE_IF(d.keyword.empty(), "Stream table contains an empty keyword");
            THROW_PARSE_IF(d.definitions.empty(), "Stream '", d.keyword, "' has no definition");
        }
    }

    const stream_table& stream_table::hyper_surface() {
        static const stream_table table(hyper_surface_descriptors());
        return table;
    }

    const stream_descriptor* stream_table::find(std::string_view keyword) const {
        auto it = std::find_if(m_descriptors.begin(), m_descriptors.end(),
            [keyword](const stream_descriptor& d) { return d.keyword == keyword; });
        return it == m_descriptors.end() ? nullptr : &*it;
    }

    std::vector<std::string> stream_table::keywords() const {
        std::vector<std::string> result;
        result.reserve(m_descriptors.size());
        for (const auto& d : m_descriptors) {
            result.push_back(d.keyword);
        }
        return result;
    }

    std::vector<std::string> stream_table::mandatory_in(std::string_view context) const {
        std::vector<std::string> result;
        for (const auto& d : m_descriptors) {
            const auto* def = d.in_context(context);
            if (def && !def->optional) {
                result.push_back(d.keyword);
            }
        }
        return result;
    }

    std::size_t rescan_overlap_for(const std::vector<std::string>& keywords) {
        std::size_t longest = 0;
        for (const auto& k : keywords) {
            longest = std::max(longest, k.size());
        }
        return ((longest + 16 + 15) / 16) * 16;
    }

} // namespace amira
