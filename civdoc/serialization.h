#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "json_value.h"

// =============================================================================
// Persistence boundary: json_value <-> JSON text.
//
// nlohmann::ordered_json is used so that object members keep their insertion
// order through a parse / dump cycle.  Output is compact (no whitespace), the
// form stored in the applicant row.
// =============================================================================

namespace civdoc {

/**
 * Recursively convert a nlohmann document into a json_value tree.
 */
inline json_value from_nlohmann(const nlohmann::ordered_json& doc) {
    switch (doc.type()) {
        case nlohmann::ordered_json::value_t::null:
            return json_value::make_null();

        case nlohmann::ordered_json::value_t::boolean:
            return json_value::make_bool(doc.get<bool>());

        case nlohmann::ordered_json::value_t::number_integer:
            return json_value::make_int(doc.get<std::int64_t>());

        case nlohmann::ordered_json::value_t::number_unsigned: {
            std::uint64_t u = doc.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return json_value::make_int(static_cast<std::int64_t>(u));
            }
            return json_value::make_float(static_cast<double>(u));
        }

        case nlohmann::ordered_json::value_t::number_float:
            return json_value::make_float(doc.get<double>());

        case nlohmann::ordered_json::value_t::string:
            return json_value::make_string(doc.get<std::string>());

        case nlohmann::ordered_json::value_t::array: {
            json_value::array_t elements;
            elements.reserve(doc.size());
            for (const auto& elem : doc) {
                elements.push_back(from_nlohmann(elem));
            }
            return json_value::make_array(std::move(elements));
        }

        case nlohmann::ordered_json::value_t::object: {
            json_value::object_t members;
            members.reserve(doc.size());
            for (auto it = doc.begin(); it != doc.end(); ++it) {
                members.emplace_back(it.key(), from_nlohmann(it.value()));
            }
            return json_value::make_object(std::move(members));
        }

        default:
            // binary / discarded: not producible by parse(), stored as null.
            return json_value::make_null();
    }
}

/**
 * Recursively reconstruct a nlohmann document from a json_value tree.
 */
inline nlohmann::ordered_json to_nlohmann(const json_value& node) {
    switch (node.type()) {
        case json_type::null:
            return nlohmann::ordered_json(nullptr);

        case json_type::boolean:
            return nlohmann::ordered_json(node.get_bool());

        case json_type::number_int:
            return nlohmann::ordered_json(node.get_int());

        case json_type::number_float:
            return nlohmann::ordered_json(node.get_float());

        case json_type::string:
            return nlohmann::ordered_json(node.get_string());

        case json_type::array: {
            nlohmann::ordered_json arr = nlohmann::ordered_json::array();
            for (const auto& elem : node.elements()) {
                arr.push_back(to_nlohmann(elem));
            }
            return arr;
        }

        case json_type::object: {
            nlohmann::ordered_json obj = nlohmann::ordered_json::object();
            for (const auto& m : node.members()) {
                obj[m.first] = to_nlohmann(m.second);
            }
            return obj;
        }
    }
    return nlohmann::ordered_json(nullptr);
}

/**
 * Parse JSON text into a json_value tree.
 *
 * @throws nlohmann::json::parse_error if the text is not valid JSON.
 */
inline json_value parse_json(std::string_view text) {
    return from_nlohmann(nlohmann::ordered_json::parse(text.begin(), text.end()));
}

/** Compact JSON text for a json_value tree. */
inline std::string dump_json(const json_value& node) {
    return to_nlohmann(node).dump();
}

} // namespace civdoc
