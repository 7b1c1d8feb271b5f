#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "coercion.h"
#include "errors.h"
#include "json_path.h"
#include "json_value.h"
#include "path.h"
#include "predicate.h"
#include "query_engine.h"
#include "serialization.h"
#include "well_known_paths.h"

// =============================================================================
// civdoc::ApplicantData
//
// Answer data for one applicant, held as a single JSON document rooted at
//
//     { "applicant": { ... } }
//
// and addressed by Path.  Writes build missing structure on the way down:
// absent objects are created, absent arrays are created, and an indexed
// segment "xs[i]" pads xs with empty objects so that every index below i is
// present.  Arrays written through this class therefore never have gaps.
//
// Typed readers never throw: a missing path and a value of the wrong kind
// both read as std::nullopt.  Typed writers throw input_format_error on
// malformed input; an empty input string clears the path instead.
//
// lock() is one-way.  Every mutating call on a locked instance throws
// lock_violation; reads keep working.
//
// Not thread-safe.  Separate instances share nothing but the (stateless)
// query engine.
// =============================================================================

namespace civdoc {

class ApplicantData {
public:
    static constexpr const char* anonymous_applicant = "<Anonymous Applicant>";

    // ---- construction ----

    /** Empty document: {"applicant":{}}. */
    explicit ApplicantData(std::shared_ptr<const QueryEngine> engine = nullptr)
        : ApplicantData(std::nullopt, empty_document, std::move(engine))
    {
    }

    /**
     * Hydrate from persisted JSON text.
     *
     * @throws nlohmann::json::parse_error if json is not valid JSON
     * @throws document_error if the top-level value is not an object
     */
    explicit ApplicantData(std::string_view json,
                           std::shared_ptr<const QueryEngine> engine = nullptr)
        : ApplicantData(std::nullopt, json, std::move(engine))
    {
    }

    ApplicantData(std::optional<std::string> preferred_locale,
                  std::string_view json,
                  std::shared_ptr<const QueryEngine> engine = nullptr)
        : data_(parse_json(json)),
          preferred_locale_(std::move(preferred_locale)),
          engine_(engine ? std::move(engine) : std::make_shared<JsonPathEngine>())
    {
        if (!data_.is_object()) {
            throw document_error(std::string("ApplicantData: top-level JSON value must be an object, got ") +
                                 to_string(data_.type()));
        }
        VLOG(1) << "ApplicantData hydrated with " << data_.size() << " top-level key(s)";
    }

    // ---- lock ----

    /** Makes this ApplicantData immutable.  There is no unlock. */
    void lock() noexcept { locked_ = true; }

    bool is_locked() const noexcept { return locked_; }

    // ---- preferred locale ----

    bool has_preferred_locale() const noexcept { return preferred_locale_.has_value(); }

    /** The applicant's locale tag, or default_locale when none was set. */
    std::string preferred_locale() const {
        return preferred_locale_.value_or(default_locale);
    }

    void set_preferred_locale(std::string locale) {
        check_locked("set_preferred_locale");
        preferred_locale_ = std::move(locale);
    }

    // ---- applicant name ----

    /** "Last, First" when a last name is stored, "First" otherwise. */
    std::string applicant_name() const {
        std::optional<std::string> first = read_string(well_known_paths::applicant_first_name());
        if (!first) {
            LOG(ERROR) << "Application does not include an applicant name.";
            return anonymous_applicant;
        }
        std::optional<std::string> last = read_string(well_known_paths::applicant_last_name());
        if (last) {
            return *last + ", " + *first;
        }
        return *first;
    }

    /**
     * Split a display name on single spaces: one part is the first name, two
     * are first and last, three are first, middle and last.  Any other count
     * stores the whole display name as the first name.
     */
    void set_user_name(std::string_view display_name) {
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (true) {
            std::size_t space = display_name.find(' ', start);
            if (space == std::string_view::npos) {
                parts.emplace_back(display_name.substr(start));
                break;
            }
            parts.emplace_back(display_name.substr(start, space - start));
            start = space + 1;
        }
        switch (parts.size()) {
            case 2:
                set_user_name(parts[0], std::nullopt, parts[1]);
                break;
            case 3:
                set_user_name(parts[0], parts[1], parts[2]);
                break;
            default:
                set_user_name(std::string(display_name), std::nullopt, std::nullopt);
                break;
        }
    }

    /** Fills each name field only if it is not already present. */
    void set_user_name(const std::string& first_name,
                       const std::optional<std::string>& middle_name,
                       const std::optional<std::string>& last_name) {
        check_locked("set_user_name");
        if (!has_path(well_known_paths::applicant_first_name())) {
            put_string(well_known_paths::applicant_first_name(), first_name);
        }
        if (middle_name && !has_path(well_known_paths::applicant_middle_name())) {
            put_string(well_known_paths::applicant_middle_name(), *middle_name);
        }
        if (last_name && !has_path(well_known_paths::applicant_last_name())) {
            put_string(well_known_paths::applicant_last_name(), *last_name);
        }
    }

    // ---- probes ----

    /** True if anything, including null, is stored at path. */
    bool has_path(const Path& path) const {
        return find_node(path) != nullptr;
    }

    /** True if a non-null value is stored at path. */
    bool has_value_at_path(const Path& path) const {
        const json_value* node = find_node(path);
        return node != nullptr && !node->is_null();
    }

    // ---- typed writes ----

    /** An empty string clears the path; anything else must be valid UTF-8. */
    void put_string(const Path& path, std::string_view value) {
        check_locked("put_string");
        if (value.empty()) {
            clear(path);
            return;
        }
        put(path, json_value::make_string(std::string(value)));
    }

    void put_long(const Path& path, std::int64_t value) {
        check_locked("put_long");
        put(path, json_value::make_int(value));
    }

    /** An empty string clears the path; anything else must parse as a long. */
    void put_long(const Path& path, std::string_view value) {
        check_locked("put_long");
        if (value.empty()) {
            clear(path);
            return;
        }
        put(path, json_value::make_int(parse_long(value)));
    }

    /** Stores a "yyyy-MM-dd" date as epoch milliseconds of UTC midnight. */
    void put_date(const Path& path, std::string_view date) {
        check_locked("put_date");
        if (date.empty()) {
            clear(path);
            return;
        }
        put(path, json_value::make_int(LocalDate::parse(date).to_epoch_millis()));
    }

    /** Stores a dollar amount ("1,234.56") as integer cents. */
    void put_currency_dollars(const Path& path, std::string_view dollars) {
        check_locked("put_currency_dollars");
        if (dollars.empty()) {
            clear(path);
            return;
        }
        put(path, json_value::make_int(Currency::parse(dollars).cents()));
    }

    /**
     * Write the entity name of each repeated entity under path ("xs[]" or
     * "xs").  Other data already stored for those entities is untouched.  An
     * empty list stores an empty array.
     */
    void put_repeated_entities(const Path& path, const std::vector<std::string>& entity_names) {
        check_locked("put_repeated_entities");
        if (entity_names.empty()) {
            put(path.without_array_reference(), json_value::make_array());
            return;
        }
        for (std::size_t i = 0; i < entity_names.size(); ++i) {
            put_string(path.at_index(i).join(scalar::entity_name), entity_names[i]);
        }
    }

    /**
     * Write value at path, creating every missing ancestor.
     *
     * For an indexed last segment "xs[i]": the element is replaced when it
     * exists, appended when i is the array size, and otherwise the array is
     * padded with empty objects up to i first.
     *
     * @throws structure_error if an ancestor exists but is not a container of
     *         the kind the path needs
     * @throws input_format_error if a key or string is not valid UTF-8
     */
    void put(const Path& path, json_value value) {
        check_locked("put");
        if (path.is_empty()) {
            throw path_error("ApplicantData::put: cannot replace the document root");
        }
        check_utf8(path);
        check_utf8(value, path);
        json_value& container = materialize(path.parent_path());
        const path_segment& last = path.segments().back();
        require_object(container, path.parent_path());

        if (!last.is_element()) {
            container.set(last.key, std::move(value));
            return;
        }
        json_value& array = child_array(container, last.key, path);
        pad_array(array, last.index);
        if (last.index < array.size()) {
            *array.at(last.index) = std::move(value);
        } else {
            array.push_back(std::move(value));
        }
    }

    // ---- deletion ----

    /** Delete whatever is at path, if anything. */
    void maybe_delete(const Path& path) {
        check_locked("maybe_delete");
        erase_node(path);
    }

    /**
     * For an array-element path, make sure the parent structure exists and
     * remove the whole array; otherwise do nothing.
     */
    void maybe_clear_array(const Path& path) {
        check_locked("maybe_clear_array");
        if (!path.is_array_element()) return;
        check_utf8(path);
        materialize(path.parent_path());
        erase_node(path.without_array_reference());
    }

    /**
     * Delete the whole repeated entity at each index under path.  Deletion
     * runs from the highest index down, since removing an element shifts the
     * ones after it.
     *
     * @return false when indices is empty or the highest index does not exist
     */
    bool delete_repeated_entities(const Path& path, std::vector<std::size_t> indices) {
        check_locked("delete_repeated_entities");
        if (indices.empty()) return false;

        std::sort(indices.begin(), indices.end(), std::greater<std::size_t>());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

        if (!has_path(path.at_index(indices.front()))) return false;

        for (std::size_t index : indices) {
            erase_node(path.at_index(index));
        }
        return true;
    }

    /**
     * Remove the array at path only when it holds no repeated entities.
     * Entity data is never removed here; use delete_repeated_entities.
     *
     * @return true when no repeated entities remain at path
     */
    bool maybe_clear_repeated_entities(const Path& path) {
        check_locked("maybe_clear_repeated_entities");
        if (read_repeated_entities(path).empty()) {
            erase_node(path.without_array_reference());
            return true;
        }
        return false;
    }

    // ---- typed reads ----

    std::optional<std::string> read_string(const Path& path) const {
        return coerce_string(find_node(path)).to_optional();
    }

    std::optional<std::int64_t> read_long(const Path& path) const {
        return coerce_long(find_node(path)).to_optional();
    }

    std::optional<LocalDate> read_date(const Path& path) const {
        return coerce_date(find_node(path)).to_optional();
    }

    std::optional<Currency> read_currency(const Path& path) const {
        return coerce_currency(find_node(path)).to_optional();
    }

    /** Only a homogeneous array of integers reads as a list. */
    std::optional<std::vector<std::int64_t>> read_list(const Path& path) const {
        return coerce_long_list(find_node(path)).to_optional();
    }

    /**
     * Names of the repeated entities under path, walking indices from 0 until
     * the first missing one.  An entity with no name reads as "".
     */
    std::vector<std::string> read_repeated_entities(const Path& path) const {
        std::vector<std::string> names;
        for (std::size_t i = 0; has_path(path.at_index(i)); ++i) {
            names.push_back(read_string(path.at_index(i).join(scalar::entity_name)).value_or(""));
        }
        return names;
    }

    /** A list of integers renders as "[1, 2, 3]"; anything else as read_string. */
    std::optional<std::string> read_as_string(const Path& path) const {
        coerced<std::vector<std::int64_t>> list = coerce_long_list(find_node(path));
        if (list.found()) {
            return format_long_list(list.value);
        }
        return read_string(path);
    }

    // ---- predicates ----

    /** True when the predicate's query selects at least one node. */
    bool eval_predicate(const JsonPathPredicate& predicate) const {
        try {
            return !engine_->select(data_, predicate.path_predicate()).empty();
        } catch (const path_not_found& e) {
            VLOG(1) << "Predicate path not found: " << e.what();
            return false;
        }
    }

    // ---- merge ----

    /**
     * Copy everything from other that this document lacks, recursing into
     * objects.  Arrays present on both sides get every incoming element
     * appended.  Existing scalars are never overwritten: each differing one
     * is reported instead.
     *
     * @return paths whose incoming values were not copied
     */
    std::vector<Path> merge_from(const ApplicantData& other) {
        check_locked("merge_from");
        std::vector<Path> conflicts;
        if (&other == this) {
            const json_value snapshot = other.data_;
            merge_object(data_, snapshot, Path::empty(), conflicts);
        } else {
            merge_object(data_, other.data_, Path::empty(), conflicts);
        }
        return conflicts;
    }

    // ---- persistence ----

    std::string as_json_string() const { return dump_json(data_); }

    /** Read-only view of the whole document. */
    const json_value& root() const noexcept { return data_; }

    // Equal when the serialized documents are textually identical; key order
    // is significant.
    bool operator==(const ApplicantData& other) const {
        return as_json_string() == other.as_json_string();
    }
    bool operator!=(const ApplicantData& other) const { return !(*this == other); }

private:
    json_value                         data_;
    bool                               locked_ = false;
    std::optional<std::string>         preferred_locale_;
    std::shared_ptr<const QueryEngine> engine_;

    static constexpr const char* empty_document = "{\"applicant\":{}}";

    void check_locked(const char* operation) const {
        if (locked_) {
            LOG(ERROR) << "Rejected " << operation << " on a locked ApplicantData";
            throw lock_violation(std::string("Cannot change ApplicantData after it has been locked (") +
                                 operation + ")");
        }
    }

    // Keys created on the way down must survive dump_json too.
    static void check_utf8(const Path& path) {
        for (const path_segment& seg : path.segments()) {
            if (!is_valid_utf8(seg.key)) {
                throw input_format_error("Path key is not valid UTF-8: " + path.to_string());
            }
        }
    }

    // Every string and member key in value must survive dump_json.
    static void check_utf8(const json_value& value, const Path& where) {
        if (value.is_string()) {
            if (!is_valid_utf8(value.get_string())) {
                throw input_format_error("Text for " + where.to_string() + " is not valid UTF-8");
            }
        } else if (value.is_array()) {
            for (const auto& elem : value.elements()) check_utf8(elem, where);
        } else if (value.is_object()) {
            for (const auto& m : value.members()) {
                if (!is_valid_utf8(m.first)) {
                    throw input_format_error("Key under " + where.to_string() + " is not valid UTF-8");
                }
                check_utf8(m.second, where);
            }
        }
    }

    // ---- navigation ----

    const json_value* find_node(const Path& path) const {
        const json_value* node = &data_;
        for (const path_segment& seg : path.segments()) {
            node = node->find(seg.key);
            if (node == nullptr) return nullptr;
            if (seg.is_element()) {
                node = node->at(seg.index);
                if (node == nullptr) return nullptr;
            }
        }
        return node;
    }

    json_value* find_node(const Path& path) {
        return const_cast<json_value*>(static_cast<const ApplicantData&>(*this).find_node(path));
    }

    static void require_object(const json_value& node, const Path& where) {
        if (!node.is_object()) {
            throw structure_error("ApplicantData: expected an object at " + where.to_string() +
                                  ", found " + to_string(node.type()));
        }
    }

    static json_value& child_array(json_value& container, const std::string& key, const Path& where) {
        json_value* array = container.find(key);
        if (array == nullptr) {
            return container.set(key, json_value::make_array());
        }
        if (!array->is_array()) {
            throw structure_error("ApplicantData: expected an array for " + where.to_string() +
                                  ", found " + to_string(array->type()));
        }
        return *array;
    }

    // Empty objects fill every slot below index, so the array stays gap-free.
    static void pad_array(json_value& array, std::size_t index) {
        while (array.size() < index) {
            array.push_back(json_value::make_object());
        }
    }

    /**
     * Single descent from the root to path, creating each missing node:
     * objects for plain segments, arrays plus padded object slots for indexed
     * ones.  Returns the node at path.
     */
    json_value& materialize(const Path& path) {
        json_value* node = &data_;
        Path walked;
        for (const path_segment& seg : path.segments()) {
            require_object(*node, walked);
            walked = walked.join(seg);
            if (!seg.is_element()) {
                json_value* child = node->find(seg.key);
                node = child != nullptr ? child : &node->set(seg.key, json_value::make_object());
                continue;
            }
            json_value& array = child_array(*node, seg.key, walked);
            pad_array(array, seg.index);
            if (array.size() == seg.index) {
                array.push_back(json_value::make_object());
            }
            node = array.at(seg.index);
        }
        return *node;
    }

    // Positional for array elements: later elements shift down.
    bool erase_node(const Path& path) {
        if (path.is_empty()) {
            throw path_error("ApplicantData: cannot delete the document root");
        }
        json_value* container = find_node(path.parent_path());
        if (container == nullptr) return false;
        const path_segment& last = path.segments().back();
        if (!last.is_element()) {
            return container->erase(last.key);
        }
        json_value* array = container->find(last.key);
        return array != nullptr && array->erase_at(last.index);
    }

    // Empty-input writes: remove the value, but never shift an array.
    void clear(const Path& path) {
        if (!path.is_array_element()) {
            erase_node(path);
        }
    }

    // ---- merge ----

    static void merge_object(json_value& target, const json_value& incoming,
                             const Path& base, std::vector<Path>& conflicts) {
        for (const auto& member : incoming.members()) {
            const std::string& key   = member.first;
            const json_value&  value = member.second;
            Path path = base.join(path_segment{key});

            json_value* existing = target.find(key);
            if (existing == nullptr) {
                target.set(key, value);
                continue;
            }
            if (value.is_object() && existing->is_object()) {
                merge_object(*existing, value, path, conflicts);
            } else if (value.is_array() && existing->is_array()) {
                // Appends without de-duplication.
                for (const auto& item : value.elements()) {
                    existing->push_back(item);
                }
            } else if (value != *existing) {
                VLOG(1) << "Merge conflict at " << path.to_string();
                conflicts.push_back(std::move(path));
            }
        }
    }
};

} // namespace civdoc

namespace std {
template<>
struct hash<civdoc::ApplicantData> {
    size_t operator()(const civdoc::ApplicantData& d) const {
        return hash<string>()(d.as_json_string());
    }
};
} // namespace std
