#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// =============================================================================
// civdoc::json_value
//
// In-memory node of an applicant document: a tagged variant over
//
//     null | boolean | number_int | number_float | string | array | object
//
// Objects keep their members in insertion order (a vector of key/value
// pairs), so a document that is loaded and saved again serializes to the same
// text.  Arrays and objects own their children by value; copying a json_value
// deep-copies the subtree.
//
// nlohmann::json is only used at the persistence boundary (serialization.h);
// everything between hydration and asJsonString() works on this type.
// =============================================================================

namespace civdoc {

enum class json_type : std::uint8_t {
    null         = 0,
    boolean      = 1,
    number_int   = 2,
    number_float = 3,
    string       = 4,
    array        = 5,
    object       = 6
};

inline const char* to_string(json_type t) noexcept {
    switch (t) {
        case json_type::null:         return "null";
        case json_type::boolean:      return "boolean";
        case json_type::number_int:   return "integer";
        case json_type::number_float: return "float";
        case json_type::string:       return "string";
        case json_type::array:        return "array";
        case json_type::object:       return "object";
    }
    return "unknown";
}

class json_value {
public:
    using array_t  = std::vector<json_value>;
    using member_t = std::pair<std::string, json_value>;
    using object_t = std::vector<member_t>;

    // ---- construction ----

    json_value() noexcept = default;  // null

    static json_value make_null() { return json_value(); }

    static json_value make_bool(bool b) {
        json_value v;
        v.data_ = b;
        return v;
    }

    static json_value make_int(std::int64_t n) {
        json_value v;
        v.data_ = n;
        return v;
    }

    static json_value make_float(double d) {
        json_value v;
        v.data_ = d;
        return v;
    }

    static json_value make_string(std::string s) {
        json_value v;
        v.data_ = std::move(s);
        return v;
    }

    static json_value make_array(array_t elements = {}) {
        json_value v;
        v.data_ = std::move(elements);
        return v;
    }

    static json_value make_object(object_t members = {}) {
        json_value v;
        v.data_ = std::move(members);
        return v;
    }

    // ---- type queries ----

    json_type type() const noexcept { return static_cast<json_type>(data_.index()); }

    bool is_null()   const noexcept { return type() == json_type::null; }
    bool is_bool()   const noexcept { return type() == json_type::boolean; }
    bool is_int()    const noexcept { return type() == json_type::number_int; }
    bool is_float()  const noexcept { return type() == json_type::number_float; }
    bool is_string() const noexcept { return type() == json_type::string; }
    bool is_array()  const noexcept { return type() == json_type::array; }
    bool is_object() const noexcept { return type() == json_type::object; }
    bool is_number() const noexcept { return is_int() || is_float(); }
    bool is_container() const noexcept { return is_array() || is_object(); }

    // ---- value accessors (caller must check type first) ----

    bool               get_bool()   const { assert(is_bool());   return std::get<bool>(data_); }
    std::int64_t       get_int()    const { assert(is_int());    return std::get<std::int64_t>(data_); }
    double             get_float()  const { assert(is_float());  return std::get<double>(data_); }
    const std::string& get_string() const { assert(is_string()); return std::get<std::string>(data_); }

    const array_t&  elements() const { assert(is_array());  return std::get<array_t>(data_); }
    array_t&        elements()       { assert(is_array());  return std::get<array_t>(data_); }
    const object_t& members()  const { assert(is_object()); return std::get<object_t>(data_); }
    object_t&       members()        { assert(is_object()); return std::get<object_t>(data_); }

    /** Numeric value of an int or float node; caller must check is_number(). */
    double as_double() const {
        return is_int() ? static_cast<double>(get_int()) : get_float();
    }

    // ---- object helpers ----

    /** Member lookup; nullptr when this is not an object or the key is absent. */
    const json_value* find(std::string_view key) const {
        if (!is_object()) return nullptr;
        for (const auto& m : members()) {
            if (m.first == key) return &m.second;
        }
        return nullptr;
    }

    json_value* find(std::string_view key) {
        return const_cast<json_value*>(static_cast<const json_value&>(*this).find(key));
    }

    /** Insert or overwrite a member, keeping the position of an existing key. */
    json_value& set(std::string_view key, json_value value) {
        assert(is_object());
        if (json_value* existing = find(key)) {
            *existing = std::move(value);
            return *existing;
        }
        members().emplace_back(std::string(key), std::move(value));
        return members().back().second;
    }

    /** Remove a member; returns false when it was not there. */
    bool erase(std::string_view key) {
        if (!is_object()) return false;
        object_t& m = members();
        for (auto it = m.begin(); it != m.end(); ++it) {
            if (it->first == key) {
                m.erase(it);
                return true;
            }
        }
        return false;
    }

    // ---- array helpers ----

    std::size_t size() const noexcept {
        if (is_array())  return std::get<array_t>(data_).size();
        if (is_object()) return std::get<object_t>(data_).size();
        return 0;
    }

    /** Element lookup; nullptr when this is not an array or i is out of range. */
    const json_value* at(std::size_t i) const {
        if (!is_array() || i >= elements().size()) return nullptr;
        return &elements()[i];
    }

    json_value* at(std::size_t i) {
        return const_cast<json_value*>(static_cast<const json_value&>(*this).at(i));
    }

    json_value& push_back(json_value value) {
        assert(is_array());
        elements().push_back(std::move(value));
        return elements().back();
    }

    /** Positional removal; later elements shift down by one. */
    bool erase_at(std::size_t i) {
        if (!is_array() || i >= elements().size()) return false;
        elements().erase(elements().begin() + static_cast<std::ptrdiff_t>(i));
        return true;
    }

    // Structural equality: same kind and same contents.  An integer never
    // equals a float, and object member order is significant.
    bool operator==(const json_value& other) const { return data_ == other.data_; }
    bool operator!=(const json_value& other) const { return !(*this == other); }

private:
    // Alternative order must match json_type.
    std::variant<std::monostate, bool, std::int64_t, double, std::string, array_t, object_t> data_;
};

} // namespace civdoc
