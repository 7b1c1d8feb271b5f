#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "errors.h"

// =============================================================================
// civdoc::Path
//
// Immutable address into an applicant document, written as dotted segments
// with an optional bracket suffix on each segment:
//
//     applicant.children[3].name
//     applicant.household_members[]      (array reference, no index)
//
// A leading "$" or "$." is accepted by create() and dropped, so
// "$.applicant.name" and "applicant.name" address the same location.  The
// canonical string form never carries the "$." prefix; the empty path renders
// as "$".
//
// Paths compare and hash by canonical string form.  Every derivation returns
// a new Path.
// =============================================================================

namespace civdoc {

/**
 * One parsed segment of a Path: an object key, optionally followed by an
 * array index ("key[3]") or an array reference ("key[]").
 */
struct path_segment {
    enum class suffix : unsigned char { none, index, reference };

    std::string key;
    suffix      kind  = suffix::none;
    std::size_t index = 0;  // meaningful only when kind == suffix::index

    bool is_element()   const noexcept { return kind == suffix::index; }
    bool is_reference() const noexcept { return kind == suffix::reference; }

    std::string to_string() const {
        switch (kind) {
            case suffix::index:     return key + "[" + std::to_string(index) + "]";
            case suffix::reference: return key + "[]";
            default:                return key;
        }
    }

    bool operator==(const path_segment& o) const {
        return key == o.key && kind == o.kind && (kind != suffix::index || index == o.index);
    }
    bool operator!=(const path_segment& o) const { return !(*this == o); }
};

class Path {
public:
    static constexpr const char* json_path_start = "$";
    static constexpr char        divider         = '.';
    static constexpr const char* array_suffix    = "[]";

    Path() = default;

    /**
     * Parse a dotted/bracketed path.  Empty segments are skipped, so "a..b"
     * equals "a.b".  Throws path_error for text that is not a path at all
     * (e.g. "a[x]", "a[1", "[1]", "a[1]b") and for an index that does not
     * fit in size_t.
     */
    static Path create(std::string_view text) {
        text = trim(text);
        if (!text.empty() && text.front() == '$') {
            text.remove_prefix(1);
        }
        Path p;
        std::size_t start = 0;
        while (start <= text.size()) {
            std::size_t dot = text.find(divider, start);
            if (dot == std::string_view::npos) dot = text.size();
            std::string_view piece = text.substr(start, dot - start);
            if (!piece.empty()) {
                p.segments_.push_back(parse_segment(piece, text));
            }
            start = dot + 1;
        }
        return p;
    }

    static Path empty() { return Path(); }

    // ---- derivation ----

    /** Append one or more dotted segments ("a" or "a.b[0]"). */
    Path join(std::string_view text) const {
        return join(create(text));
    }

    Path join(const Path& other) const {
        Path p(*this);
        p.segments_.insert(p.segments_.end(), other.segments_.begin(), other.segments_.end());
        return p;
    }

    /** Append a single, already parsed segment. */
    Path join(const path_segment& seg) const {
        Path p(*this);
        p.segments_.push_back(seg);
        return p;
    }

    /** Replace any bracket suffix of the last segment with "[i]". */
    Path at_index(std::size_t i) const {
        Path p = with_last_kind(path_segment::suffix::index, "at_index");
        p.segments_.back().index = i;
        return p;
    }

    /** Replace any bracket suffix of the last segment with "[]". */
    Path as_array_element() const {
        return with_last_kind(path_segment::suffix::reference, "as_array_element");
    }

    /** Strip "[n]" or "[]" from the last segment; unchanged otherwise. */
    Path without_array_reference() const {
        if (segments_.empty()) return *this;
        return with_last_kind(path_segment::suffix::none, "without_array_reference");
    }

    /** Throws path_error when called on the empty path. */
    Path parent_path() const {
        if (segments_.empty()) {
            throw path_error("Path::parent_path: the root path has no parent");
        }
        Path p(*this);
        p.segments_.pop_back();
        return p;
    }

    // ---- inspection ----

    bool is_empty() const noexcept { return segments_.empty(); }

    bool is_array_element() const noexcept {
        return !segments_.empty() && segments_.back().is_element();
    }

    bool is_array_reference() const noexcept {
        return !segments_.empty() && segments_.back().is_reference();
    }

    /** Index of the last segment.  Throws path_error if it is not "[n]". */
    std::size_t array_index() const {
        if (!is_array_element()) {
            throw path_error("Path::array_index: not an array element: " + to_string());
        }
        return segments_.back().index;
    }

    /** Key of the last segment without any bracket suffix. */
    std::string key_name() const {
        if (segments_.empty()) {
            throw path_error("Path::key_name: the root path has no key");
        }
        return segments_.back().key;
    }

    bool starts_with(const Path& prefix) const {
        if (prefix.segments_.size() > segments_.size()) return false;
        for (std::size_t i = 0; i < prefix.segments_.size(); ++i) {
            if (segments_[i] != prefix.segments_[i]) return false;
        }
        return true;
    }

    const std::vector<path_segment>& segments() const noexcept { return segments_; }

    std::string to_string() const {
        if (segments_.empty()) return json_path_start;
        std::string out;
        for (const auto& seg : segments_) {
            if (!out.empty()) out += divider;
            out += seg.to_string();
        }
        return out;
    }

    /** "$.a.b" form, as consumed by the JSONPath engine. */
    std::string to_json_path() const {
        if (segments_.empty()) return json_path_start;
        return std::string(json_path_start) + divider + to_string();
    }

    bool operator==(const Path& other) const { return segments_ == other.segments_; }
    bool operator!=(const Path& other) const { return !(*this == other); }
    bool operator<(const Path& other) const  { return to_string() < other.to_string(); }

private:
    std::vector<path_segment> segments_;

    static std::string_view trim(std::string_view s) {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n')) s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n')) s.remove_suffix(1);
        return s;
    }

    static path_segment parse_segment(std::string_view piece, std::string_view whole) {
        path_segment seg;
        std::size_t open = piece.find('[');
        if (open == std::string_view::npos) {
            if (piece.find(']') != std::string_view::npos) {
                throw path_error("Path::create: unbalanced ']' in " + std::string(whole));
            }
            seg.key = std::string(piece);
            return seg;
        }
        if (open == 0 || piece.back() != ']') {
            throw path_error("Path::create: malformed segment '" + std::string(piece) +
                             "' in " + std::string(whole));
        }
        seg.key = std::string(piece.substr(0, open));
        std::string_view digits = piece.substr(open + 1, piece.size() - open - 2);
        if (digits.empty()) {
            seg.kind = path_segment::suffix::reference;
            return seg;
        }
        std::size_t index = 0;
        for (char c : digits) {
            if (c < '0' || c > '9') {
                throw path_error("Path::create: array index must be decimal in '" +
                                 std::string(piece) + "'");
            }
            std::size_t digit = static_cast<std::size_t>(c - '0');
            if (index > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
                throw path_error("Path::create: array index out of range in '" +
                                 std::string(piece) + "'");
            }
            index = index * 10 + digit;
        }
        seg.kind  = path_segment::suffix::index;
        seg.index = index;
        return seg;
    }

    Path with_last_kind(path_segment::suffix kind, const char* op) const {
        if (segments_.empty()) {
            throw path_error(std::string("Path::") + op + ": the root path has no last segment");
        }
        Path p(*this);
        p.segments_.back().kind  = kind;
        p.segments_.back().index = 0;
        return p;
    }
};

} // namespace civdoc

namespace std {
template<>
struct hash<civdoc::Path> {
    size_t operator()(const civdoc::Path& p) const {
        return hash<string>()(p.to_string());
    }
};
} // namespace std
