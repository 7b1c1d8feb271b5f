#pragma once

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include "errors.h"
#include "json_value.h"
#include "query_engine.h"

// =============================================================================
// civdoc::JsonPathEngine
//
// JSONPath evaluator for the expressions produced by predicate construction,
// e.g.
//
//     $.applicant.favorite_color[?(@.text == "yellow")]
//     $.applicant.household[?(@.income.currency_cents >= 100000 && @.age < 18)]
//     $.applicant.benefits[?(@.selections anyof ['snap', 'wic'])]
//
// Supported syntax:
//   roots        $  (document)   @  (current node, inside filters)
//   segments     .name  ['name']  [n]  [-n]  [*]  .*  ..name  ..*
//   filters      [?(expr)]  or  [?expr]
//   expr         expr || expr,  expr && expr,  !expr,  ( expr ),
//                operand OP operand,  path  (existence test)
//   OP           == != < <= > >= in nin subsetof anyof noneof size empty
//   literals     'str' "str" numbers true false null [lit, ...]
//
// Semantics:
//   - A filter applied to an object tests the object itself; applied to an
//     array it tests each element.
//   - A definite query (names and indices only) that selects nothing raises
//     path_not_found; an indefinite query just returns no nodes.
//   - A comparison with a missing operand is false.
//   - Integer literals and indices must fit in int64; nesting of '!', '(',
//     filters and list literals is capped at 64 levels and an expression at
//     1024 nodes.  Anything beyond raises query_error.
// =============================================================================

namespace civdoc {

namespace json_path_detail {

struct expr;

struct selector {
    enum class kind : unsigned char { name, index, wildcard, filter };

    kind                  k = kind::name;
    std::string           name;
    std::int64_t          index = 0;
    std::unique_ptr<expr> filter;
};

struct segment {
    bool                  descendant = false;
    std::vector<selector> selectors;
};

struct query {
    bool                 absolute = true;   // '$' vs '@'
    bool                 definite = true;   // only names and indices
    std::vector<segment> segments;
};

enum class compare_op : unsigned char {
    eq, ne, lt, le, gt, ge, in, nin, subsetof, anyof, noneof, size, empty
};

struct operand {
    std::variant<json_value, query> node;  // literal or path
};

struct expr {
    struct logical_or  { std::unique_ptr<expr> left; std::unique_ptr<expr> right; };
    struct logical_and { std::unique_ptr<expr> left; std::unique_ptr<expr> right; };
    struct logical_not { std::unique_ptr<expr> inner; };
    struct comparison  { operand left; compare_op op; operand right; };
    struct exists      { query path; };

    std::variant<logical_or, logical_and, logical_not, comparison, exists> node;
};

// ---- parser ----

class parser {
public:
    explicit parser(std::string_view input) : input_(input) {}

    query parse_root_query() {
        skip_ws();
        if (peek() != '$') {
            throw error("JSONPath must start with '$'");
        }
        query q = parse_query();
        skip_ws();
        if (pos_ != input_.size()) {
            throw error("Unexpected trailing characters");
        }
        return q;
    }

private:
    static constexpr int         max_nesting = 64;
    static constexpr std::size_t max_nodes   = 1024;

    std::string_view input_;
    std::size_t      pos_   = 0;
    int              depth_ = 0;
    std::size_t      nodes_ = 0;

    // Bounds recursion through '!', '(', nested filters and list literals.
    class nesting {
    public:
        explicit nesting(parser& p) : p_(p) {
            if (p_.depth_ >= max_nesting) {
                throw p_.error("Expression nested too deeply");
            }
            ++p_.depth_;
        }
        ~nesting() { --p_.depth_; }
        nesting(const nesting&) = delete;
        nesting& operator=(const nesting&) = delete;

    private:
        parser& p_;
    };

    std::unique_ptr<expr> make_expr() {
        if (++nodes_ > max_nodes) {
            throw error("Expression too long");
        }
        return std::make_unique<expr>();
    }

    template<typename Int>
    Int to_integer(std::size_t start, const char* what) const {
        const char* first = input_.data() + start;
        const char* last  = input_.data() + pos_;
        Int value = 0;
        auto result = std::from_chars(first, last, value);
        if (result.ec == std::errc::result_out_of_range) {
            throw error(std::string(what) + " out of range");
        }
        if (result.ec != std::errc() || result.ptr != last) {
            throw error(std::string("Invalid ") + what);
        }
        return value;
    }

    char peek(std::size_t ahead = 0) const {
        return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
    }

    char get() {
        if (pos_ >= input_.size()) {
            throw error("Unexpected end of input");
        }
        return input_[pos_++];
    }

    void skip_ws() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_str(const char* s) {
        skip_ws();
        std::size_t len = std::strlen(s);
        if (input_.substr(pos_, len) == s) {
            pos_ += len;
            return true;
        }
        return false;
    }

    // Word operators must not run into the following identifier ("in" vs "inner").
    bool consume_word(const char* w) {
        skip_ws();
        std::size_t len = std::strlen(w);
        if (input_.substr(pos_, len) != w) return false;
        char after = pos_ + len < input_.size() ? input_[pos_ + len] : '\0';
        if (std::isalnum(static_cast<unsigned char>(after)) || after == '_') return false;
        pos_ += len;
        return true;
    }

    query_error error(const std::string& message) const {
        return query_error(message + " at position " + std::to_string(pos_) +
                           " in '" + std::string(input_) + "'");
    }

    static bool is_name_char(char c) {
        if (static_cast<unsigned char>(c) >= 0x80) return true;
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '$';
    }

    query parse_query() {
        query q;
        q.absolute = (get() == '$');
        while (true) {
            char c = peek();
            if (c == '.') {
                if (peek(1) == '.') {
                    pos_ += 2;
                    q.definite = false;
                    segment seg;
                    seg.descendant = true;
                    if (peek() == '[') {
                        parse_bracket(q, seg);
                    } else {
                        seg.selectors.push_back(parse_dot_selector(q));
                    }
                    q.segments.push_back(std::move(seg));
                } else {
                    ++pos_;
                    segment seg;
                    seg.selectors.push_back(parse_dot_selector(q));
                    q.segments.push_back(std::move(seg));
                }
                continue;
            }
            if (c == '[') {
                segment seg;
                parse_bracket(q, seg);
                q.segments.push_back(std::move(seg));
                continue;
            }
            break;
        }
        return q;
    }

    selector parse_dot_selector(query& q) {
        selector sel;
        if (peek() == '*') {
            ++pos_;
            sel.k      = selector::kind::wildcard;
            q.definite = false;
            return sel;
        }
        std::size_t start = pos_;
        while (pos_ < input_.size() && is_name_char(input_[pos_])) ++pos_;
        if (pos_ == start) {
            throw error("Expected member name");
        }
        sel.k    = selector::kind::name;
        sel.name = std::string(input_.substr(start, pos_ - start));
        return sel;
    }

    void parse_bracket(query& q, segment& seg) {
        get();  // '['
        skip_ws();
        char c = peek();
        selector sel;
        if (c == '?') {
            ++pos_;
            skip_ws();
            bool parenthesised = consume('(');
            sel.k      = selector::kind::filter;
            sel.filter = parse_or();
            if (parenthesised && !consume(')')) {
                throw error("Expected ')' to close filter");
            }
            q.definite = false;
        } else if (c == '*') {
            ++pos_;
            sel.k      = selector::kind::wildcard;
            q.definite = false;
        } else if (c == '\'' || c == '"') {
            sel.k    = selector::kind::name;
            sel.name = parse_string_literal();
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            sel.k     = selector::kind::index;
            sel.index = parse_index();
        } else {
            throw error("Invalid selector");
        }
        if (!consume(']')) {
            throw error("Expected ']'");
        }
        seg.selectors.push_back(std::move(sel));
    }

    std::int64_t parse_index() {
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw error("Invalid index");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        return to_integer<std::int64_t>(start, "index");
    }

    std::string parse_string_literal() {
        char quote = get();
        std::string out;
        while (true) {
            char c = get();
            if (c == quote) break;
            if (c == '\\') {
                char e = get();
                switch (e) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    default:  out.push_back(e);    break;
                }
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    json_value parse_number_literal() {
        std::size_t start = pos_;
        bool is_float = false;
        if (peek() == '-') ++pos_;
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw error("Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
            is_float = true;
            ++pos_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            is_float = true;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Invalid number");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        if (!is_float) {
            return json_value::make_int(to_integer<std::int64_t>(start, "number"));
        }
        std::string text(input_.substr(start, pos_ - start));
        errno = 0;
        double value = std::strtod(text.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(value)) {
            throw error("number out of range");
        }
        return json_value::make_float(value);
    }

    json_value parse_literal() {
        skip_ws();
        char c = peek();
        if (c == '\'' || c == '"') {
            return json_value::make_string(parse_string_literal());
        }
        if (c == '[') {
            nesting guard(*this);
            ++pos_;
            json_value::array_t elements;
            skip_ws();
            if (peek() != ']') {
                do {
                    elements.push_back(parse_literal());
                } while (consume(','));
            }
            if (!consume(']')) {
                throw error("Expected ']' to close list literal");
            }
            return json_value::make_array(std::move(elements));
        }
        if (consume_word("true"))  return json_value::make_bool(true);
        if (consume_word("false")) return json_value::make_bool(false);
        if (consume_word("null"))  return json_value::make_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number_literal();
        }
        throw error("Invalid literal");
    }

    operand parse_operand() {
        skip_ws();
        char c = peek();
        if (c == '$' || c == '@') {
            return operand{parse_query()};
        }
        return operand{parse_literal()};
    }

    std::unique_ptr<expr> parse_or() {
        auto left = parse_and();
        while (consume_str("||")) {
            auto e  = make_expr();
            e->node = expr::logical_or{std::move(left), parse_and()};
            left    = std::move(e);
        }
        return left;
    }

    std::unique_ptr<expr> parse_and() {
        auto left = parse_unary();
        while (consume_str("&&")) {
            auto e  = make_expr();
            e->node = expr::logical_and{std::move(left), parse_unary()};
            left    = std::move(e);
        }
        return left;
    }

    std::unique_ptr<expr> parse_unary() {
        nesting guard(*this);
        skip_ws();
        if (peek() == '!' && peek(1) != '=') {
            ++pos_;
            auto e  = make_expr();
            e->node = expr::logical_not{parse_unary()};
            return e;
        }
        if (consume('(')) {
            auto inner = parse_or();
            if (!consume(')')) {
                throw error("Expected ')' after expression");
            }
            return inner;
        }
        return parse_comparison();
    }

    bool parse_compare_op(compare_op& op) {
        if (consume_str("=="))      { op = compare_op::eq; return true; }
        if (consume_str("!="))      { op = compare_op::ne; return true; }
        if (consume_str("<="))      { op = compare_op::le; return true; }
        if (consume_str(">="))      { op = compare_op::ge; return true; }
        if (consume_str("<"))       { op = compare_op::lt; return true; }
        if (consume_str(">"))       { op = compare_op::gt; return true; }
        if (consume_word("nin"))      { op = compare_op::nin;      return true; }
        if (consume_word("in"))       { op = compare_op::in;       return true; }
        if (consume_word("subsetof")) { op = compare_op::subsetof; return true; }
        if (consume_word("anyof"))    { op = compare_op::anyof;    return true; }
        if (consume_word("noneof"))   { op = compare_op::noneof;   return true; }
        if (consume_word("size"))     { op = compare_op::size;     return true; }
        if (consume_word("empty"))    { op = compare_op::empty;    return true; }
        return false;
    }

    std::unique_ptr<expr> parse_comparison() {
        operand left = parse_operand();
        compare_op op = compare_op::eq;
        auto e = make_expr();
        if (!parse_compare_op(op)) {
            if (!std::holds_alternative<query>(left.node)) {
                throw error("Expected comparison operator after literal");
            }
            e->node = expr::exists{std::move(std::get<query>(left.node))};
            return e;
        }
        operand right = parse_operand();
        e->node = expr::comparison{std::move(left), op, std::move(right)};
        return e;
    }
};

// ---- evaluator ----

using node_list = std::vector<const json_value*>;

inline node_list eval_query(const query& q, const json_value& root, const json_value& current);
inline bool eval_expr(const expr& e, const json_value& root, const json_value& current);

inline void collect_descendants(const json_value* node, node_list& out) {
    out.push_back(node);
    if (node->is_array()) {
        for (const auto& child : node->elements()) collect_descendants(&child, out);
    } else if (node->is_object()) {
        for (const auto& m : node->members()) collect_descendants(&m.second, out);
    }
}

inline void apply_selector(const selector& sel, const json_value* node,
                           const json_value& root, node_list& out) {
    switch (sel.k) {
        case selector::kind::name:
            if (const json_value* child = node->find(sel.name)) out.push_back(child);
            return;

        case selector::kind::index: {
            if (!node->is_array()) return;
            std::int64_t n = static_cast<std::int64_t>(node->size());
            std::int64_t i = sel.index < 0 ? n + sel.index : sel.index;
            if (i >= 0 && i < n) out.push_back(node->at(static_cast<std::size_t>(i)));
            return;
        }

        case selector::kind::wildcard:
            if (node->is_array()) {
                for (const auto& child : node->elements()) out.push_back(&child);
            } else if (node->is_object()) {
                for (const auto& m : node->members()) out.push_back(&m.second);
            }
            return;

        case selector::kind::filter:
            if (node->is_array()) {
                for (const auto& child : node->elements()) {
                    if (eval_expr(*sel.filter, root, child)) out.push_back(&child);
                }
            } else if (node->is_object()) {
                if (eval_expr(*sel.filter, root, *node)) out.push_back(node);
            }
            return;
    }
}

inline node_list eval_query(const query& q, const json_value& root, const json_value& current) {
    node_list nodes{q.absolute ? &root : &current};
    for (const auto& seg : q.segments) {
        node_list inputs;
        if (seg.descendant) {
            for (const json_value* n : nodes) collect_descendants(n, inputs);
        } else {
            inputs = std::move(nodes);
        }
        node_list next;
        for (const json_value* n : inputs) {
            for (const auto& sel : seg.selectors) apply_selector(sel, n, root, next);
        }
        nodes = std::move(next);
        if (nodes.empty()) break;
    }
    return nodes;
}

// An operand resolves to a value, or to nothing when its path is missing.
struct resolved {
    const json_value* ref = nullptr;
    json_value        owned;
    bool              present = false;

    const json_value& value() const { return ref ? *ref : owned; }
};

inline resolved resolve(const operand& o, const json_value& root, const json_value& current) {
    resolved r;
    if (const json_value* lit = std::get_if<json_value>(&o.node)) {
        r.ref     = lit;
        r.present = true;
        return r;
    }
    const query& q = std::get<query>(o.node);
    node_list nodes = eval_query(q, root, current);
    if (q.definite) {
        if (!nodes.empty()) {
            r.ref     = nodes.front();
            r.present = true;
        }
        return r;
    }
    json_value::array_t gathered;
    for (const json_value* n : nodes) gathered.push_back(*n);
    r.owned   = json_value::make_array(std::move(gathered));
    r.present = true;
    return r;
}

inline bool values_equal(const json_value& a, const json_value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_int() && b.is_int()) return a.get_int() == b.get_int();
        return a.as_double() == b.as_double();
    }
    if (a.type() != b.type()) return false;
    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!values_equal(*a.at(i), *b.at(i))) return false;
        }
        return true;
    }
    return a == b;
}

// -1 / 0 / 1, or 2 when the values are not ordered against each other.
inline int order(const json_value& a, const json_value& b) {
    if (a.is_number() && b.is_number()) {
        if (a.is_int() && b.is_int()) {
            return a.get_int() < b.get_int() ? -1 : (a.get_int() > b.get_int() ? 1 : 0);
        }
        double x = a.as_double();
        double y = b.as_double();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        int c = a.get_string().compare(b.get_string());
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return 2;
}

inline bool contains(const json_value& list, const json_value& item) {
    if (!list.is_array()) return false;
    for (const auto& e : list.elements()) {
        if (values_equal(e, item)) return true;
    }
    return false;
}

inline bool compare(compare_op op, const json_value& l, const json_value& r) {
    switch (op) {
        case compare_op::eq: return values_equal(l, r);
        case compare_op::ne: return !values_equal(l, r);
        case compare_op::lt: { int o = order(l, r); return o == -1; }
        case compare_op::le: { int o = order(l, r); return o == -1 || o == 0; }
        case compare_op::gt: { int o = order(l, r); return o == 1; }
        case compare_op::ge: { int o = order(l, r); return o == 1 || o == 0; }
        case compare_op::in:  return r.is_array() && contains(r, l);
        case compare_op::nin: return r.is_array() && !contains(r, l);
        case compare_op::subsetof:
            if (!l.is_array() || !r.is_array()) return false;
            for (const auto& e : l.elements()) {
                if (!contains(r, e)) return false;
            }
            return true;
        case compare_op::anyof:
            if (!l.is_array() || !r.is_array()) return false;
            for (const auto& e : l.elements()) {
                if (contains(r, e)) return true;
            }
            return false;
        case compare_op::noneof:
            if (!l.is_array() || !r.is_array()) return false;
            for (const auto& e : l.elements()) {
                if (contains(r, e)) return false;
            }
            return true;
        case compare_op::size: {
            if (!r.is_int()) return false;
            std::int64_t n = r.get_int();
            if (l.is_string()) return static_cast<std::int64_t>(l.get_string().size()) == n;
            if (l.is_array())  return static_cast<std::int64_t>(l.size()) == n;
            return false;
        }
        case compare_op::empty: {
            if (!r.is_bool()) return false;
            bool is_empty;
            if (l.is_string())     is_empty = l.get_string().empty();
            else if (l.is_array()) is_empty = l.size() == 0;
            else return false;
            return is_empty == r.get_bool();
        }
    }
    return false;
}

inline bool eval_expr(const expr& e, const json_value& root, const json_value& current) {
    if (const auto* o = std::get_if<expr::logical_or>(&e.node)) {
        return eval_expr(*o->left, root, current) || eval_expr(*o->right, root, current);
    }
    if (const auto* a = std::get_if<expr::logical_and>(&e.node)) {
        return eval_expr(*a->left, root, current) && eval_expr(*a->right, root, current);
    }
    if (const auto* n = std::get_if<expr::logical_not>(&e.node)) {
        return !eval_expr(*n->inner, root, current);
    }
    if (const auto* x = std::get_if<expr::exists>(&e.node)) {
        return !eval_query(x->path, root, current).empty();
    }
    const auto& c = std::get<expr::comparison>(e.node);
    resolved l = resolve(c.left, root, current);
    resolved r = resolve(c.right, root, current);
    if (!l.present || !r.present) return false;
    return compare(c.op, l.value(), r.value());
}

} // namespace json_path_detail

class JsonPathEngine : public QueryEngine {
public:
    std::vector<const json_value*> select(const json_value& root,
                                          std::string_view expression) const override {
        json_path_detail::parser p(expression);
        json_path_detail::query q = p.parse_root_query();
        std::vector<const json_value*> nodes = json_path_detail::eval_query(q, root, root);
        if (nodes.empty() && q.definite) {
            throw path_not_found("No results for path: " + std::string(expression));
        }
        return nodes;
    }
};

} // namespace civdoc
