#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "path.h"

namespace civdoc {

/**
 * A compiled visibility / eligibility condition: a JSONPath expression that
 * selects at least one node when the condition holds.
 *
 * The expression is built elsewhere from a predicate tree (leaf comparisons
 * joined with && and ||); this type only carries it to
 * ApplicantData::eval_predicate.
 */
class JsonPathPredicate {
public:
    static JsonPathPredicate create(std::string expression) {
        return JsonPathPredicate(std::move(expression));
    }

    /** "$.<path>[?(<condition>)]", e.g. condition "@.text == \"yellow\"". */
    static JsonPathPredicate create(const Path& path, std::string_view condition) {
        return JsonPathPredicate(path.to_json_path() + "[?(" + std::string(condition) + ")]");
    }

    const std::string& path_predicate() const noexcept { return expression_; }

    bool operator==(const JsonPathPredicate& o) const { return expression_ == o.expression_; }
    bool operator!=(const JsonPathPredicate& o) const { return expression_ != o.expression_; }

private:
    explicit JsonPathPredicate(std::string expression) : expression_(std::move(expression)) {}

    std::string expression_;
};

} // namespace civdoc
