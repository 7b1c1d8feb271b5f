#pragma once

#include <string_view>
#include <vector>

#include "json_value.h"

namespace civdoc {

/**
 * Query language seam used by ApplicantData::eval_predicate.
 *
 * An engine is handed to each ApplicantData at construction instead of being
 * looked up from process-wide state.  Implementations must be stateless with
 * respect to the documents they query, so one engine may be shared by many
 * documents on many threads.
 */
class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    /**
     * Evaluate expression against root and return the selected nodes, in
     * document order.  Pointers stay valid until root is next mutated.
     *
     * @throws query_error     when expression is not a valid query
     * @throws path_not_found  when a definite query selects nothing
     */
    virtual std::vector<const json_value*> select(const json_value& root,
                                                  std::string_view expression) const = 0;
};

} // namespace civdoc
