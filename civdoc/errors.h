#pragma once

#include <stdexcept>
#include <string>

// =============================================================================
// civdoc error taxonomy
//
//   lock_violation     : mutation of a locked ApplicantData (programming bug)
//   input_format_error : malformed typed input (long, date, currency)
//   path_error         : misuse of Path (index of a non-element, parent of root)
//   structure_error    : a write would descend through / append to the wrong
//                        kind of node
//   query_error        : malformed JSONPath expression
//   path_not_found     : definite JSONPath that does not exist
//
// Absence and type mismatch are NOT exceptions: see lookup_status in
// coercion.h.
// =============================================================================

namespace civdoc {

class lock_violation : public std::logic_error {
public:
    explicit lock_violation(const std::string& what)
        : std::logic_error(what) {}
};

class input_format_error : public std::invalid_argument {
public:
    explicit input_format_error(const std::string& what)
        : std::invalid_argument(what) {}
};

class path_error : public std::logic_error {
public:
    explicit path_error(const std::string& what)
        : std::logic_error(what) {}
};

class structure_error : public std::runtime_error {
public:
    explicit structure_error(const std::string& what)
        : std::runtime_error(what) {}
};

class document_error : public std::runtime_error {
public:
    explicit document_error(const std::string& what)
        : std::runtime_error(what) {}
};

class query_error : public std::runtime_error {
public:
    explicit query_error(const std::string& what)
        : std::runtime_error(what) {}
};

class path_not_found : public query_error {
public:
    explicit path_not_found(const std::string& what)
        : query_error(what) {}
};

} // namespace civdoc
