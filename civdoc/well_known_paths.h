#pragma once

#include "path.h"

// Canonical locations inside every applicant document.

namespace civdoc {

namespace scalar {
// Name scalar carried by each repeated entity: <enumerator>[i].entity_name
constexpr const char* entity_name = "entity_name";
} // namespace scalar

namespace well_known_paths {

constexpr const char* applicant_root = "applicant";

inline Path applicant()             { return Path::create(applicant_root); }
inline Path applicant_first_name()  { return Path::create("applicant.name.first_name"); }
inline Path applicant_middle_name() { return Path::create("applicant.name.middle_name"); }
inline Path applicant_last_name()   { return Path::create("applicant.name.last_name"); }
inline Path applicant_dob()         { return Path::create("applicant.applicant_date_of_birth.date"); }

} // namespace well_known_paths

constexpr const char* default_locale = "en-US";

} // namespace civdoc
