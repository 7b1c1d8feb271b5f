#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "civdoc/applicant_data.h"

// =============================================================================
// civdoc::ApplicantData document store
//
// Tests cover:
//   - construction, hydration and serialization
//   - typed writes / reads and empty-input clearing
//   - auto-vivification and gap-free arrays
//   - repeated entities: put, read, delete, clear
//   - lock() rejecting every mutator while reads keep working
//   - applicant name helpers and preferred locale
//   - equality and hashing by serialized form
// =============================================================================

using namespace civdoc;

namespace {

Path p(const char* text) { return Path::create(text); }

} // namespace

// ---- construction ----

TEST_CASE("ApplicantData: default document has an empty applicant object", "[applicant_data]")
{
    ApplicantData data;
    REQUIRE(data.as_json_string() == R"({"applicant":{}})");
    REQUIRE(data.has_path(well_known_paths::applicant()));
    REQUIRE_FALSE(data.is_locked());
}

TEST_CASE("ApplicantData: hydrate keeps the persisted text", "[applicant_data]")
{
    const char* json = R"({"applicant":{"name":{"first_name":"Ana"},"age":30}})";
    ApplicantData data(json);
    REQUIRE(data.as_json_string() == json);
    REQUIRE(data.read_long(p("applicant.age")) == std::optional<std::int64_t>(30));
}

TEST_CASE("ApplicantData: hydrate rejects a non-object root", "[applicant_data][errors]")
{
    REQUIRE_THROWS_AS(ApplicantData("[1,2]"), document_error);
    REQUIRE_THROWS_AS(ApplicantData("{\"applicant\":"), nlohmann::json::parse_error);
}

// ---- typed writes and reads ----

TEST_CASE("ApplicantData: put_string builds missing ancestors", "[applicant_data][write]")
{
    ApplicantData data;
    data.put_string(p("applicant.name.first_name"), "Ana");
    REQUIRE(data.as_json_string() == R"({"applicant":{"name":{"first_name":"Ana"}}})");
    REQUIRE(data.has_path(p("applicant.name")));
    REQUIRE(data.read_string(p("applicant.name.first_name")) == std::optional<std::string>("Ana"));
}

TEST_CASE("ApplicantData: put_long from text and from integer", "[applicant_data][write]")
{
    ApplicantData data;
    data.put_long(p("applicant.age"), std::string_view("42"));
    data.put_long(p("applicant.children_count"), std::int64_t{3});
    REQUIRE(data.read_long(p("applicant.age")) == std::optional<std::int64_t>(42));
    REQUIRE(data.read_long(p("applicant.children_count")) == std::optional<std::int64_t>(3));

    REQUIRE_THROWS_AS(data.put_long(p("applicant.age"), std::string_view("forty")), input_format_error);
    REQUIRE(data.read_long(p("applicant.age")) == std::optional<std::int64_t>(42));
}

TEST_CASE("ApplicantData: put_date stores epoch millis and reads back", "[applicant_data][write]")
{
    ApplicantData data;
    data.put_date(well_known_paths::applicant_dob(), "2020-01-15");
    REQUIRE(data.read_long(well_known_paths::applicant_dob()) == std::optional<std::int64_t>(1579046400000LL));
    REQUIRE(data.read_date(well_known_paths::applicant_dob()) == std::optional<LocalDate>(LocalDate::parse("2020-01-15")));

    REQUIRE_THROWS_AS(data.put_date(well_known_paths::applicant_dob(), "2020-02-30"), input_format_error);
}

TEST_CASE("ApplicantData: empty input clears the path", "[applicant_data][write]")
{
    ApplicantData data;
    Path dob = well_known_paths::applicant_dob();

    data.put_date(dob, "2020-01-15");
    REQUIRE(data.has_path(dob));
    data.put_date(dob, "");
    REQUIRE_FALSE(data.has_path(dob));

    data.put_string(p("applicant.nickname"), "Bo");
    data.put_string(p("applicant.nickname"), "");
    REQUIRE_FALSE(data.has_path(p("applicant.nickname")));

    data.put_currency_dollars(p("applicant.income"), "100");
    data.put_currency_dollars(p("applicant.income"), "");
    REQUIRE_FALSE(data.has_path(p("applicant.income")));

    // Clearing what was never there is harmless.
    data.put_long(p("applicant.missing.deep"), std::string_view(""));
    REQUIRE_FALSE(data.has_path(p("applicant.missing")));
}

TEST_CASE("ApplicantData: empty input on an array element never shifts the array", "[applicant_data][write]")
{
    ApplicantData data;
    data.put(p("applicant.scores[0]"), json_value::make_int(1));
    data.put(p("applicant.scores[1]"), json_value::make_int(2));
    data.put_string(p("applicant.scores[0]"), "");
    REQUIRE(data.read_list(p("applicant.scores")) == std::optional<std::vector<std::int64_t>>({1, 2}));
}

TEST_CASE("ApplicantData: put_currency_dollars stores cents", "[applicant_data][write]")
{
    ApplicantData data;
    data.put_currency_dollars(p("applicant.income.amount"), "1,234.56");
    REQUIRE(data.read_long(p("applicant.income.amount")) == std::optional<std::int64_t>(123456));
    REQUIRE(data.read_currency(p("applicant.income.amount"))->pretty_print() == "$1,234.56");

    REQUIRE_THROWS_AS(data.put_currency_dollars(p("applicant.income.amount"), "12,34"), input_format_error);
}

TEST_CASE("ApplicantData: text that is not UTF-8 is rejected before any change", "[applicant_data][write][errors]")
{
    ApplicantData data;
    data.put_string(p("applicant.name.first_name"), "Jos\xC3\xA9");
    const std::string before = data.as_json_string();

    REQUIRE_THROWS_AS(data.put_string(p("applicant.note.text"), "\xC3\x28"), input_format_error);
    REQUIRE_THROWS_AS(data.put_string(p("applicant.kids[0].entity_name"), "\xFF"), input_format_error);
    REQUIRE_THROWS_AS(data.put(p("applicant.bad\xC3\x28key"), json_value::make_int(1)), input_format_error);
    REQUIRE_THROWS_AS(data.maybe_clear_array(p("applicant.bad\xC3\x28key.items[0]")), input_format_error);

    json_value nested = json_value::make_object();
    nested.set("ok", json_value::make_string("fine"));
    nested.set("list", json_value::make_array({json_value::make_string("\xC3\x28")}));
    REQUIRE_THROWS_AS(data.put(p("applicant.nested"), nested), input_format_error);

    REQUIRE(data.as_json_string() == before);
    REQUIRE_FALSE(data.has_path(p("applicant.note")));
    REQUIRE_FALSE(data.has_path(p("applicant.kids")));
    REQUIRE(ApplicantData(data.as_json_string()) == data);
}

TEST_CASE("ApplicantData: negative stored cents read back as a currency", "[applicant_data][read]")
{
    ApplicantData data(R"({"applicant":{"refund":-150}})");
    REQUIRE(data.read_currency(p("applicant.refund"))->pretty_print() == "-$1.50");
}

TEST_CASE("ApplicantData: reads of the wrong kind are absent", "[applicant_data][read]")
{
    ApplicantData data(R"({"applicant":{"name":"Ana","age":30,"tags":["a"],"gone":null}})");

    REQUIRE_FALSE(data.read_long(p("applicant.name")).has_value());
    REQUIRE_FALSE(data.read_string(p("applicant.age")).has_value());
    REQUIRE_FALSE(data.read_date(p("applicant.name")).has_value());
    REQUIRE_FALSE(data.read_list(p("applicant.tags")).has_value());
    REQUIRE_FALSE(data.read_string(p("applicant.nothing.here")).has_value());
    REQUIRE_FALSE(data.read_string(p("applicant.name.first")).has_value());

    REQUIRE(data.has_path(p("applicant.gone")));
    REQUIRE_FALSE(data.has_value_at_path(p("applicant.gone")));
    REQUIRE_FALSE(data.read_string(p("applicant.gone")).has_value());
}

TEST_CASE("ApplicantData: read_as_string renders integer lists", "[applicant_data][read]")
{
    ApplicantData data(R"({"applicant":{"ids":[1,2,3],"empty":[],"name":"Ana","mixed":[1,"x"]}})");

    REQUIRE(data.read_as_string(p("applicant.ids")) == std::optional<std::string>("[1, 2, 3]"));
    REQUIRE(data.read_as_string(p("applicant.empty")) == std::optional<std::string>("[]"));
    REQUIRE(data.read_as_string(p("applicant.name")) == std::optional<std::string>("Ana"));
    REQUIRE_FALSE(data.read_as_string(p("applicant.mixed")).has_value());
}

// ---- structure ----

TEST_CASE("ApplicantData: indexed writes keep arrays gap-free", "[applicant_data][structure]")
{
    ApplicantData data;
    data.put_string(p("applicant.kids[2].name"), "Cy");
    REQUIRE(data.as_json_string() == R"({"applicant":{"kids":[{},{},{"name":"Cy"}]}})");

    data.put_string(p("applicant.kids[0].name"), "Al");
    data.put_string(p("applicant.kids[1].name"), "Bo");
    REQUIRE(data.as_json_string() ==
            R"({"applicant":{"kids":[{"name":"Al"},{"name":"Bo"},{"name":"Cy"}]}})");
}

TEST_CASE("ApplicantData: leaf writes at an index overwrite, append or pad", "[applicant_data][structure]")
{
    ApplicantData data;
    data.put(p("applicant.xs[0]"), json_value::make_int(10));
    data.put(p("applicant.xs[1]"), json_value::make_int(11));
    data.put(p("applicant.xs[0]"), json_value::make_int(20));
    REQUIRE(data.read_list(p("applicant.xs")) == std::optional<std::vector<std::int64_t>>({20, 11}));

    data.put(p("applicant.ys[1]"), json_value::make_int(5));
    REQUIRE(data.as_json_string() == R"({"applicant":{"xs":[20,11],"ys":[{},5]}})");
}

TEST_CASE("ApplicantData: nested arrays are materialized in one descent", "[applicant_data][structure]")
{
    ApplicantData data;
    data.put_string(p("applicant.jobs[1].shifts[1].day"), "Mon");
    REQUIRE(data.as_json_string() ==
            R"({"applicant":{"jobs":[{},{"shifts":[{},{"day":"Mon"}]}]}})");
}

TEST_CASE("ApplicantData: writing through a scalar is a structure error", "[applicant_data][structure][errors]")
{
    ApplicantData data(R"({"applicant":{"age":30,"tags":"x"}})");
    REQUIRE_THROWS_AS(data.put_string(p("applicant.age.years"), "3"), structure_error);
    REQUIRE_THROWS_AS(data.put_string(p("applicant.tags[0]"), "a"), structure_error);
    REQUIRE_THROWS_AS(data.put(Path::empty(), json_value::make_object()), path_error);
}

// ---- deletion ----

TEST_CASE("ApplicantData: maybe_delete is idempotent", "[applicant_data][delete]")
{
    ApplicantData data;
    data.put_string(p("applicant.name.first_name"), "Ana");
    data.maybe_delete(p("applicant.name.first_name"));
    REQUIRE_FALSE(data.has_path(p("applicant.name.first_name")));
    REQUIRE(data.has_path(p("applicant.name")));
    REQUIRE_NOTHROW(data.maybe_delete(p("applicant.name.first_name")));
    REQUIRE_NOTHROW(data.maybe_delete(p("applicant.nowhere.at.all")));
}

TEST_CASE("ApplicantData: maybe_clear_array removes the whole array", "[applicant_data][delete]")
{
    ApplicantData data;
    data.put_string(p("applicant.pets[0].kind"), "cat");
    data.put_string(p("applicant.pets[1].kind"), "dog");
    data.maybe_clear_array(p("applicant.pets[1]"));
    REQUIRE_FALSE(data.has_path(p("applicant.pets")));

    // Parent structure is created even when there was nothing to clear.
    data.maybe_clear_array(p("applicant.household.members[0]"));
    REQUIRE(data.has_path(p("applicant.household")));
    REQUIRE_FALSE(data.has_path(p("applicant.household.members")));

    // Not an array element: nothing happens.
    data.put_string(p("applicant.note"), "x");
    data.maybe_clear_array(p("applicant.note"));
    REQUIRE(data.has_path(p("applicant.note")));
}

// ---- repeated entities ----

TEST_CASE("ApplicantData: put and read repeated entities", "[applicant_data][entities]")
{
    ApplicantData data;
    Path members = p("applicant.household_members[]");
    data.put_repeated_entities(members, {"Alice", "Bob"});

    REQUIRE(data.read_repeated_entities(members) == std::vector<std::string>{"Alice", "Bob"});
    REQUIRE(data.read_string(p("applicant.household_members[1].entity_name")) == std::optional<std::string>("Bob"));

    // Rewriting names leaves other entity data alone.
    data.put_long(p("applicant.household_members[0].age"), std::int64_t{9});
    data.put_repeated_entities(members, {"Alicia", "Bob"});
    REQUIRE(data.read_long(p("applicant.household_members[0].age")) == std::optional<std::int64_t>(9));
    REQUIRE(data.read_repeated_entities(members).front() == "Alicia");
}

TEST_CASE("ApplicantData: entities without a name read as empty strings", "[applicant_data][entities]")
{
    ApplicantData data;
    data.put_string(p("applicant.kids[1].entity_name"), "Bo");
    REQUIRE(data.read_repeated_entities(p("applicant.kids[]")) == std::vector<std::string>{"", "Bo"});
    REQUIRE(data.read_repeated_entities(p("applicant.nobody[]")).empty());
}

TEST_CASE("ApplicantData: delete_repeated_entities removes from the highest index down", "[applicant_data][entities]")
{
    ApplicantData data;
    Path kids = p("applicant.kids[]");
    data.put_repeated_entities(kids, {"A", "B", "C"});

    REQUIRE(data.delete_repeated_entities(kids, {0, 2}));
    REQUIRE(data.read_repeated_entities(kids) == std::vector<std::string>{"B"});
}

TEST_CASE("ApplicantData: delete_repeated_entities edge cases", "[applicant_data][entities]")
{
    ApplicantData data;
    Path kids = p("applicant.kids[]");
    data.put_repeated_entities(kids, {"A", "B", "C"});

    REQUIRE_FALSE(data.delete_repeated_entities(kids, {}));
    REQUIRE_FALSE(data.delete_repeated_entities(kids, {1, 5}));
    REQUIRE(data.read_repeated_entities(kids).size() == 3);

    REQUIRE(data.delete_repeated_entities(kids, {1, 1}));
    REQUIRE(data.read_repeated_entities(kids) == std::vector<std::string>{"A", "C"});
}

TEST_CASE("ApplicantData: maybe_clear_repeated_entities", "[applicant_data][entities]")
{
    ApplicantData data;
    Path kids = p("applicant.kids[]");

    data.put_repeated_entities(kids, {});
    REQUIRE(data.as_json_string() == R"({"applicant":{"kids":[]}})");
    REQUIRE(data.maybe_clear_repeated_entities(kids));
    REQUIRE_FALSE(data.has_path(p("applicant.kids")));
    REQUIRE(data.maybe_clear_repeated_entities(kids));

    data.put_repeated_entities(kids, {"A"});
    REQUIRE_FALSE(data.maybe_clear_repeated_entities(kids));
    REQUIRE(data.read_repeated_entities(kids) == std::vector<std::string>{"A"});
}

// ---- lock ----

TEST_CASE("ApplicantData: a locked store rejects every mutation", "[applicant_data][lock]")
{
    ApplicantData data;
    data.put_string(p("applicant.name.first_name"), "Ana");
    data.put_repeated_entities(p("applicant.kids[]"), {"A"});
    data.lock();
    REQUIRE(data.is_locked());

    const std::string before = data.as_json_string();
    ApplicantData other(R"({"applicant":{"extra":1}})");

    REQUIRE_THROWS_AS(data.put_string(p("applicant.x"), "y"), lock_violation);
    REQUIRE_THROWS_AS(data.put_string(p("applicant.x"), ""), lock_violation);
    REQUIRE_THROWS_AS(data.put_long(p("applicant.x"), std::int64_t{1}), lock_violation);
    REQUIRE_THROWS_AS(data.put_long(p("applicant.x"), std::string_view("1")), lock_violation);
    REQUIRE_THROWS_AS(data.put_date(p("applicant.x"), "2020-01-01"), lock_violation);
    REQUIRE_THROWS_AS(data.put_currency_dollars(p("applicant.x"), "1.00"), lock_violation);
    REQUIRE_THROWS_AS(data.put(p("applicant.x"), json_value::make_int(1)), lock_violation);
    REQUIRE_THROWS_AS(data.put_repeated_entities(p("applicant.kids[]"), {"B"}), lock_violation);
    REQUIRE_THROWS_AS(data.maybe_delete(p("applicant.name")), lock_violation);
    REQUIRE_THROWS_AS(data.maybe_clear_array(p("applicant.kids[0]")), lock_violation);
    REQUIRE_THROWS_AS(data.delete_repeated_entities(p("applicant.kids[]"), {0}), lock_violation);
    REQUIRE_THROWS_AS(data.maybe_clear_repeated_entities(p("applicant.kids[]")), lock_violation);
    REQUIRE_THROWS_AS(data.merge_from(other), lock_violation);
    REQUIRE_THROWS_AS(data.set_user_name("Bo Bell"), lock_violation);
    REQUIRE_THROWS_AS(data.set_preferred_locale("es-MX"), lock_violation);

    REQUIRE(data.as_json_string() == before);
    REQUIRE(data.read_string(p("applicant.name.first_name")) == std::optional<std::string>("Ana"));
    REQUIRE(data.applicant_name() == "Ana");
}

// ---- names and locale ----

TEST_CASE("ApplicantData: applicant_name", "[applicant_data][name]")
{
    ApplicantData anonymous;
    REQUIRE(anonymous.applicant_name() == ApplicantData::anonymous_applicant);

    ApplicantData first_only;
    first_only.put_string(well_known_paths::applicant_first_name(), "Ana");
    REQUIRE(first_only.applicant_name() == "Ana");

    ApplicantData full;
    full.put_string(well_known_paths::applicant_first_name(), "Ana");
    full.put_string(well_known_paths::applicant_last_name(), "Lopez");
    REQUIRE(full.applicant_name() == "Lopez, Ana");
}

TEST_CASE("ApplicantData: set_user_name splits a display name", "[applicant_data][name]")
{
    ApplicantData two;
    two.set_user_name("Ana Lopez");
    REQUIRE(two.read_string(well_known_paths::applicant_first_name()) == std::optional<std::string>("Ana"));
    REQUIRE(two.read_string(well_known_paths::applicant_last_name()) == std::optional<std::string>("Lopez"));
    REQUIRE_FALSE(two.has_path(well_known_paths::applicant_middle_name()));

    ApplicantData three;
    three.set_user_name("Ana Maria Lopez");
    REQUIRE(three.read_string(well_known_paths::applicant_middle_name()) == std::optional<std::string>("Maria"));

    ApplicantData many;
    many.set_user_name("Ana Maria de Lopez");
    REQUIRE(many.read_string(well_known_paths::applicant_first_name()) ==
            std::optional<std::string>("Ana Maria de Lopez"));
    REQUIRE_FALSE(many.has_path(well_known_paths::applicant_last_name()));
}

TEST_CASE("ApplicantData: set_user_name never overwrites", "[applicant_data][name]")
{
    ApplicantData data;
    data.put_string(well_known_paths::applicant_first_name(), "Ana");
    data.set_user_name("Bea", std::string("Cruz"), std::string("Diaz"));
    REQUIRE(data.applicant_name() == "Diaz, Ana");
    REQUIRE(data.read_string(well_known_paths::applicant_middle_name()) == std::optional<std::string>("Cruz"));
}

TEST_CASE("ApplicantData: preferred locale", "[applicant_data][locale]")
{
    ApplicantData plain;
    REQUIRE_FALSE(plain.has_preferred_locale());
    REQUIRE(plain.preferred_locale() == "en-US");

    ApplicantData spanish(std::string("es-MX"), R"({"applicant":{}})");
    REQUIRE(spanish.has_preferred_locale());
    REQUIRE(spanish.preferred_locale() == "es-MX");

    plain.set_preferred_locale("vi");
    REQUIRE(plain.preferred_locale() == "vi");
}

// ---- equality ----

TEST_CASE("ApplicantData: equality and hash follow the serialized text", "[applicant_data][equality]")
{
    ApplicantData a(R"({"applicant":{"x":1,"y":2}})");
    ApplicantData b;
    b.put_long(p("applicant.x"), std::int64_t{1});
    b.put_long(p("applicant.y"), std::int64_t{2});
    REQUIRE(a == b);
    REQUIRE(std::hash<ApplicantData>()(a) == std::hash<ApplicantData>()(b));

    // Same content, different key order: not equal.
    ApplicantData c(R"({"applicant":{"y":2,"x":1}})");
    REQUIRE(a != c);

    // Locale and lock state are not part of the document.
    ApplicantData d(std::string("fr-FR"), R"({"applicant":{"x":1,"y":2}})");
    d.lock();
    REQUIRE(a == d);
}
