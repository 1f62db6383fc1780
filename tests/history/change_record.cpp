#include <chronicle/history/change_record.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <chronicle/core/testing.hpp>
#include <chronicle/history/snapshot.hpp>
#include <chronicle/patch/exclusion.hpp>

using namespace chronicle;

static ptime
some_time(int seconds)
{
    return ptime(
        boost::gregorian::date(2021, 3, 1),
        boost::posix_time::seconds(seconds));
}

TEST_CASE("snapshots", "[history][snapshot]")
{
    auto id = generate_object_id();
    auto author = generate_object_id();
    dynamic_map document{
        {"_id", id},
        {"__v", integer(3)},
        {"title", "foo"},
        {"author", author},
        {"createdAt", some_time(0)},
        {"updatedAt", some_time(5)}};

    REQUIRE(
        take_snapshot(document, false)
        == dynamic_map{
            {"title", "foo"},
            {"author", to_string(author)},
            {"createdAt", "2021-03-01T00:00:00.000Z"},
            {"updatedAt", "2021-03-01T00:00:05.000Z"}});

    REQUIRE(
        take_snapshot(document, true)
        == dynamic_map{{"title", "foo"}, {"author", to_string(author)}});

    REQUIRE(is_bookkeeping_field("_id", false));
    REQUIRE(!is_bookkeeping_field("updatedAt", false));
    REQUIRE(is_bookkeeping_field("updatedAt", true));
}

TEST_CASE("change record dynamic interface", "[history][change_record]")
{
    change_record record;
    record.id = generate_object_id();
    record.date = some_time(10);
    record.ref = generate_object_id();
    record.ops = {
        make_replace_operation(parse_path("/name"), "B"),
        make_remove_operation(parse_path("/tags/1"))};
    record.extra["user"] = "alice";

    test_dynamic_interface(
        record,
        dynamic_map{
            {"_id", record.id},
            {"date", some_time(10)},
            {"ref", record.ref},
            {"ops",
             dynamic_array{
                 dynamic_map{
                     {"op", "replace"}, {"path", "/name"}, {"value", "B"}},
                 dynamic_map{{"op", "remove"}, {"path", "/tags/1"}}}},
            {"user", "alice"}});

    // The ID fields can also be read from their string forms.
    auto from_strings = from_dynamic<change_record>(dynamic_map{
        {"_id", to_string(record.id)},
        {"date", "2021-03-01T00:00:10.000Z"},
        {"ref", to_string(record.ref)},
        {"ops", dynamic_array()}});
    REQUIRE(from_strings.id == record.id);
    REQUIRE(from_strings.date == record.date);
    REQUIRE(from_strings.ref == record.ref);
    REQUIRE(from_strings.extra.empty());

    REQUIRE_THROWS_AS(
        from_dynamic<change_record>(dynamic_map{{"_id", record.id}}),
        missing_field);
}

TEST_CASE("history ordering", "[history][change_record]")
{
    auto make_record = [](int seconds) {
        change_record record;
        record.id = generate_object_id();
        record.date = some_time(seconds);
        return record;
    };
    auto a = make_record(5);
    auto b = make_record(1);
    auto c = make_record(5);
    // Records with the same date are ordered by ID (i.e., creation order).
    REQUIRE(a.id < c.id);

    std::vector<change_record> history = {c, a, b};
    sort_history(history);
    REQUIRE(history == std::vector<change_record>{b, a, c});
    REQUIRE(record_precedes(b, a));
    REQUIRE(!record_precedes(c, a));
}

TEST_CASE("computing change records", "[history][change_record]")
{
    auto ref = generate_object_id();
    dynamic_map prior{{"name", "A"}, {"secret", "x"}};
    auto excludes = parse_exclude_patterns({"/secret"});

    SECTION("no surviving operations")
    {
        REQUIRE(!compute_change_ops(prior, prior, excludes, false));
        REQUIRE(!compute_change_record(
            ref,
            prior,
            dynamic_map{{"name", "A"}, {"secret", "y"}},
            excludes,
            false,
            some_time(0)));
    }

    SECTION("plain record")
    {
        auto record = compute_change_record(
            ref,
            prior,
            dynamic_map{{"name", "B"}, {"secret", "y"}},
            excludes,
            false,
            some_time(7));
        REQUIRE(record);
        REQUIRE(record->ref == ref);
        REQUIRE(record->date == some_time(7));
        REQUIRE(record->extra.empty());
        REQUIRE(
            record->ops
            == patch_operation_list{
                make_replace_operation(parse_path("/name"), "B")});
    }

    SECTION("annotated record")
    {
        auto ops = compute_change_ops(
            prior, dynamic_map{{"name", "B"}, {"secret", "x"}}, {}, true);
        REQUIRE(ops);
        auto expected = make_replace_operation(parse_path("/name"), "B");
        expected.original_value = dynamic("A");
        REQUIRE(*ops == patch_operation_list{expected});
    }

    SECTION("identifiers and their strings are the same value")
    {
        auto author = generate_object_id();
        REQUIRE(!compute_change_ops(
            dynamic_map{{"author", author}},
            dynamic_map{{"author", to_string(author)}},
            {},
            false));
    }
}
