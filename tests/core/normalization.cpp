#include <chronicle/core/normalization.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

TEST_CASE("value normalization", "[core][normalization]")
{
    auto id = parse_object_id("507f1f77bcf86cd799439011");
    auto time = ptime(
        boost::gregorian::date(2017, boost::gregorian::Apr, 26),
        boost::posix_time::time_duration(1, 2, 3));

    REQUIRE(normalize_value(id) == dynamic("507f1f77bcf86cd799439011"));
    REQUIRE(normalize_value(time) == dynamic("2017-04-26T01:02:03.000Z"));
    REQUIRE(normalize_value(integer(4)) == dynamic(integer(4)));
    REQUIRE(normalize_value(nil) == dynamic(nil));

    dynamic_map document{
        {"_id", id},
        {"tags", dynamic_array{id, "x"}},
        {"meta", dynamic_map{{"at", time}, {"n", 1.5}}}};
    auto normalized = normalize_map(document);
    REQUIRE(
        normalized
        == (dynamic_map{
            {"_id", "507f1f77bcf86cd799439011"},
            {"tags", dynamic_array{"507f1f77bcf86cd799439011", "x"}},
            {"meta",
             dynamic_map{{"at", "2017-04-26T01:02:03.000Z"}, {"n", 1.5}}}}));
    // Field order is preserved.
    REQUIRE(normalized.begin()->first == "_id");
    REQUIRE(std::prev(normalized.end())->first == "meta");

    REQUIRE(!is_normalized(document));
    REQUIRE(is_normalized(normalized));
}

TEST_CASE("normalized equivalence", "[core][normalization]")
{
    auto id = parse_object_id("507f1f77bcf86cd799439011");
    REQUIRE(equivalent(id, dynamic("507f1f77bcf86cd799439011")));
    REQUIRE(
        equivalent(
            dynamic_map{{"ref", id}},
            dynamic_map{{"ref", "507f1f77bcf86cd799439011"}}));
    REQUIRE(!equivalent(id, dynamic("507f1f77bcf86cd799439012")));
    REQUIRE(!equivalent(integer(1), dynamic("1")));
}

TEST_CASE("numbers compare by value", "[core][normalization]")
{
    REQUIRE(normalized_equal(integer(1), 1.));
    REQUIRE(normalized_equal(2.5, 2.5));
    REQUIRE(!normalized_equal(integer(1), 1.5));
    REQUIRE(!normalized_equal(integer(0), false));
    REQUIRE(
        normalized_equal(
            dynamic_map{{"a", dynamic_array{integer(1)}}, {"b", 2.}},
            dynamic_map{{"b", integer(2)}, {"a", dynamic_array{1.}}}));
    REQUIRE(
        !normalized_equal(
            dynamic_map{{"a", integer(1)}},
            dynamic_map{{"a", integer(1)}, {"b", integer(2)}}));
    REQUIRE(
        !normalized_equal(
            dynamic_array{integer(1)}, dynamic_array{integer(1), 1.}));

    auto id = parse_object_id("507f1f77bcf86cd799439011");
    REQUIRE(
        equivalent(
            dynamic_map{{"ref", id}, {"n", integer(3)}},
            dynamic_map{{"ref", "507f1f77bcf86cd799439011"}, {"n", 3.}}));
}
