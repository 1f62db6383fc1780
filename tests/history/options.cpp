#include <chronicle/history/options.hpp>

#include <chronicle/core/testing.hpp>
#include <chronicle/encodings/yaml.hpp>

using namespace chronicle;

TEST_CASE("history options defaults", "[history][options]")
{
    auto options = from_dynamic<history_options>(
        dynamic_map{{"name", "post"}, {"collection", "posts"}});
    REQUIRE(options.name == "post");
    REQUIRE(options.collection == "posts");
    REQUIRE(options.history_collection.empty());
    REQUIRE(get_history_collection(options) == "post_history");
    REQUIRE(options.excludes.empty());
    REQUIRE(options.includes.empty());
    REQUIRE(options.purge_on_delete);
    REQUIRE(!options.track_original_value);
    REQUIRE(!options.timestamps);
}

TEST_CASE("history options dynamic interface", "[history][options]")
{
    history_options options;
    options.name = "post";
    options.collection = "posts";
    options.history_collection = "post_patches";
    options.excludes = {"/secret", "/comments/*/author"};
    options.includes["user"] = include_field_spec{string("author")};
    options.includes["reason"] = include_field_spec();
    options.purge_on_delete = false;
    options.track_original_value = true;
    options.timestamps = true;

    test_dynamic_interface(
        options,
        dynamic_map{
            {"name", "post"},
            {"collection", "posts"},
            {"history_collection", "post_patches"},
            {"excludes", dynamic_array{"/secret", "/comments/*/author"}},
            {"includes",
             dynamic_map{
                 {"reason", dynamic_map()},
                 {"user", dynamic_map{{"from", "author"}}}}},
            {"purge_on_delete", false},
            {"track_original_value", true},
            {"timestamps", true}});
}

TEST_CASE("malformed history options", "[history][options]")
{
    REQUIRE_THROWS_AS(
        from_dynamic<history_options>(dynamic_map{{"name", "post"}}),
        missing_field);
    REQUIRE_THROWS_AS(
        from_dynamic<history_options>(dynamic_map{
            {"name", "post"},
            {"collection", "posts"},
            {"purge_on_delete", "yes"}}),
        type_mismatch);
    REQUIRE_THROWS_AS(
        from_dynamic<history_options>(dynamic_map{
            {"name", "post"},
            {"collection", "posts"},
            {"includes", dynamic_map{{"user", "author"}}}}),
        type_mismatch);
}

TEST_CASE("tool configuration from YAML", "[history][options]")
{
    auto config = from_dynamic<tool_config>(parse_yaml_value(
        "database: history.db\n"
        "types:\n"
        "  - name: post\n"
        "    collection: posts\n"
        "    excludes: [/secret]\n"
        "    track_original_value: true\n"
        "  - name: user\n"
        "    collection: users\n"));
    REQUIRE(config.database == "history.db");
    REQUIRE(config.types.size() == 2);
    REQUIRE(config.types[0].excludes == std::vector<string>{"/secret"});
    REQUIRE(config.types[0].track_original_value);
    REQUIRE(find_type_options(config, "user").collection == "users");
    REQUIRE_THROWS_AS(find_type_options(config, "page"), unregistered_type);
}
