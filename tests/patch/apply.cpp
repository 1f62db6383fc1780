#include <chronicle/patch/apply.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

static dynamic
make_test_document()
{
    return dynamic_map{
        {"title", "foo"},
        {"list", dynamic_array{integer(1), integer(2), integer(3)}},
        {"nested", dynamic_map{{"a", integer(1)}}}};
}

TEST_CASE("additions", "[patch][apply]")
{
    auto doc = make_test_document();

    auto added = apply_operation(
        doc, make_add_operation(parse_path("/nested/b"), integer(2)));
    REQUIRE(
        *find_value_at_path(added, parse_path("/nested"))
        == dynamic(dynamic_map{{"a", integer(1)}, {"b", integer(2)}}));

    auto inserted = apply_operation(
        doc, make_add_operation(parse_path("/list/1"), integer(9)));
    REQUIRE(
        *find_value_at_path(inserted, parse_path("/list"))
        == dynamic(
            dynamic_array{integer(1), integer(9), integer(2), integer(3)}));

    auto appended = apply_operation(
        doc, make_add_operation(parse_path("/list/-"), integer(4)));
    REQUIRE(
        *find_value_at_path(appended, parse_path("/list"))
        == dynamic(
            dynamic_array{integer(1), integer(2), integer(3), integer(4)}));

    // Adding over an existing field replaces it.
    auto overwritten = apply_operation(
        doc, make_add_operation(parse_path("/title"), "bar"));
    REQUIRE(*find_value_at_path(overwritten, parse_path("/title")) == "bar");

    // The original is untouched.
    REQUIRE(doc == make_test_document());
}

TEST_CASE("removals and replacements", "[patch][apply]")
{
    auto doc = make_test_document();

    auto removed = apply_patch(
        doc,
        {make_remove_operation(parse_path("/title")),
         make_remove_operation(parse_path("/list/0"))});
    REQUIRE(
        removed
        == dynamic(dynamic_map{
            {"list", dynamic_array{integer(2), integer(3)}},
            {"nested", dynamic_map{{"a", integer(1)}}}}));

    auto replaced = apply_operation(
        doc, make_replace_operation(parse_path("/nested/a"), "x"));
    REQUIRE(*find_value_at_path(replaced, parse_path("/nested/a")) == "x");

    REQUIRE(
        apply_operation(doc, make_replace_operation(patch_path(), integer(0)))
        == dynamic(integer(0)));
}

TEST_CASE("moves and copies", "[patch][apply]")
{
    auto doc = make_test_document();

    auto moved = apply_operation(
        doc, make_move_operation(parse_path("/title"), parse_path("/name")));
    REQUIRE(find_value_at_path(moved, parse_path("/title")) == nullptr);
    REQUIRE(*find_value_at_path(moved, parse_path("/name")) == "foo");

    auto copied = apply_operation(
        doc,
        make_copy_operation(parse_path("/nested"), parse_path("/list/-")));
    REQUIRE(
        *find_value_at_path(copied, parse_path("/list/3"))
        == dynamic(dynamic_map{{"a", integer(1)}}));
    REQUIRE(*find_value_at_path(copied, parse_path("/nested/a")) == integer(1));

    REQUIRE_THROWS_AS(
        apply_operation(
            doc,
            make_move_operation(
                parse_path("/nested"), parse_path("/nested/x"))),
        patch_apply_failure);
}

TEST_CASE("tests", "[patch][apply]")
{
    auto doc = make_test_document();
    REQUIRE(
        apply_operation(
            doc, make_test_operation(parse_path("/nested/a"), integer(1)))
        == doc);

    auto id = generate_object_id();
    dynamic with_id = dynamic_map{{"owner", id}};
    REQUIRE_NOTHROW(apply_operation(
        with_id, make_test_operation(parse_path("/owner"), to_string(id))));

    REQUIRE_THROWS_AS(
        apply_operation(
            doc, make_test_operation(parse_path("/nested/a"), integer(2))),
        patch_apply_failure);

    // Numbers are compared by value.
    REQUIRE(
        apply_operation(
            doc, make_test_operation(parse_path("/nested/a"), 1.))
        == doc);
    REQUIRE(
        apply_operation(
            doc,
            make_test_operation(
                parse_path("/list"),
                dynamic_array{1., integer(2), integer(3)}))
        == doc);
    REQUIRE_THROWS_AS(
        apply_operation(
            doc, make_test_operation(parse_path("/nested/a"), 1.5)),
        patch_apply_failure);
}

TEST_CASE("apply failures", "[patch][apply]")
{
    auto doc = make_test_document();

    try
    {
        apply_patch(
            doc,
            {make_replace_operation(parse_path("/title"), "bar"),
             make_replace_operation(parse_path("/missing"), "x")});
        FAIL("no exception thrown");
    }
    catch (patch_apply_failure& e)
    {
        REQUIRE(get_required_error_info<operation_index_info>(e) == 1);
        REQUIRE(get_required_error_info<patch_path_info>(e) == "/missing");
    }

    REQUIRE_THROWS_AS(
        apply_operation(doc, make_remove_operation(patch_path())),
        patch_apply_failure);
    REQUIRE_THROWS_AS(
        apply_operation(doc, make_remove_operation(parse_path("/list/3"))),
        patch_apply_failure);
    REQUIRE_THROWS_AS(
        apply_operation(doc, make_add_operation(parse_path("/list/5"), nil)),
        patch_apply_failure);
    REQUIRE_THROWS_AS(
        apply_operation(
            doc, make_add_operation(parse_path("/missing/field"), nil)),
        patch_apply_failure);
    REQUIRE_THROWS_AS(
        apply_operation(
            doc, make_add_operation(parse_path("/title/field"), nil)),
        patch_apply_failure);

    auto malformed = make_remove_operation(parse_path("/title"));
    malformed.value = dynamic("x");
    REQUIRE_THROWS_AS(apply_operation(doc, malformed), patch_apply_failure);
}
