#include <chronicle/history/rollback.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <cppcoro/sync_wait.hpp>

#include <chronicle/core/testing.hpp>
#include <chronicle/history/tracker.hpp>
#include <chronicle/patch/apply.hpp>
#include <chronicle/store/memory_store.hpp>
#include <chronicle/store/query.hpp>

using namespace chronicle;

using cppcoro::sync_wait;

static change_record
make_record(patch_operation_list ops)
{
    change_record record;
    record.id = generate_object_id();
    record.date = ptime(boost::gregorian::date(2022, 1, 1));
    record.ops = std::move(ops);
    return record;
}

static std::vector<change_record>
make_history()
{
    return {
        make_record(
            {make_add_operation(parse_path("/title"), "foo"),
             make_add_operation(parse_path("/tags"), dynamic_array{"a"})}),
        make_record(
            {make_replace_operation(parse_path("/title"), "bar"),
             make_add_operation(parse_path("/tags/-"), "b")}),
        make_record(
            {make_remove_operation(parse_path("/tags/0")),
             make_add_operation(parse_path("/extra"), integer(1))})};
}

TEST_CASE("replaying history", "[history][rollback]")
{
    auto history = make_history();

    REQUIRE(
        replay_history(history, history[0].id)
        == dynamic_map{{"title", "foo"}, {"tags", dynamic_array{"a"}}});
    REQUIRE(
        replay_history(history, history[1].id)
        == dynamic_map{{"title", "bar"}, {"tags", dynamic_array{"a", "b"}}});

    // Every prefix is the same as applying its records in order.
    for (size_t i = 0; i + 1 < history.size(); ++i)
    {
        dynamic state = dynamic_map();
        for (size_t j = 0; j <= i; ++j)
            state = apply_patch(state, history[j].ops);
        REQUIRE(dynamic(replay_history(history, history[i].id)) == state);
    }
}

TEST_CASE("invalid rollback targets", "[history][rollback]")
{
    auto history = make_history();

    REQUIRE_THROWS_AS(
        replay_history(history, generate_object_id()), unknown_patch);
    REQUIRE_THROWS_AS(replay_history({}, generate_object_id()), unknown_patch);
    REQUIRE_THROWS_AS(
        replay_history(history, history.back().id), noop_rollback);

    try
    {
        replay_history(history, history.back().id);
        FAIL("no exception thrown");
    }
    catch (noop_rollback& e)
    {
        REQUIRE(
            get_required_error_info<patch_id_info>(e)
            == to_string(history.back().id));
    }
}

TEST_CASE("replaying failed operations", "[history][rollback]")
{
    auto history = make_history();
    history.insert(
        history.begin() + 1,
        make_record({make_test_operation(parse_path("/title"), "baz")}));

    try
    {
        replay_history(history, history[2].id);
        FAIL("no exception thrown");
    }
    catch (patch_apply_failure& e)
    {
        REQUIRE(
            get_required_error_info<patch_id_info>(e)
            == to_string(history[1].id));
        REQUIRE(
            get_required_error_info<operation_index_info>(e) == size_t(0));
    }

    // Replaying up to the record before the failure is fine.
    REQUIRE(
        replay_history(history, history[0].id)
        == dynamic_map{{"title", "foo"}, {"tags", dynamic_array{"a"}}});
}

TEST_CASE("merging overrides", "[history][rollback]")
{
    dynamic_map base{
        {"title", "foo"},
        {"meta", dynamic_map{{"a", integer(1)}, {"b", integer(2)}}},
        {"list", dynamic_array{integer(1), integer(2)}}};

    REQUIRE(merge_overrides(base, dynamic_map()) == base);
    REQUIRE(
        merge_overrides(
            base,
            dynamic_map{
                {"title", "bar"},
                {"meta", dynamic_map{{"b", integer(3)}, {"c", integer(4)}}},
                {"list", dynamic_array{integer(9)}},
                {"new", true}})
        == dynamic_map{
            {"title", "bar"},
            {"meta",
             dynamic_map{
                 {"a", integer(1)}, {"b", integer(3)}, {"c", integer(4)}}},
            {"list", dynamic_array{integer(9)}},
            {"new", true}});
    // Non-maps replace maps and vice versa.
    REQUIRE(
        merge_overrides(base, dynamic_map{{"meta", "none"}})
        == dynamic_map{
            {"title", "foo"},
            {"meta", "none"},
            {"list", dynamic_array{integer(1), integer(2)}}});
}

TEST_CASE("rolling back tracked documents", "[history][rollback]")
{
    memory_store store;
    history_options options;
    options.name = "post";
    options.collection = "posts";
    history_tracker tracker(store, options);

    auto document = tracker.create(dynamic_map{{"title", "v1"}});
    sync_wait(tracker.save(document));
    document.document["title"] = "v2";
    document.document["body"] = "text";
    sync_wait(tracker.save(document));
    document.document["title"] = "v3";
    sync_wait(tracker.save(document));

    auto id = get_document_id(document);
    auto history = sync_wait(tracker.history(id));
    REQUIRE(history.size() == 3);

    SECTION("without saving")
    {
        auto rolled_back = sync_wait(tracker.rollback(
            document, history[0].id, dynamic_map(), false));
        REQUIRE(
            rolled_back.document
            == dynamic_map{{"_id", id}, {"title", "v1"}});
        REQUIRE(sync_wait(tracker.history(id)).size() == 3);
        auto stored = sync_wait(store.find_one("posts", make_id_query(id)));
        REQUIRE(stored);
        REQUIRE(get_field(*stored, "title") == dynamic("v3"));
    }

    SECTION("with overrides and saving")
    {
        auto rolled_back = sync_wait(tracker.rollback(
            document, history[1].id, dynamic_map{{"note", "restored"}}));
        REQUIRE(
            rolled_back.document
            == dynamic_map{
                {"_id", id},
                {"title", "v2"},
                {"body", "text"},
                {"note", "restored"}});

        // The rollback is recorded as a normal change.
        auto after = sync_wait(tracker.history(id));
        REQUIRE(after.size() == 4);
        auto replace = make_replace_operation(parse_path("/title"), "v2");
        auto add = make_add_operation(parse_path("/note"), "restored");
        REQUIRE(after.back().ops == patch_operation_list{replace, add});

        auto stored = sync_wait(store.find_one("posts", make_id_query(id)));
        REQUIRE(stored);
        REQUIRE(*stored == rolled_back.document);
    }

    SECTION("errors")
    {
        REQUIRE_THROWS_AS(
            sync_wait(tracker.rollback(document, generate_object_id())),
            unknown_patch);
        REQUIRE_THROWS_AS(
            sync_wait(tracker.rollback(document, history[2].id)),
            noop_rollback);
        REQUIRE(sync_wait(tracker.history(id)).size() == 3);
    }
}

TEST_CASE("rolling back keeps excluded fields", "[history][rollback]")
{
    memory_store store;
    history_options options;
    options.name = "post";
    options.collection = "posts";
    options.excludes = {"/secret"};
    history_tracker tracker(store, options);

    auto document
        = tracker.create(dynamic_map{{"title", "a"}, {"secret", "s"}});
    sync_wait(tracker.save(document));
    document.document["title"] = "b";
    document.document["secret"] = "t";
    sync_wait(tracker.save(document));

    auto id = get_document_id(document);
    auto history = sync_wait(tracker.history(id));
    REQUIRE(history.size() == size_t(2));

    auto rolled_back = sync_wait(tracker.rollback(document, history[0].id));
    REQUIRE(
        rolled_back.document
        == (dynamic_map{{"_id", id}, {"title", "a"}, {"secret", "t"}}));

    auto stored = sync_wait(store.find_one("posts", make_id_query(id)));
    REQUIRE(stored);
    REQUIRE(get_field(*stored, "secret") == dynamic("t"));
    REQUIRE(get_field(*stored, "title") == dynamic("a"));
}
