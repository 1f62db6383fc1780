#include <chronicle/store/query.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

static dynamic_map
make_test_document(object_id const& id)
{
    return dynamic_map{
        {"_id", id},
        {"name", "widget"},
        {"count", integer(3)},
        {"tags", dynamic_array{"red", "blue"}},
        {"meta", dynamic_map{{"kind", "tool"}, {"owner", nil}}}};
}

TEST_CASE("equality queries", "[store][query]")
{
    auto id = generate_object_id();
    auto doc = make_test_document(id);

    REQUIRE(matches_query(doc, document_query()));
    REQUIRE(matches_query(doc, document_query{{"name", "widget"}}));
    REQUIRE(!matches_query(doc, document_query{{"name", "gadget"}}));
    REQUIRE(matches_query(
        doc, document_query{{"name", "widget"}, {"count", integer(3)}}));
    REQUIRE(!matches_query(
        doc, document_query{{"name", "widget"}, {"count", integer(4)}}));

    // IDs match their string forms.
    REQUIRE(matches_query(doc, make_id_query(id)));
    REQUIRE(matches_query(doc, document_query{{"_id", to_string(id)}}));
    REQUIRE(!matches_query(doc, make_id_query(generate_object_id())));

    // Dotted paths reach into nested maps.
    REQUIRE(matches_query(doc, document_query{{"meta.kind", "tool"}}));
    REQUIRE(!matches_query(doc, document_query{{"meta.kind", "toy"}}));
    REQUIRE(matches_query(doc, document_query{{"tags.1", "blue"}}));

    // Array fields match any of their items.
    REQUIRE(matches_query(doc, document_query{{"tags", "red"}}));
    REQUIRE(!matches_query(doc, document_query{{"tags", "green"}}));

    // Missing fields match nil.
    REQUIRE(matches_query(doc, document_query{{"missing", nil}}));
    REQUIRE(matches_query(doc, document_query{{"meta.owner", nil}}));
}

TEST_CASE("operator queries", "[store][query]")
{
    auto id = generate_object_id();
    auto doc = make_test_document(id);

    REQUIRE(matches_query(
        doc, document_query{{"name", dynamic_map{{"$eq", "widget"}}}}));
    REQUIRE(matches_query(
        doc, document_query{{"name", dynamic_map{{"$ne", "gadget"}}}}));
    REQUIRE(!matches_query(
        doc, document_query{{"name", dynamic_map{{"$ne", "widget"}}}}));
    REQUIRE(matches_query(
        doc,
        document_query{
            {"name",
             dynamic_map{{"$in", dynamic_array{"gadget", "widget"}}}}}));
    REQUIRE(!matches_query(
        doc,
        document_query{{"name", dynamic_map{{"$in", dynamic_array()}}}}));
    REQUIRE(matches_query(
        doc, make_id_query(std::vector<object_id>{generate_object_id(), id})));
    REQUIRE(matches_query(
        doc, document_query{{"count", dynamic_map{{"$exists", true}}}}));
    REQUIRE(matches_query(
        doc, document_query{{"missing", dynamic_map{{"$exists", false}}}}));
    REQUIRE(matches_query(
        doc, document_query{{"meta.owner", dynamic_map{{"$exists", false}}}}));

    REQUIRE_THROWS_AS(
        matches_query(
            doc, document_query{{"count", dynamic_map{{"$gt", integer(1)}}}}),
        invalid_query);
    REQUIRE_THROWS_AS(
        matches_query(doc, document_query{{"$or", dynamic_array()}}),
        invalid_query);
    REQUIRE_THROWS_AS(
        matches_query(
            doc, document_query{{"name", dynamic_map{{"$in", "widget"}}}}),
        invalid_query);
}

TEST_CASE("updates", "[store][query]")
{
    auto id = generate_object_id();
    auto doc = make_test_document(id);

    auto updated = apply_update(
        doc,
        update_expression{
            {"name", "gadget"},
            {"$set", dynamic_map{{"meta.kind", "toy"}, {"extra.deep", true}}},
            {"$unset", dynamic_map{{"meta.owner", ""}}},
            {"$inc", dynamic_map{{"count", integer(2)}, {"score", 1.5}}},
            {"$push", dynamic_map{{"tags", "green"}}},
            {"$pull", dynamic_map{{"tags", "red"}}},
            {"$setOnInsert", dynamic_map{{"created", true}}}});

    REQUIRE(
        updated
        == dynamic_map{
            {"_id", id},
            {"name", "gadget"},
            {"count", integer(5)},
            {"tags", dynamic_array{"blue", "green"}},
            {"meta", dynamic_map{{"kind", "toy"}}},
            {"extra", dynamic_map{{"deep", true}}},
            {"score", 1.5}});

    // Field order is preserved, with new fields at the end.
    REQUIRE(updated.begin()->first == "_id");
    REQUIRE((--updated.end())->first == "score");

    REQUIRE(
        apply_update(
            doc, update_expression{{"$inc", dynamic_map{{"count", 0.5}}}})
        == apply_update(
            doc, update_expression{{"count", 3.5}}));

    REQUIRE_THROWS_AS(
        apply_update(doc, update_expression{{"$rename", dynamic_map()}}),
        invalid_update);
    REQUIRE_THROWS_AS(
        apply_update(
            doc, update_expression{{"$push", dynamic_map{{"name", "x"}}}}),
        invalid_update);
    REQUIRE_THROWS_AS(
        apply_update(
            doc,
            update_expression{{"$inc", dynamic_map{{"name", integer(1)}}}}),
        invalid_update);
}

TEST_CASE("upsert documents", "[store][query]")
{
    auto document = make_upsert_document(
        document_query{
            {"name", "widget"},
            {"meta.kind", "tool"},
            {"count", dynamic_map{{"$eq", integer(7)}}},
            {"tags", dynamic_map{{"$in", dynamic_array{"a"}}}}},
        update_expression{
            {"$set", dynamic_map{{"active", true}}},
            {"$setOnInsert", dynamic_map{{"created", true}}}});

    REQUIRE(document.begin()->first == "_id");
    REQUIRE(get_field(document, "_id").type() == value_type::OBJECT_ID);
    document.erase("_id");
    REQUIRE(
        document
        == dynamic_map{
            {"name", "widget"},
            {"meta", dynamic_map{{"kind", "tool"}}},
            {"count", integer(7)},
            {"active", true},
            {"created", true}});

    auto id = generate_object_id();
    auto with_id = make_upsert_document(
        make_id_query(id), update_expression{{"name", "x"}});
    REQUIRE(get_document_id(with_id) == id);
}

TEST_CASE("merging conditions with updates", "[store][query]")
{
    REQUIRE(
        merge_conditions_with_update(
            document_query{{"name", "x"}, {"$or", dynamic_array()}},
            update_expression{
                {"$set", dynamic_map{{"title", "t"}, {"name", "y"}}},
                {"$inc", dynamic_map{{"n", integer(1)}}}})
        == document_query{{"name", "y"}, {"title", "t"}});

    // Without $set, the update's direct assignments are used.
    REQUIRE(
        merge_conditions_with_update(
            document_query{{"a", integer(1)}},
            update_expression{
                {"b", integer(2)}, {"$inc", dynamic_map{{"c", integer(1)}}}})
        == document_query{{"a", integer(1)}, {"b", integer(2)}});

    // Fields containing '$' anywhere are dropped.
    REQUIRE(
        merge_conditions_with_update(
            document_query{{"tags.$", "x"}, {"k", "v"}}, update_expression())
        == document_query{{"k", "v"}});
}
