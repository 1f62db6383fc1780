#include <chronicle/history/tracker.hpp>

#include <ostream>

#include <cppcoro/when_all.hpp>

#include <chronicle/core/logging.hpp>
#include <chronicle/history/rollback.hpp>
#include <chronicle/history/snapshot.hpp>
#include <chronicle/patch/exclusion.hpp>
#include <chronicle/store/query.hpp>

namespace chronicle {

object_id
get_document_id(tracked_document const& document)
{
    return get_document_id(document.document);
}

std::ostream&
operator<<(std::ostream& s, tracked_document const& document)
{
    s << document.document;
    return s;
}

bool
is_new(tracked_document const& document)
{
    return !document.original;
}

history_tracker::history_tracker(
    document_store& store, history_options options)
    : store_(&store),
      options_(std::move(options)),
      excludes_(parse_exclude_patterns(options_.excludes))
{
}

tracked_document
history_tracker::make_tracked(dynamic_map document) const
{
    tracked_document tracked;
    tracked.original = take_snapshot(document, options_.timestamps);
    tracked.document = std::move(document);
    return tracked;
}

cppcoro::task<optional<tracked_document>>
history_tracker::find_one(document_query query, store_session* session)
{
    auto found = co_await store_->find_one(
        options_.collection, std::move(query), session);
    if (!found)
        co_return none;
    co_return make_tracked(std::move(*found));
}

cppcoro::task<std::vector<tracked_document>>
history_tracker::find_many(document_query query, store_session* session)
{
    auto found = co_await store_->find_many(
        options_.collection, std::move(query), session);
    std::vector<tracked_document> documents;
    documents.reserve(found.size());
    for (auto& document : found)
        documents.push_back(make_tracked(std::move(document)));
    co_return documents;
}

tracked_document
history_tracker::create(dynamic_map data) const
{
    tracked_document tracked;
    if (data.find(document_id_field) == data.end())
        tracked.document[document_id_field] = generate_object_id();
    for (auto& field : data)
        tracked.document.insert(std::move(field));
    return tracked;
}

update_expression
history_tracker::add_timestamps(
    update_expression update, ptime const& now) const
{
    auto set = update.find("$set");
    if (set == update.end())
        update["$set"] = dynamic_map{{updated_at_field, now}};
    else if (set->second.type() == value_type::MAP)
        cast<dynamic_map>(set->second)[updated_at_field] = now;

    auto set_on_insert = update.find("$setOnInsert");
    if (set_on_insert == update.end())
        update["$setOnInsert"] = dynamic_map{{created_at_field, now}};
    else if (set_on_insert->second.type() == value_type::MAP)
    {
        cast<dynamic_map>(set_on_insert->second)
            .insert({created_at_field, now});
    }
    return update;
}

ptime
history_tracker::get_record_date(dynamic_map const& document) const
{
    if (options_.timestamps)
    {
        for (auto const* field : {updated_at_field, created_at_field})
        {
            auto value = document.find(field);
            if (value != document.end()
                && value->second.type() != value_type::NIL)
            {
                return from_dynamic<ptime>(value->second);
            }
        }
    }
    return get_current_time();
}

dynamic_map
history_tracker::get_included_fields(
    dynamic_map const& document,
    dynamic_map const& transient,
    dynamic_map const& extra) const
{
    dynamic_map included;
    for (auto const& include : options_.includes)
    {
        auto const& source
            = include.second.from ? *include.second.from : include.first;
        for (auto const* values : {&document, &transient, &extra})
        {
            auto value = values->find(source);
            if (value != values->end()
                && value->second.type() != value_type::NIL)
            {
                included[include.first] = value->second;
                break;
            }
        }
    }
    return included;
}

cppcoro::task<optional<change_record>>
history_tracker::record_change(
    object_id ref,
    dynamic_map prior,
    dynamic_map document,
    dynamic_map transient,
    store_session* session,
    dynamic_map extra)
{
    auto record = compute_change_record(
        ref,
        prior,
        take_snapshot(document, options_.timestamps),
        excludes_,
        options_.track_original_value,
        get_record_date(document));
    if (!record)
    {
        get_logger()->debug(
            "[{}] no changes to record for {}", options_.name, to_string(ref));
        co_return none;
    }
    record->extra = get_included_fields(document, transient, extra);
    co_await store_->insert(
        get_history_collection(options_),
        cast<dynamic_map>(to_dynamic(*record)),
        session);
    get_logger()->info(
        "[{}] recorded change {} for {} ({} operations)",
        options_.name,
        to_string(record->id),
        to_string(ref),
        record->ops.size());
    co_return record;
}

cppcoro::task<optional<change_record>>
history_tracker::save(
    tracked_document& document, store_session* session, dynamic_map extra)
{
    auto id = get_document_id(document);
    if (options_.timestamps)
    {
        auto now = get_current_time();
        if (is_new(document))
            document.document.insert({created_at_field, now});
        document.document[updated_at_field] = now;
    }
    auto record = co_await record_change(
        id,
        document.original ? *document.original : dynamic_map(),
        document.document,
        document.transient,
        session,
        std::move(extra));
    co_await store_->save(options_.collection, document.document, session);
    document.original = take_snapshot(document.document, options_.timestamps);
    co_return record;
}

cppcoro::task<single_capture_context>
history_tracker::capture_before_update_one(
    document_query query, update_expression update, store_session* session)
{
    single_capture_context context;
    context.query = query;
    context.update = std::move(update);
    auto found = co_await store_->find_one(
        options_.collection, std::move(query), session);
    if (found)
    {
        context.prior = captured_document{
            get_document_id(*found),
            take_snapshot(*found, options_.timestamps)};
        get_logger()->debug(
            "[{}] captured {} before update",
            options_.name,
            to_string(context.prior->id));
    }
    else
    {
        get_logger()->debug(
            "[{}] nothing matched before update", options_.name);
    }
    co_return context;
}

cppcoro::task<optional<change_record>>
history_tracker::capture_after_update_one(
    single_capture_context context,
    update_result result,
    store_session* session,
    dynamic_map extra)
{
    if (update_touched_nothing(result))
    {
        get_logger()->debug(
            "[{}] update touched nothing; skipping", options_.name);
        co_return none;
    }
    auto resolved = co_await store_->find_one(
        options_.collection,
        to_query(choose_resolution_strategy(context)),
        session);
    if (!resolved)
    {
        get_logger()->debug(
            "[{}] updated document not found; skipping", options_.name);
        co_return none;
    }
    auto id = get_document_id(*resolved);
    co_return co_await record_change(
        id,
        context.prior ? context.prior->snapshot : dynamic_map(),
        std::move(*resolved),
        dynamic_map(),
        session,
        std::move(extra));
}

cppcoro::task<tracked_update_result>
history_tracker::update_one(
    document_query query,
    update_expression update,
    update_options options,
    store_session* session,
    dynamic_map extra)
{
    auto context = co_await capture_before_update_one(query, update, session);
    if (options_.timestamps)
        update = add_timestamps(std::move(update), get_current_time());
    tracked_update_result tracked;
    tracked.result = co_await store_->update_one(
        options_.collection,
        std::move(query),
        std::move(update),
        options,
        session);
    auto record = co_await capture_after_update_one(
        std::move(context), tracked.result, session, std::move(extra));
    if (record)
        tracked.records.push_back(std::move(*record));
    co_return tracked;
}

cppcoro::task<batch_capture_context>
history_tracker::capture_before_update_many(
    document_query query, update_expression update, store_session* session)
{
    batch_capture_context context;
    context.query = query;
    context.update = std::move(update);
    auto found = co_await store_->find_many(
        options_.collection, std::move(query), session);
    context.priors.reserve(found.size());
    for (auto const& document : found)
    {
        context.priors.push_back(captured_document{
            get_document_id(document),
            take_snapshot(document, options_.timestamps)});
    }
    get_logger()->debug(
        "[{}] captured {} documents before update",
        options_.name,
        context.priors.size());
    co_return context;
}

cppcoro::task<std::vector<change_record>>
history_tracker::capture_after_update_many(
    batch_capture_context context,
    update_result result,
    store_session* session,
    dynamic_map extra)
{
    std::vector<change_record> records;
    if (update_touched_nothing(result))
    {
        get_logger()->debug(
            "[{}] update touched nothing; skipping", options_.name);
        co_return records;
    }
    auto resolved = co_await store_->find_many(
        options_.collection,
        to_query(choose_resolution_strategy(context)),
        session);

    std::vector<cppcoro::task<optional<change_record>>> recordings;
    for (auto& pairing : pair_by_identity(context.priors, resolved))
    {
        recordings.push_back(record_change(
            pairing.id,
            std::move(pairing.prior),
            std::move(pairing.document),
            dynamic_map(),
            session,
            extra));
    }
    auto recorded = co_await cppcoro::when_all(std::move(recordings));
    for (auto& record : recorded)
    {
        if (record)
            records.push_back(std::move(*record));
    }
    co_return records;
}

cppcoro::task<tracked_update_result>
history_tracker::update_many(
    document_query query,
    update_expression update,
    update_options options,
    store_session* session,
    dynamic_map extra)
{
    auto context
        = co_await capture_before_update_many(query, update, session);
    if (options_.timestamps)
        update = add_timestamps(std::move(update), get_current_time());
    tracked_update_result tracked;
    tracked.result = co_await store_->update_many(
        options_.collection,
        std::move(query),
        std::move(update),
        options,
        session);
    tracked.records = co_await capture_after_update_many(
        std::move(context), tracked.result, session, std::move(extra));
    co_return tracked;
}

cppcoro::task<>
history_tracker::purge_history(object_id id, store_session* session)
{
    auto purged = co_await store_->delete_many(
        get_history_collection(options_),
        document_query{{"ref", id}},
        session);
    get_logger()->debug(
        "[{}] purged {} change records for {}",
        options_.name,
        purged,
        to_string(id));
}

cppcoro::task<>
history_tracker::remove(tracked_document document, store_session* session)
{
    auto id = get_document_id(document);
    if (options_.purge_on_delete)
        co_await purge_history(id, session);
    co_await store_->delete_many(
        options_.collection, make_id_query(id), session);
}

cppcoro::task<integer>
history_tracker::delete_one(document_query query, store_session* session)
{
    auto found = co_await store_->find_one(
        options_.collection, std::move(query), session);
    if (!found)
        co_return 0;
    auto id = get_document_id(*found);
    if (options_.purge_on_delete)
        co_await purge_history(id, session);
    co_return co_await store_->delete_many(
        options_.collection, make_id_query(id), session);
}

cppcoro::task<std::vector<change_record>>
history_tracker::history(object_id id, store_session* session)
{
    auto documents = co_await store_->find_many(
        get_history_collection(options_),
        document_query{{"ref", id}},
        session);
    std::vector<change_record> records;
    records.reserve(documents.size());
    for (auto const& document : documents)
        records.push_back(from_dynamic<change_record>(document));
    sort_history(records);
    co_return records;
}

cppcoro::task<tracked_document>
history_tracker::rollback(
    tracked_document document,
    object_id patch_id,
    dynamic_map overrides,
    bool persist,
    store_session* session)
{
    auto id = get_document_id(document);
    auto records = co_await history(id, session);
    auto state = merge_overrides(replay_history(records, patch_id), overrides);

    // The bookkeeping fields and the excluded parts of the document aren't
    // in the history, so they keep their current values. Everything else is
    // replaced.
    dynamic_map rolled_back;
    for (auto const& field : document.document)
    {
        if (is_bookkeeping_field(field.first, options_.timestamps))
            rolled_back.insert(field);
    }
    for (auto& field : state)
        rolled_back.insert(std::move(field));
    document.document
        = carry_excluded_fields(document.document, rolled_back, excludes_);

    get_logger()->info(
        "[{}] rolled {} back to {}{}",
        options_.name,
        to_string(id),
        to_string(patch_id),
        persist ? "" : " (not saved)");
    if (persist)
        co_await save(document, session);
    co_return document;
}

} // namespace chronicle
