#ifndef CHRONICLE_HISTORY_TRACKER_HPP
#define CHRONICLE_HISTORY_TRACKER_HPP

#include <chronicle/history/capture.hpp>
#include <chronicle/history/change_record.hpp>
#include <chronicle/history/options.hpp>

namespace chronicle {

// HISTORY TRACKER - A history_tracker records the history of one type of
// document. All mutations of tracked documents should go through it (or, for
// hosts that perform the mutations themselves, through its two-phase capture
// functions) so that each change produces a change record.
//
// Every operation accepts an optional store session. All store access for
// one operation (including the change record writes) goes through that
// session, so aborting it discards the records along with the mutation.

// A tracked_document is a document as loaded by (or created through) a
// tracker. It remembers the snapshot it was loaded with so that saving it
// can record what changed.
struct tracked_document
{
    // the full document, as it's stored (including its _id)
    dynamic_map document;

    // the snapshot as of the last load or save (none if the document has
    // never been stored)
    optional<dynamic_map> original;

    // values that aren't part of the document but can be copied into its
    // change records (see history_options::includes)
    dynamic_map transient;
};

// Get the ID of a tracked document.
object_id
get_document_id(tracked_document const& document);

std::ostream&
operator<<(std::ostream& s, tracked_document const& document);

// Is this a new document (one that has never been stored)?
bool
is_new(tracked_document const& document);

// the result of a tracked update
struct tracked_update_result
{
    // the result as reported by the store
    update_result result;

    // the change records that were made (one per changed document)
    std::vector<change_record> records;
};

struct history_tracker
{
    history_tracker(document_store& store, history_options options);

    history_options const&
    options() const
    {
        return options_;
    }

    document_store&
    store() const
    {
        return *store_;
    }

    // LOADING

    cppcoro::task<optional<tracked_document>>
    find_one(document_query query, store_session* session = nullptr);

    cppcoro::task<std::vector<tracked_document>>
    find_many(document_query query, store_session* session = nullptr);

    // Create a new (unsaved) document with the given data.
    // If :data doesn't have an _id, one is assigned.
    tracked_document
    create(dynamic_map data) const;

    // SAVING

    // Save a document, recording what changed since it was loaded (or last
    // saved). The document is written even if nothing changed, but a
    // record is only made if some operations survive exclusion.
    // Afterwards, :document is re-snapshotted.
    // :extra supplies values for included fields that are neither on the
    // document nor among its transient values.
    // The result is the record that was made, if any.
    cppcoro::task<optional<change_record>>
    save(
        tracked_document& document,
        store_session* session = nullptr,
        dynamic_map extra = dynamic_map());

    // UPDATES

    cppcoro::task<tracked_update_result>
    update_one(
        document_query query,
        update_expression update,
        update_options options = update_options(),
        store_session* session = nullptr,
        dynamic_map extra = dynamic_map());

    cppcoro::task<tracked_update_result>
    update_many(
        document_query query,
        update_expression update,
        update_options options = update_options(),
        store_session* session = nullptr,
        dynamic_map extra = dynamic_map());

    // These are the two halves of update_one and update_many for hosts that
    // send the updates to the store themselves. The 'before' function must
    // complete before the update is sent, and the 'after' function must be
    // called with the store's result once it has completed (in the same
    // session).

    cppcoro::task<single_capture_context>
    capture_before_update_one(
        document_query query,
        update_expression update,
        store_session* session = nullptr);

    cppcoro::task<optional<change_record>>
    capture_after_update_one(
        single_capture_context context,
        update_result result,
        store_session* session = nullptr,
        dynamic_map extra = dynamic_map());

    cppcoro::task<batch_capture_context>
    capture_before_update_many(
        document_query query,
        update_expression update,
        store_session* session = nullptr);

    cppcoro::task<std::vector<change_record>>
    capture_after_update_many(
        batch_capture_context context,
        update_result result,
        store_session* session = nullptr,
        dynamic_map extra = dynamic_map());

    // DELETION

    // Delete a document (and its history, if the options say so).
    cppcoro::task<>
    remove(tracked_document document, store_session* session = nullptr);

    // Delete the first document that matches :query (and its history, if the
    // options say so). The result is the number of documents deleted.
    cppcoro::task<integer>
    delete_one(document_query query, store_session* session = nullptr);

    // HISTORY

    // Get the history of a document, in history order.
    cppcoro::task<std::vector<change_record>>
    history(object_id id, store_session* session = nullptr);

    // Roll :document back to its state as of the change record :patch_id.
    // :overrides are merged on top of the reconstructed state. If :persist
    // is set, the document is saved (which records the rollback as a new
    // change). Either way, the rolled back document is returned.
    cppcoro::task<tracked_document>
    rollback(
        tracked_document document,
        object_id patch_id,
        dynamic_map overrides = dynamic_map(),
        bool persist = true,
        store_session* session = nullptr);

 private:
    tracked_document
    make_tracked(dynamic_map document) const;

    update_expression
    add_timestamps(update_expression update, ptime const& now) const;

    ptime
    get_record_date(dynamic_map const& document) const;

    dynamic_map
    get_included_fields(
        dynamic_map const& document,
        dynamic_map const& transient,
        dynamic_map const& extra) const;

    cppcoro::task<optional<change_record>>
    record_change(
        object_id ref,
        dynamic_map prior,
        dynamic_map document,
        dynamic_map transient,
        store_session* session,
        dynamic_map extra);

    cppcoro::task<>
    purge_history(object_id id, store_session* session);

    document_store* store_;
    history_options options_;
    std::vector<path_pattern> excludes_;
};

} // namespace chronicle

#endif
