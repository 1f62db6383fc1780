#include <chronicle/store/memory_store.hpp>

#include <algorithm>
#include <map>
#include <mutex>
#include <set>

#include <chronicle/store/query.hpp>

namespace chronicle {

typedef std::vector<dynamic_map> document_list;
typedef std::map<string, document_list> collection_map;

struct memory_store_impl
{
    collection_map collections;

    // protects all access to :collections
    std::mutex mutex;
};

struct memory_store_session : store_session
{
    memory_store_session(std::shared_ptr<memory_store_impl> store)
        : store(std::move(store))
    {
        std::scoped_lock<std::mutex> lock(this->store->mutex);
        staged = this->store->collections;
    }

    ~memory_store_session()
    {
        if (active)
            this->abort();
    }

    void
    commit() override
    {
        check_active();
        std::scoped_lock<std::mutex> lock(store->mutex);
        for (auto const& name : modified)
            store->collections[name] = std::move(staged[name]);
        active = false;
    }

    void
    abort() override
    {
        check_active();
        staged.clear();
        modified.clear();
        active = false;
    }

    void
    check_active()
    {
        if (!active)
        {
            CHRONICLE_THROW(
                store_failure() << internal_error_message_info(
                    "session has already been committed or aborted"));
        }
    }

    std::shared_ptr<memory_store_impl> store;

    // the session's private copy of the collections
    collection_map staged;

    // the collections that the session has written to
    std::set<string> modified;

    bool active = true;
};

// Run :fn on the documents in :collection that an operation should see -
// either the session's staged copy or the store's own (under its mutex).
// :modifies says whether :fn writes to the documents.
template<class Fn>
static auto
with_collection(
    memory_store_impl& store,
    store_session* session,
    string const& collection,
    bool modifies,
    Fn&& fn)
{
    if (session)
    {
        auto* memory_session = dynamic_cast<memory_store_session*>(session);
        if (!memory_session || memory_session->store.get() != &store)
        {
            CHRONICLE_THROW(
                store_failure() << internal_error_message_info(
                    "session doesn't belong to this store"));
        }
        memory_session->check_active();
        if (modifies)
            memory_session->modified.insert(collection);
        return fn(memory_session->staged[collection]);
    }
    std::scoped_lock<std::mutex> lock(store.mutex);
    return fn(store.collections[collection]);
}

static dynamic_map
with_generated_id(dynamic_map document)
{
    if (document.find("_id") != document.end())
        return document;
    dynamic_map with_id;
    with_id["_id"] = generate_object_id();
    for (auto& field : document)
        with_id.insert(std::move(field));
    return with_id;
}

static document_list::iterator
find_by_id(document_list& documents, object_id const& id)
{
    return std::find_if(
        documents.begin(), documents.end(), [&](dynamic_map const& d) {
            return get_document_id(d) == id;
        });
}

static update_result
update_documents(
    document_list& documents,
    document_query const& query,
    update_expression const& update,
    update_options const& options,
    bool multiple)
{
    update_result result;
    for (auto& document : documents)
    {
        if (!matches_query(document, query))
            continue;
        ++result.matched_count;
        auto updated = apply_update(document, update);
        if (updated != document)
        {
            document = std::move(updated);
            ++result.modified_count;
        }
        if (!multiple)
            break;
    }
    if (result.matched_count == 0 && options.upsert)
    {
        auto document = make_upsert_document(query, update);
        result.upserted_id = get_document_id(document);
        result.upserted_count = 1;
        documents.push_back(std::move(document));
    }
    return result;
}

memory_store::memory_store() : impl_(new memory_store_impl)
{
}

memory_store::~memory_store()
{
}

cppcoro::task<optional<dynamic_map>>
memory_store::find_one(
    string collection, document_query query, store_session* session)
{
    co_return with_collection(
        *impl_, session, collection, false, [&](document_list& documents) {
            optional<dynamic_map> found;
            for (auto const& document : documents)
            {
                if (matches_query(document, query))
                {
                    found = document;
                    break;
                }
            }
            return found;
        });
}

cppcoro::task<std::vector<dynamic_map>>
memory_store::find_many(
    string collection, document_query query, store_session* session)
{
    co_return with_collection(
        *impl_, session, collection, false, [&](document_list& documents) {
            std::vector<dynamic_map> found;
            for (auto const& document : documents)
            {
                if (matches_query(document, query))
                    found.push_back(document);
            }
            return found;
        });
}

cppcoro::task<>
memory_store::insert(
    string collection, dynamic_map document, store_session* session)
{
    auto prepared = with_generated_id(std::move(document));
    with_collection(
        *impl_, session, collection, true, [&](document_list& documents) {
            if (find_by_id(documents, get_document_id(prepared))
                != documents.end())
            {
                CHRONICLE_THROW(
                    store_failure()
                    << collection_name_info(collection)
                    << internal_error_message_info("duplicate _id"));
            }
            documents.push_back(std::move(prepared));
            return 0;
        });
    co_return;
}

cppcoro::task<>
memory_store::save(
    string collection, dynamic_map document, store_session* session)
{
    auto prepared = with_generated_id(std::move(document));
    with_collection(
        *impl_, session, collection, true, [&](document_list& documents) {
            auto existing = find_by_id(documents, get_document_id(prepared));
            if (existing != documents.end())
                *existing = std::move(prepared);
            else
                documents.push_back(std::move(prepared));
            return 0;
        });
    co_return;
}

cppcoro::task<update_result>
memory_store::update_one(
    string collection,
    document_query query,
    update_expression update,
    update_options options,
    store_session* session)
{
    co_return with_collection(
        *impl_, session, collection, true, [&](document_list& documents) {
            return update_documents(documents, query, update, options, false);
        });
}

cppcoro::task<update_result>
memory_store::update_many(
    string collection,
    document_query query,
    update_expression update,
    update_options options,
    store_session* session)
{
    co_return with_collection(
        *impl_, session, collection, true, [&](document_list& documents) {
            return update_documents(documents, query, update, options, true);
        });
}

cppcoro::task<integer>
memory_store::delete_many(
    string collection, document_query query, store_session* session)
{
    co_return with_collection(
        *impl_, session, collection, true, [&](document_list& documents) {
            auto original_size = documents.size();
            documents.erase(
                std::remove_if(
                    documents.begin(),
                    documents.end(),
                    [&](dynamic_map const& d) {
                        return matches_query(d, query);
                    }),
                documents.end());
            return integer(original_size - documents.size());
        });
}

std::unique_ptr<store_session>
memory_store::begin_session()
{
    return std::make_unique<memory_store_session>(impl_);
}

size_t
memory_store::count(string const& collection)
{
    return with_collection(
        *impl_, nullptr, collection, false, [&](document_list& documents) {
            return documents.size();
        });
}

} // namespace chronicle
