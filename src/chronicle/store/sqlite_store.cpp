#include <chronicle/store/sqlite_store.hpp>

#include <mutex>

#include <boost/numeric/conversion/cast.hpp>

#include <sqlite3.h>

#include <chronicle/encodings/json.hpp>
#include <chronicle/store/query.hpp>

namespace chronicle {

struct sqlite_store_impl
{
    string path;

    sqlite3* db = nullptr;

    // prepared statements
    sqlite3_stmt* database_version_query = nullptr;
    sqlite3_stmt* collection_query = nullptr;
    sqlite3_stmt* insert_statement = nullptr;
    sqlite3_stmt* save_statement = nullptr;
    sqlite3_stmt* update_statement = nullptr;
    sqlite3_stmt* delete_statement = nullptr;

    // true while a session (transaction) is open
    bool in_session = false;

    // protects all access to the database
    std::mutex mutex;
};

// SQLITE UTILITIES

[[noreturn]] static void
throw_store_failure(sqlite_store_impl const& store, string const& message)
{
    CHRONICLE_THROW(
        store_failure() << database_path_info(store.path)
                        << internal_error_message_info(message));
}

static void
open_db(sqlite_store_impl& store)
{
    auto file = store.path.empty() ? string(":memory:") : store.path;
    if (sqlite3_open(file.c_str(), &store.db) != SQLITE_OK)
        throw_store_failure(store, "failed to open database file");
}

static string
copy_and_free_message(char* msg)
{
    if (msg)
    {
        string s = msg;
        sqlite3_free(msg);
        return s;
    }
    else
        return "";
}

static void
execute_sql(sqlite_store_impl const& store, string const& sql)
{
    char* msg;
    int code = sqlite3_exec(store.db, sql.c_str(), 0, 0, &msg);
    string error = copy_and_free_message(msg);
    if (code != SQLITE_OK)
    {
        throw_store_failure(
            store,
            "error executing SQL query\nSQL query: " + sql
                + "\nerror: " + error);
    }
}

// Check a return code from SQLite.
static void
check_sqlite_code(sqlite_store_impl const& store, int code)
{
    if (code != SQLITE_OK)
    {
        throw_store_failure(
            store, string("SQLite error: ") + sqlite3_errstr(code));
    }
}

// Create a prepared statement.
// This checks to make sure that the creation was successful, so the returned
// pointer is always valid.
static sqlite3_stmt*
prepare_statement(sqlite_store_impl const& store, string const& sql)
{
    sqlite3_stmt* statement;
    auto code = sqlite3_prepare_v2(
        store.db,
        sql.c_str(),
        boost::numeric_cast<int>(sql.length()),
        &statement,
        nullptr);
    if (code != SQLITE_OK)
    {
        throw_store_failure(
            store,
            "error preparing SQL query\nSQL query: " + sql
                + "\nerror: " + sqlite3_errmsg(store.db));
    }
    return statement;
}

// Bind a string to a parameter of a prepared statement.
// The string must outlive the execution of the statement.
static void
bind_string(
    sqlite_store_impl const& store,
    sqlite3_stmt* statement,
    int parameter_index,
    string const& value)
{
    check_sqlite_code(
        store,
        sqlite3_bind_text64(
            statement,
            parameter_index,
            value.c_str(),
            value.size(),
            SQLITE_STATIC,
            SQLITE_UTF8));
}

// Report the failure of a statement (after resetting it so that it can be
// used again).
[[noreturn]] static void
throw_statement_failure(sqlite_store_impl const& store, sqlite3_stmt* statement)
{
    string error = sqlite3_errmsg(store.db);
    sqlite3_reset(statement);
    throw_store_failure(store, "SQL query failed\nerror: " + error);
}

// Execute a prepared statement (with variables already bound to it) and check
// that it finished successfully.
// This should only be used for statements that don't return results.
static void
execute_prepared_statement(
    sqlite_store_impl const& store, sqlite3_stmt* statement)
{
    auto code = sqlite3_step(statement);
    if (code != SQLITE_DONE)
        throw_statement_failure(store, statement);
    check_sqlite_code(store, sqlite3_reset(statement));
}

struct sqlite_row
{
    sqlite3_stmt* statement;
};

static int
read_int32(sqlite_row& row, int column_index)
{
    return sqlite3_column_int(row.statement, column_index);
}

static string
read_string(sqlite_row& row, int column_index)
{
    return reinterpret_cast<char const*>(
        sqlite3_column_text(row.statement, column_index));
}

// Execute a prepared statement (with variables already bound to it), pass all
// the rows from the result set into the supplied callback, and check that the
// query finishes successfully.
// The callback must not throw.
struct expected_column_count
{
    int value;
};
template<class RowHandler>
static void
execute_prepared_statement(
    sqlite_store_impl const& store,
    sqlite3_stmt* statement,
    expected_column_count expected_columns,
    RowHandler const& row_handler)
{
    int code;
    while (true)
    {
        code = sqlite3_step(statement);
        if (code == SQLITE_ROW)
        {
            if (sqlite3_column_count(statement) != expected_columns.value)
            {
                sqlite3_reset(statement);
                throw_store_failure(
                    store, "SQL query result column count incorrect");
            }
            sqlite_row row;
            row.statement = statement;
            row_handler(row);
        }
        else
        {
            break;
        }
    }
    if (code != SQLITE_DONE)
        throw_statement_failure(store, statement);
    check_sqlite_code(store, sqlite3_reset(statement));
}

// DOCUMENTS

// Get all documents in a collection (in insertion order).
static std::vector<dynamic_map>
load_collection(sqlite_store_impl& store, string const& collection)
{
    std::vector<string> bodies;
    bind_string(store, store.collection_query, 1, collection);
    execute_prepared_statement(
        store,
        store.collection_query,
        expected_column_count{1},
        [&](sqlite_row& row) { bodies.push_back(read_string(row, 0)); });

    std::vector<dynamic_map> documents;
    documents.reserve(bodies.size());
    for (auto const& body : bodies)
    {
        try
        {
            documents.push_back(
                from_dynamic<dynamic_map>(parse_json_value(body)));
        }
        catch (boost::exception& e)
        {
            e << database_path_info(store.path)
              << collection_name_info(collection);
            throw;
        }
    }
    return documents;
}

// Write a document using one of the insert/save/update statements, all of
// which take (collection, id, body) as their parameters.
static void
write_document(
    sqlite_store_impl& store,
    sqlite3_stmt* statement,
    string const& collection,
    dynamic_map const& document)
{
    auto id = to_string(get_document_id(document));
    auto body = value_to_compact_json(document);
    bind_string(store, statement, 1, collection);
    bind_string(store, statement, 2, id);
    bind_string(store, statement, 3, body);
    execute_prepared_statement(store, statement);
}

static void
delete_document(
    sqlite_store_impl& store, string const& collection, object_id const& id)
{
    auto id_string = to_string(id);
    bind_string(store, store.delete_statement, 1, collection);
    bind_string(store, store.delete_statement, 2, id_string);
    execute_prepared_statement(store, store.delete_statement);
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

// SESSIONS

struct sqlite_store_session : store_session
{
    sqlite_store_session(std::shared_ptr<sqlite_store_impl> store)
        : store(std::move(store))
    {
        auto& impl = *this->store;
        std::scoped_lock<std::mutex> lock(impl.mutex);
        if (impl.in_session)
        {
            throw_store_failure(
                impl, "another session is already open on this store");
        }
        execute_sql(impl, "begin transaction;");
        impl.in_session = true;
    }

    ~sqlite_store_session()
    {
        if (active)
        {
            try
            {
                this->abort();
            }
            catch (store_failure&)
            {
                // The transaction is discarded when the connection closes.
            }
        }
    }

    void
    commit() override
    {
        finish("commit;");
    }

    void
    abort() override
    {
        finish("rollback;");
    }

    void
    finish(string const& sql)
    {
        auto& impl = *store;
        std::scoped_lock<std::mutex> lock(impl.mutex);
        if (!active)
        {
            throw_store_failure(
                impl, "session has already been committed or aborted");
        }
        active = false;
        impl.in_session = false;
        execute_sql(impl, sql);
    }

    std::shared_ptr<sqlite_store_impl> store;

    bool active = true;
};

// Check that an operation is allowed to use the database with the given
// session. The store's mutex must be held.
static void
check_session(sqlite_store_impl& store, store_session* session)
{
    if (session)
    {
        auto* sqlite_session = dynamic_cast<sqlite_store_session*>(session);
        if (!sqlite_session || sqlite_session->store.get() != &store)
            throw_store_failure(store, "session doesn't belong to this store");
        if (!sqlite_session->active)
        {
            throw_store_failure(
                store, "session has already been committed or aborted");
        }
    }
    else if (store.in_session)
    {
        throw_store_failure(
            store, "operations must go through the open session");
    }
}

// Run :fn so that its writes take effect together. If a session is open,
// they're already part of its transaction.
template<class Fn>
static auto
run_atomically(sqlite_store_impl& store, store_session* session, Fn&& fn)
{
    if (session)
        return fn();
    execute_sql(store, "savepoint chronicle_write;");
    try
    {
        auto result = fn();
        execute_sql(store, "release chronicle_write;");
        return result;
    }
    catch (...)
    {
        sqlite3_exec(
            store.db,
            "rollback to chronicle_write; release chronicle_write;",
            0,
            0,
            nullptr);
        throw;
    }
}

static update_result
update_documents(
    sqlite_store_impl& store,
    string const& collection,
    document_query const& query,
    update_expression const& update,
    update_options const& options,
    bool multiple)
{
    update_result result;
    for (auto const& document : load_collection(store, collection))
    {
        if (!matches_query(document, query))
            continue;
        ++result.matched_count;
        auto updated = apply_update(document, update);
        if (updated != document)
        {
            if (get_document_id(updated) != get_document_id(document))
            {
                throw_store_failure(
                    store, "updates can't change a document's _id");
            }
            write_document(store, store.update_statement, collection, updated);
            ++result.modified_count;
        }
        if (!multiple)
            break;
    }
    if (result.matched_count == 0 && options.upsert)
    {
        auto document = make_upsert_document(query, update);
        write_document(store, store.insert_statement, collection, document);
        result.upserted_id = get_document_id(document);
        result.upserted_count = 1;
    }
    return result;
}

// INITIALIZATION

static void
shut_down(sqlite_store_impl& store)
{
    if (store.db)
    {
        sqlite3_finalize(store.database_version_query);
        sqlite3_finalize(store.collection_query);
        sqlite3_finalize(store.insert_statement);
        sqlite3_finalize(store.save_statement);
        sqlite3_finalize(store.update_statement);
        sqlite3_finalize(store.delete_statement);
        sqlite3_close(store.db);
        store.db = nullptr;
    }
}

// Open (or create) the database file and verify that the version number is
// what we expect.
static void
open_and_check_db(sqlite_store_impl& store)
{
    int const expected_database_version = 1;

    open_db(store);

    // Get the version number embedded in the database.
    store.database_version_query
        = prepare_statement(store, "pragma user_version;");
    int database_version = 0;
    execute_prepared_statement(
        store,
        store.database_version_query,
        expected_column_count{1},
        [&](sqlite_row& row) { database_version = read_int32(row, 0); });

    // A database_version of 0 indicates a fresh database, so initialize it.
    if (database_version == 0)
    {
        execute_sql(
            store,
            "create table documents("
            " seq integer primary key autoincrement,"
            " collection text not null,"
            " id text not null,"
            " body text not null,"
            " unique(collection, id));");
        execute_sql(
            store,
            "pragma user_version = "
                + lexical_cast<string>(expected_database_version) + ";");
    }
    // If we find a database from a different version, abort.
    else if (database_version != expected_database_version)
    {
        throw_store_failure(store, "incompatible database");
    }
}

static void
initialize(sqlite_store_impl& store, sqlite_store_config const& config)
{
    store.path = config.path;

    try
    {
        open_and_check_db(store);
    }
    catch (store_failure&)
    {
        shut_down(store);
        throw;
    }

    // Initialize our prepared statements.
    store.collection_query = prepare_statement(
        store,
        "select body from documents where collection=?1 order by seq;");
    store.insert_statement = prepare_statement(
        store,
        "insert into documents(collection, id, body) values(?1, ?2, ?3);");
    store.save_statement = prepare_statement(
        store,
        "insert into documents(collection, id, body) values(?1, ?2, ?3)"
        " on conflict(collection, id) do update set body=excluded.body;");
    store.update_statement = prepare_statement(
        store,
        "update documents set body=?3 where collection=?1 and id=?2;");
    store.delete_statement = prepare_statement(
        store, "delete from documents where collection=?1 and id=?2;");
}

// API

sqlite_store::sqlite_store(sqlite_store_config const& config)
    : impl_(new sqlite_store_impl)
{
    initialize(*impl_, config);
}

sqlite_store::~sqlite_store()
{
    shut_down(*impl_);
}

cppcoro::task<optional<dynamic_map>>
sqlite_store::find_one(
    string collection, document_query query, store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    for (auto& document : load_collection(store, collection))
    {
        if (matches_query(document, query))
            co_return std::move(document);
    }
    co_return none;
}

cppcoro::task<std::vector<dynamic_map>>
sqlite_store::find_many(
    string collection, document_query query, store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    std::vector<dynamic_map> found;
    for (auto& document : load_collection(store, collection))
    {
        if (matches_query(document, query))
            found.push_back(std::move(document));
    }
    co_return found;
}

cppcoro::task<>
sqlite_store::insert(
    string collection, dynamic_map document, store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    write_document(
        store,
        store.insert_statement,
        collection,
        with_generated_id(std::move(document)));
    co_return;
}

cppcoro::task<>
sqlite_store::save(
    string collection, dynamic_map document, store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    write_document(
        store,
        store.save_statement,
        collection,
        with_generated_id(std::move(document)));
    co_return;
}

cppcoro::task<update_result>
sqlite_store::update_one(
    string collection,
    document_query query,
    update_expression update,
    update_options options,
    store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    co_return run_atomically(store, session, [&] {
        return update_documents(
            store, collection, query, update, options, false);
    });
}

cppcoro::task<update_result>
sqlite_store::update_many(
    string collection,
    document_query query,
    update_expression update,
    update_options options,
    store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    co_return run_atomically(store, session, [&] {
        return update_documents(
            store, collection, query, update, options, true);
    });
}

cppcoro::task<integer>
sqlite_store::delete_many(
    string collection, document_query query, store_session* session)
{
    auto& store = *impl_;
    std::scoped_lock<std::mutex> lock(store.mutex);
    check_session(store, session);
    co_return run_atomically(store, session, [&] {
        integer deleted = 0;
        for (auto const& document : load_collection(store, collection))
        {
            if (matches_query(document, query))
            {
                delete_document(store, collection, get_document_id(document));
                ++deleted;
            }
        }
        return deleted;
    });
}

std::unique_ptr<store_session>
sqlite_store::begin_session()
{
    return std::make_unique<sqlite_store_session>(impl_);
}

} // namespace chronicle
