#include <iostream>

#include <boost/program_options.hpp>

#include <cppcoro/sync_wait.hpp>

#include <chronicle/core/logging.hpp>
#include <chronicle/encodings/json.hpp>
#include <chronicle/fs/file_io.hpp>
#include <chronicle/history/registry.hpp>
#include <chronicle/patch/exclusion.hpp>
#include <chronicle/store/query.hpp>
#include <chronicle/store/sqlite_store.hpp>

using namespace chronicle;

namespace po = boost::program_options;

CHRONICLE_DEFINE_EXCEPTION(usage_error)
CHRONICLE_DEFINE_EXCEPTION(document_not_found)
CHRONICLE_DEFINE_ERROR_INFO(string, document_id)

static void
check_argument_count(
    string const& command, std::vector<string> const& args, size_t expected)
{
    if (args.size() != expected)
    {
        CHRONICLE_THROW(
            usage_error() << internal_error_message_info(
                command + " expects " + lexical_cast<string>(expected)
                + " arguments"));
    }
}

static tool_config
read_config(po::variables_map const& vm)
{
    if (!vm.count("config-file"))
    {
        CHRONICLE_THROW(
            usage_error() << internal_error_message_info(
                "no configuration file specified"));
    }
    auto config = from_dynamic<tool_config>(
        read_value_file(vm["config-file"].as<string>()));
    if (vm.count("database"))
        config.database = vm["database"].as<string>();
    return config;
}

// Write a command's result to the --output file if one was given, or to
// stdout as JSON.
static void
write_result(dynamic const& result, po::variables_map const& vm)
{
    if (vm.count("output"))
        write_value_file(vm["output"].as<string>(), result);
    else
        std::cout << value_to_json(result) << "\n";
}

static void
run_diff(std::vector<string> const& args, po::variables_map const& vm)
{
    check_argument_count("diff", args, 2);
    std::vector<string> excludes;
    if (vm.count("exclude"))
        excludes = vm["exclude"].as<std::vector<string>>();
    auto ops = compute_change_ops(
        read_value_file(args[0]),
        read_value_file(args[1]),
        parse_exclude_patterns(excludes),
        vm.count("original-values") != 0);
    write_result(to_dynamic(ops ? *ops : patch_operation_list()), vm);
}

static void
run_history(
    tool_config const& config,
    std::vector<string> const& args,
    po::variables_map const& vm)
{
    check_argument_count("history", args, 2);
    sqlite_store store(sqlite_store_config{config.database});
    history_registry registry(store);
    auto& tracker = registry.register_type(find_type_options(config, args[0]));
    auto records
        = cppcoro::sync_wait(tracker.history(parse_object_id(args[1])));
    write_result(to_dynamic(records), vm);
}

static void
run_rollback(
    tool_config const& config,
    std::vector<string> const& args,
    po::variables_map const& vm)
{
    check_argument_count("rollback", args, 3);
    sqlite_store store(sqlite_store_config{config.database});
    history_registry registry(store);
    auto& tracker = registry.register_type(find_type_options(config, args[0]));

    auto id = parse_object_id(args[1]);
    auto patch_id = parse_object_id(args[2]);
    dynamic_map overrides;
    if (vm.count("overrides"))
    {
        overrides = cast<dynamic_map>(
            read_value_file(vm["overrides"].as<string>()));
    }
    bool persist = vm.count("dry-run") == 0;

    auto session = store.begin_session();
    auto document
        = cppcoro::sync_wait(
            tracker.find_one(make_id_query(id), session.get()));
    if (!document)
    {
        CHRONICLE_THROW(
            document_not_found() << document_id_info(args[1])
                                 << type_name_info(args[0]));
    }
    auto rolled_back = cppcoro::sync_wait(tracker.rollback(
        std::move(*document),
        patch_id,
        std::move(overrides),
        persist,
        session.get()));
    session->commit();
    write_result(rolled_back.document, vm);
}

int
main(int argc, char const* const* argv)
{
    po::options_description desc("Supported options");
    desc.add_options()("help", "show help message")(
        "config-file",
        po::value<string>(),
        "specify the configuration file to use (JSON or YAML)")(
        "database",
        po::value<string>(),
        "override the database file named in the configuration")(
        "exclude",
        po::value<std::vector<string>>()->composing(),
        "(diff) exclude a path pattern from the result")(
        "original-values",
        "(diff) annotate operations with the values they replace")(
        "overrides",
        po::value<string>(),
        "(rollback) a file with values to merge over the rolled back state")(
        "dry-run", "(rollback) don't save the rolled back document")(
        "output",
        po::value<string>(),
        "write the result to a file (YAML for .yml/.yaml, otherwise JSON)")(
        "log-level",
        po::value<string>(),
        "set the log level (trace, debug, info, warn, error, off)");

    po::options_description hidden;
    hidden.add_options()("command", po::value<string>())(
        "arguments", po::value<std::vector<string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("arguments", -1);

    try
    {
        po::variables_map vm;
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);

        if (vm.count("help") || !vm.count("command"))
        {
            std::cout << "usage:\n"
                      << "  chronicle diff <prior> <current>\n"
                      << "  chronicle history <type> <id>\n"
                      << "  chronicle rollback <type> <id> <patch-id>\n\n"
                      << desc;
            return vm.count("help") ? 0 : 1;
        }

        initialize_logging(
            vm.count("log-level") ? some(spdlog::level::from_str(
                vm["log-level"].as<string>()))
                                  : none);

        auto command = vm["command"].as<string>();
        std::vector<string> args;
        if (vm.count("arguments"))
            args = vm["arguments"].as<std::vector<string>>();

        if (command == "diff")
            run_diff(args, vm);
        else if (command == "history")
            run_history(read_config(vm), args, vm);
        else if (command == "rollback")
            run_rollback(read_config(vm), args, vm);
        else
        {
            CHRONICLE_THROW(
                usage_error() << internal_error_message_info(
                    "unknown command: " + command));
        }
    }
    catch (std::exception& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}
