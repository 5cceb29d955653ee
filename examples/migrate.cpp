/*

migrate.cpp
-----------

Moves every mailbox of a source IMAP account into a destination account, archiving the
migrated messages at the source. Interrupted runs resume from the transfer ledger.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/program_options.hpp>
#include "example_util.hpp"
#include <mailshift/app/config.hpp>
#include <mailshift/ledger/transfer_ledger.hpp>
#include <mailshift/migrate/orchestrator.hpp>
#include <mailshift/migrate/pipeline.hpp>
#include <mailshift/migrate/session_manager.hpp>
#include <mailshift/store/imap_session.hpp>


namespace po = boost::program_options;

namespace
{

constexpr int EXIT_RUN_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct cli_options
{
    std::string config_path;
    std::string mapping_path;
    std::string exclude_path;
    bool dry_run = false;
    bool verbose = false;
    bool trace = false;
    std::optional<std::size_t> batch_size;
};

std::optional<cli_options> parse_command_line(int argc, char* argv[])
{
    cli_options cli;
    po::options_description desc("Usage: mailshift --config <file> [options]");
    desc.add_options()
        ("help,h", "show this help")
        ("config,c", po::value<std::string>(&cli.config_path)->required(), "YAML configuration file")
        ("mapping-file,m", po::value<std::string>(&cli.mapping_path), "source to destination mailbox names (.json, .yml, .yaml)")
        ("exclude-file,x", po::value<std::string>(&cli.exclude_path), "mailboxes to skip, one per line")
        ("dry-run,n", po::bool_switch(&cli.dry_run), "report what would be transferred, change nothing")
        ("verbose,v", po::bool_switch(&cli.verbose), "debug logging")
        ("trace", po::bool_switch(&cli.trace), "log every protocol line (passwords redacted)")
        ("batch-size", po::value<std::size_t>(), "messages fetched per batch, overrides the configuration");

    try
    {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help") != 0)
        {
            std::cout << desc << "\n";
            return std::nullopt;
        }
        po::notify(vm);
        if (vm.count("batch-size") != 0)
        {
            cli.batch_size = vm["batch-size"].as<std::size_t>();
            if (*cli.batch_size == 0)
                throw po::error("--batch-size must be positive");
        }
    }
    catch (const po::error& exc)
    {
        std::cerr << exc.what() << "\n" << desc << "\n";
        return std::nullopt;
    }
    return cli;
}

} // namespace


int main(int argc, char* argv[])
{
    const auto cli = parse_command_line(argc, argv);
    if (!cli.has_value())
        return EXIT_USAGE;

    mailshift::log::logger logger;
    setup_logging(logger, cli->verbose, cli->trace);

    auto config = mailshift::app::load_config(cli->config_path);
    if (!config)
    {
        print_error(config.error());
        return EXIT_USAGE;
    }
    if (cli->batch_size.has_value())
        config->migration.batch_size = *cli->batch_size;

    std::optional<std::map<std::string, std::string>> mapping;
    if (!cli->mapping_path.empty())
    {
        auto loaded = mailshift::app::load_mapping(cli->mapping_path);
        if (!loaded)
        {
            print_error(loaded.error());
            return EXIT_USAGE;
        }
        MAILSHIFT_INFO(logger, "Loaded " << loaded->size() << " mailbox mappings from " << cli->mapping_path);
        mapping = std::move(*loaded);
    }

    std::set<std::string> exclude;
    if (!cli->exclude_path.empty())
    {
        auto loaded = mailshift::app::load_exclude_list(cli->exclude_path);
        if (!loaded)
        {
            print_error(loaded.error());
            return EXIT_USAGE;
        }
        exclude = std::move(*loaded);
    }

    auto ledger = mailshift::ledger::transfer_ledger::open(config->database_path);
    if (!ledger)
    {
        print_error(ledger.error());
        return EXIT_RUN_FAILED;
    }

    mailshift::migrate::pipeline_options options;
    options.batch_size = config->migration.batch_size;
    options.batch_delay = config->migration.batch_delay;
    options.archive_prefix = config->migration.archive_prefix;
    options.dry_run = cli->dry_run;
    if (options.dry_run)
        MAILSHIFT_INFO(logger, "Dry run: no mailbox, message or ledger record will be changed");

    boost::asio::io_context io_ctx;
    mailshift::store::imap_connector connector(io_ctx.get_executor(), logger);
    mailshift::migrate::session_manager sessions(connector, logger,
        std::chrono::duration_cast<std::chrono::milliseconds>(config->migration.cooldown));
    mailshift::migrate::batch_pipeline pipeline(sessions, *ledger, logger, options);
    pipeline.set_progress_callback([&logger](const mailshift::migrate::batch_progress& progress)
    {
        MAILSHIFT_INFO(logger, progress.mailbox << ": batch " << progress.batch << "/" << progress.batch_count
            << " (" << progress.processed << "/" << progress.total << " messages)");
    });
    mailshift::migrate::orchestrator orchestrator(sessions, pipeline, logger);

    int status = EXIT_SUCCESS;
    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            auto summary = co_await orchestrator.run(config->source, config->destination, exclude, mapping);
            if (!summary)
            {
                MAILSHIFT_FATAL(logger, "Cannot list the source mailboxes: " << summary.error().to_string());
                status = EXIT_RUN_FAILED;
                co_return;
            }
            for (const auto& report : summary->reports)
            {
                if (!report.completed())
                    MAILSHIFT_WARN(logger, "Mailbox " << report.source_mailbox << " not completed: " << report.status);
            }
        },
        [&](std::exception_ptr ep)
        {
            if (!ep)
                return;
            try
            {
                std::rethrow_exception(ep);
            }
            catch (const std::exception& exc)
            {
                MAILSHIFT_FATAL(logger, "Migration stopped: " << exc.what());
            }
            status = EXIT_RUN_FAILED;
        });
    io_ctx.run();
    return status;
}
