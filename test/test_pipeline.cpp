/*

test_pipeline.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE pipeline_test

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/ledger/transfer_ledger.hpp>
#include <mailshift/migrate/pipeline.hpp>
#include <mailshift/migrate/retry_policy.hpp>
#include <mailshift/migrate/session_manager.hpp>
#include "fake_store.hpp"


using mailshift::migrate::batch_pipeline;
using mailshift::migrate::mailbox_report;
using mailshift::migrate::mailbox_status;
using mailshift::migrate::pipeline_options;
using mailshift::migrate::retry_policy;
using mailshift::testing::fake_account;
using mailshift::testing::fake_connector;


namespace
{

mailshift::ledger::transfer_ledger open_memory_ledger()
{
    auto ledger = mailshift::ledger::transfer_ledger::open(":memory:");
    if (!ledger)
        throw std::runtime_error(ledger.error().to_string());
    return std::move(*ledger);
}

std::string raw_message(int n)
{
    return "Message-ID: <" + std::to_string(n) + "@example.org>\r\nSubject: message " + std::to_string(n)
        + "\r\n\r\nbody " + std::to_string(n) + "\r\n";
}

pipeline_options quick_options(std::size_t batch_size)
{
    pipeline_options options;
    options.batch_size = batch_size;
    options.batch_delay = std::chrono::milliseconds{0};
    options.search_policy = retry_policy::linear(5, std::chrono::milliseconds{0});
    return options;
}

struct pipeline_fixture
{
    boost::asio::io_context ctx;
    mailshift::log::logger logger{mailshift::log::level::off};
    fake_connector connector;
    std::shared_ptr<fake_account> src = connector.add_account("src.example");
    std::shared_ptr<fake_account> dst = connector.add_account("dst.example");
    mailshift::store::endpoint_config src_cfg = mailshift::testing::endpoint("src.example");
    mailshift::store::endpoint_config dst_cfg = mailshift::testing::endpoint("dst.example");
    mailshift::ledger::transfer_ledger ledger = open_memory_ledger();
    mailshift::migrate::session_manager sessions{connector, logger, std::chrono::milliseconds{0}};

    void fill_inbox(int count)
    {
        for (int n = 1; n <= count; ++n)
            src->add_message("INBOX", raw_message(n));
    }

    mailbox_report run(batch_pipeline& pipeline, const std::string& dst_mailbox = "Imported")
    {
        return mailshift::testing::run_awaitable(ctx, pipeline.run(src_cfg, dst_cfg, "INBOX", dst_mailbox));
    }

    mailbox_report run(const pipeline_options& options, const std::string& dst_mailbox = "Imported")
    {
        batch_pipeline pipeline(sessions, ledger, logger, options);
        return run(pipeline, dst_mailbox);
    }

    bool recorded(const std::string& key)
    {
        auto res = ledger.is_transferred("INBOX", key);
        BOOST_REQUIRE(res.has_value());
        return *res;
    }

    std::int64_t ledger_size()
    {
        auto res = ledger.count();
        BOOST_REQUIRE(res.has_value());
        return *res;
    }
};

} // namespace


BOOST_FIXTURE_TEST_CASE(transfers_in_batches_and_archives_at_source, pipeline_fixture)
{
    fill_inbox(3);
    const auto report = run(quick_options(2));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.found == 3u);
    BOOST_TEST(report.batches == 2u);
    BOOST_TEST(report.transferred == 3u);

    BOOST_REQUIRE(src->fetches.size() == 2u);
    BOOST_TEST(src->fetches[0] == (std::vector<std::string>{"1", "2"}), boost::test_tools::per_element());
    BOOST_TEST(src->fetches[1] == (std::vector<std::string>{"3"}), boost::test_tools::per_element());

    BOOST_TEST(src->size_of("INBOX") == 0u);
    BOOST_TEST(src->size_of("Migrated/INBOX") == 3u);
    BOOST_TEST(dst->size_of("Imported") == 3u);
    BOOST_TEST(ledger_size() == 3);
    BOOST_TEST(recorded("1"));
    BOOST_TEST(recorded("2"));
    BOOST_TEST(recorded("3"));
}

BOOST_FIXTURE_TEST_CASE(keeps_message_order_within_batches, pipeline_fixture)
{
    fill_inbox(3);
    run(quick_options(2));

    const std::vector<std::string> expected{raw_message(1), raw_message(2), raw_message(3)};
    BOOST_TEST(dst->appended_raws == expected, boost::test_tools::per_element());

    std::vector<std::string> moves;
    for (const auto& call : src->calls)
        if (call.starts_with("move "))
            moves.push_back(call);
    const std::vector<std::string> expected_moves{"move 1 Migrated/INBOX", "move 2 Migrated/INBOX",
        "move 3 Migrated/INBOX"};
    BOOST_TEST(moves == expected_moves, boost::test_tools::per_element());
}

BOOST_FIXTURE_TEST_CASE(records_message_id_and_destination, pipeline_fixture)
{
    fill_inbox(1);
    run(quick_options(50));

    auto records = ledger.records_for("INBOX");
    BOOST_REQUIRE(records.has_value());
    BOOST_REQUIRE(records->size() == 1u);
    BOOST_TEST(records->front().source_key == "1");
    BOOST_TEST(records->front().destination_mailbox.value_or("") == "Imported");
    BOOST_TEST(records->front().message_id.value_or("") == "<1@example.org>");
}

BOOST_FIXTURE_TEST_CASE(skips_keys_already_in_ledger, pipeline_fixture)
{
    fill_inbox(3);
    mailshift::ledger::transfer_record done;
    done.source_mailbox = "INBOX";
    done.source_key = "2";
    BOOST_REQUIRE(ledger.record_transfer(done).has_value());

    const auto report = run(quick_options(2));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.already_transferred == 1u);
    BOOST_TEST(report.transferred == 2u);
    BOOST_REQUIRE(src->fetches.size() == 2u);
    BOOST_TEST(src->fetches[0] == (std::vector<std::string>{"1", "2"}), boost::test_tools::per_element());
    BOOST_TEST(src->count_calls("move 2 ") == 0u);
    BOOST_TEST(dst->appended_raws.size() == 2u);
    BOOST_TEST(src->size_of("INBOX") == 1u);

    auto records = ledger.records_for("INBOX");
    BOOST_REQUIRE(records.has_value());
    BOOST_TEST(records->size() == 3u);
}

BOOST_FIXTURE_TEST_CASE(append_exhaustion_leaves_message_unrecorded, pipeline_fixture)
{
    fill_inbox(6);
    dst->poisoned_raws.insert(raw_message(5));

    const auto report = run(quick_options(50));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.failed_appends == 1u);
    BOOST_TEST(report.transferred == 5u);
    BOOST_TEST(!recorded("5"));
    BOOST_TEST(recorded("6"));
    BOOST_TEST(src->count_calls("move 5 ") == 0u);
    BOOST_REQUIRE(src->size_of("INBOX") == 1u);
    BOOST_TEST(src->mailboxes["INBOX"].messages.front().key == "5");
    // Five successful appends and three attempts for the poisoned message.
    BOOST_TEST(dst->count_calls("append ") == 8u);
    BOOST_TEST(dst->opens == 4);
}

BOOST_FIXTURE_TEST_CASE(move_failure_is_not_recorded, pipeline_fixture)
{
    fill_inbox(3);
    src->unmovable.insert("2");

    const auto report = run(quick_options(50));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.failed_moves == 1u);
    BOOST_TEST(report.transferred == 2u);
    BOOST_TEST(!recorded("2"));
    BOOST_TEST(dst->size_of("Imported") == 3u);
    BOOST_TEST(src->size_of("INBOX") == 1u);
}

BOOST_FIXTURE_TEST_CASE(move_abort_reconnects_source, pipeline_fixture)
{
    fill_inbox(3);
    src->move_aborts = 1;

    const auto report = run(quick_options(50));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.failed_moves == 1u);
    BOOST_TEST(report.transferred == 2u);
    BOOST_TEST(!recorded("1"));
    BOOST_TEST(recorded("2"));
    BOOST_TEST(recorded("3"));
    BOOST_TEST(src->opens == 2);
}

BOOST_FIXTURE_TEST_CASE(dry_run_changes_nothing, pipeline_fixture)
{
    fill_inbox(3);
    auto options = quick_options(2);
    options.dry_run = true;

    const auto report = run(options);

    BOOST_TEST(report.completed());
    BOOST_TEST(report.dry_run);
    BOOST_TEST(report.transferred == 3u);
    BOOST_TEST(ledger_size() == 0);
    BOOST_TEST(src->size_of("INBOX") == 3u);
    BOOST_TEST(!src->has_mailbox("Migrated/INBOX"));
    BOOST_TEST(!dst->has_mailbox("Imported"));
    BOOST_TEST(src->count_calls("create ") == 0u);
    BOOST_TEST(src->count_calls("move ") == 0u);
    BOOST_TEST(dst->count_calls("create ") == 0u);
    BOOST_TEST(dst->count_calls("append ") == 0u);
    BOOST_TEST(src->fetches.size() == 2u);
}

BOOST_FIXTURE_TEST_CASE(unavailable_destination_leaves_source_alone, pipeline_fixture)
{
    fill_inbox(3);
    dst->uncreatable.insert("Imported");

    const auto report = run(quick_options(50));

    BOOST_TEST(report.status == mailbox_status::destination_unavailable);
    BOOST_TEST(src->count_calls("select ") == 0u);
    BOOST_TEST(src->count_calls("search ") == 0u);
    BOOST_TEST(src->count_calls("create ") == 0u);
    BOOST_TEST(src->logouts == 1);
    BOOST_TEST(dst->logouts == 1);
}

BOOST_FIXTURE_TEST_CASE(unselectable_source_aborts_mailbox, pipeline_fixture)
{
    fill_inbox(1);
    src->unselectable.insert("INBOX");

    const auto report = run(quick_options(50));

    BOOST_TEST(report.status == mailbox_status::source_unavailable);
    BOOST_TEST(dst->count_calls("append ") == 0u);
    BOOST_TEST(src->logouts == 1);
    BOOST_TEST(dst->logouts == 1);
}

BOOST_FIXTURE_TEST_CASE(connection_failures_are_reported, pipeline_fixture)
{
    fill_inbox(1);
    src->open_failures = 1;
    BOOST_TEST(run(quick_options(50)).status == mailbox_status::source_connect_failed);

    dst->open_failures = 1;
    const auto report = run(quick_options(50));
    BOOST_TEST(report.status == mailbox_status::destination_connect_failed);
    BOOST_TEST(src->logouts == 1);
    BOOST_TEST(src->size_of("INBOX") == 1u);
}

BOOST_FIXTURE_TEST_CASE(fetch_exhaustion_skips_batch, pipeline_fixture)
{
    fill_inbox(3);
    src->fetch_aborts = 3;

    const auto report = run(quick_options(2));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.skipped_batches == 1u);
    BOOST_TEST(report.transferred == 1u);
    BOOST_TEST(src->fetches.size() == 4u);
    BOOST_TEST(src->opens == 4);
    BOOST_TEST(!recorded("1"));
    BOOST_TEST(!recorded("2"));
    BOOST_TEST(recorded("3"));
}

BOOST_FIXTURE_TEST_CASE(fetch_abort_recovers_on_new_session, pipeline_fixture)
{
    fill_inbox(2);
    src->fetch_aborts = 1;

    const auto report = run(quick_options(50));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.skipped_batches == 0u);
    BOOST_TEST(report.transferred == 2u);
    BOOST_TEST(src->opens == 2);
}

BOOST_FIXTURE_TEST_CASE(search_retries_on_fresh_session, pipeline_fixture)
{
    fill_inbox(2);
    src->search_aborts = 2;

    const auto report = run(quick_options(50));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.transferred == 2u);
    BOOST_TEST(src->count_calls("search ") == 3u);
    BOOST_TEST(src->opens == 3);
}

BOOST_FIXTURE_TEST_CASE(search_exhaustion_aborts_mailbox, pipeline_fixture)
{
    fill_inbox(2);
    src->search_aborts = 5;

    const auto report = run(quick_options(50));

    BOOST_TEST(report.status == mailbox_status::search_failed);
    BOOST_TEST(src->count_calls("search ") == 5u);
    BOOST_TEST(dst->count_calls("append ") == 0u);
}

BOOST_FIXTURE_TEST_CASE(search_stops_when_reconnect_refused, pipeline_fixture)
{
    fill_inbox(2);
    src->search_aborts = 1;
    src->refused_opens = {2};

    const auto report = run(quick_options(50));

    BOOST_TEST(report.status == mailbox_status::session_lost);
    BOOST_TEST(report.transferred == 0u);
    BOOST_TEST(src->count_calls("search ") == 1u);
    BOOST_TEST(src->opens == 2);
    BOOST_TEST(dst->count_calls("append ") == 0u);
    BOOST_TEST(src->size_of("INBOX") == 2u);
    BOOST_TEST(ledger_size() == 0);
}

BOOST_FIXTURE_TEST_CASE(failed_reconnect_loses_session, pipeline_fixture)
{
    fill_inbox(2);
    src->fetch_aborts = 1;
    src->max_opens = 1;

    const auto report = run(quick_options(50));

    BOOST_TEST(report.status == mailbox_status::session_lost);
    BOOST_TEST(report.transferred == 0u);
    BOOST_TEST(report.skipped_batches == 0u);
    BOOST_TEST(src->opens == 2);
    BOOST_TEST(src->size_of("INBOX") == 2u);
    BOOST_TEST(dst->logouts == 1);
}

BOOST_FIXTURE_TEST_CASE(vanished_message_is_skipped, pipeline_fixture)
{
    fill_inbox(3);
    src->vanishing.insert("2");

    const auto report = run(quick_options(50));

    BOOST_TEST(report.completed());
    BOOST_TEST(report.vanished == 1u);
    BOOST_TEST(report.transferred == 2u);
    BOOST_TEST(!recorded("2"));
    BOOST_TEST(src->count_calls("move 2 ") == 0u);
}

BOOST_FIXTURE_TEST_CASE(interrupted_run_resumes_with_remaining_messages, pipeline_fixture)
{
    fill_inbox(3);
    batch_pipeline pipeline(sessions, ledger, logger, quick_options(1));
    std::size_t progress_calls = 0;
    pipeline.set_progress_callback([&](const mailshift::migrate::batch_progress& progress)
    {
        ++progress_calls;
        // Break the source connection for good once two batches are committed.
        if (progress.batch == 2)
        {
            src->fetch_aborts = 1;
            src->open_failures = 10;
        }
    });

    const auto first = run(pipeline);
    BOOST_TEST(first.status == mailbox_status::session_lost);
    BOOST_TEST(first.transferred == 2u);
    BOOST_TEST(progress_calls == 2u);
    BOOST_TEST(ledger_size() == 2);

    src->open_failures = 0;
    src->fetch_aborts = 0;
    const auto second = run(quick_options(1));
    BOOST_TEST(second.completed());
    BOOST_TEST(second.found == 1u);
    BOOST_TEST(second.transferred == 1u);
    BOOST_TEST(ledger_size() == 3);
    BOOST_TEST(dst->size_of("Imported") == 3u);
    BOOST_TEST(src->size_of("Migrated/INBOX") == 3u);
}

BOOST_FIXTURE_TEST_CASE(second_run_is_idempotent, pipeline_fixture)
{
    fill_inbox(3);
    run(quick_options(2));
    const auto again = run(quick_options(2));

    BOOST_TEST(again.completed());
    BOOST_TEST(again.found == 0u);
    BOOST_TEST(again.transferred == 0u);
    BOOST_TEST(ledger_size() == 3);
    BOOST_TEST(dst->size_of("Imported") == 3u);
}

BOOST_FIXTURE_TEST_CASE(progress_reported_after_each_batch, pipeline_fixture)
{
    fill_inbox(5);
    batch_pipeline pipeline(sessions, ledger, logger, quick_options(2));
    std::vector<std::size_t> processed;
    std::size_t batch_count = 0;
    pipeline.set_progress_callback([&](const mailshift::migrate::batch_progress& progress)
    {
        processed.push_back(progress.processed);
        batch_count = progress.batch_count;
        BOOST_TEST(progress.total == 5u);
        BOOST_TEST(progress.mailbox == "INBOX");
    });

    run(pipeline);

    BOOST_TEST(batch_count == 3u);
    BOOST_TEST(processed == (std::vector<std::size_t>{2, 4, 5}), boost::test_tools::per_element());
}
