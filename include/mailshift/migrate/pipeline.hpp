/*

pipeline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Per-mailbox transfer loop: fetch a batch from the source, append each message to the
destination, move it to the source archive, then commit it to the ledger.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/detail/timer.hpp>
#include <mailshift/ledger/transfer_ledger.hpp>
#include <mailshift/migrate/message_id.hpp>
#include <mailshift/migrate/retry_policy.hpp>
#include <mailshift/migrate/session_manager.hpp>
#include <mailshift/store/endpoint.hpp>
#include <mailshift/store/session.hpp>

namespace mailshift::migrate
{

struct pipeline_options
{
    std::size_t batch_size = 50;
    /// Pause between two batches of the same mailbox.
    std::chrono::milliseconds batch_delay{2000};
    bool dry_run = false;
    /// Source-side archive of a mailbox is `archive_prefix + mailbox`.
    std::string archive_prefix = "Migrated/";
    retry_policy search_policy = retry_policy::search();
    retry_policy fetch_policy = retry_policy::reconnecting(3);
    retry_policy append_policy = retry_policy::reconnecting(3);
};

/// How the run of one mailbox ended.
enum class mailbox_status
{
    completed,
    source_connect_failed,
    destination_connect_failed,
    destination_unavailable,
    source_unavailable,
    search_failed,
    session_lost,
    ledger_failed
};

[[nodiscard]] constexpr std::string_view to_string(mailbox_status st) noexcept
{
    switch (st)
    {
        case mailbox_status::completed: return "completed";
        case mailbox_status::source_connect_failed: return "source connection failed";
        case mailbox_status::destination_connect_failed: return "destination connection failed";
        case mailbox_status::destination_unavailable: return "destination mailbox unavailable";
        case mailbox_status::source_unavailable: return "source mailbox unavailable";
        case mailbox_status::search_failed: return "search failed";
        case mailbox_status::session_lost: return "session lost";
        case mailbox_status::ledger_failed: return "ledger failure";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, mailbox_status st)
{
    return os << to_string(st);
}

struct mailbox_report
{
    std::string source_mailbox;
    std::string destination_mailbox;
    mailbox_status status = mailbox_status::completed;
    bool dry_run = false;

    std::size_t found = 0;
    std::size_t batches = 0;
    /// Committed to the ledger, or that would have been in a dry run.
    std::size_t transferred = 0;
    std::size_t already_transferred = 0;
    /// Listed by the search but gone by the time of the fetch.
    std::size_t vanished = 0;
    std::size_t failed_appends = 0;
    std::size_t failed_moves = 0;
    std::size_t skipped_batches = 0;

    [[nodiscard]] bool completed() const noexcept
    {
        return status == mailbox_status::completed;
    }
};

/// State after each batch, handed to the progress callback.
struct batch_progress
{
    const std::string& mailbox;
    std::size_t batch;
    std::size_t batch_count;
    std::size_t processed;
    std::size_t total;
    const mailbox_report& report;
};

using progress_callback = std::function<void(const batch_progress&)>;

/**
Migrates one source mailbox into one destination mailbox.

A message is committed to the ledger only once it is appended to the destination and moved to
the archive, so a rerun skips exactly the committed messages. Dry runs fetch and check but neither
create, append, move nor write the ledger.
**/
class batch_pipeline
{
public:
    batch_pipeline(session_manager& sessions, mailshift::ledger::transfer_ledger& ledger,
        mailshift::log::logger& logger, pipeline_options options = {})
        : sessions_(sessions), ledger_(ledger), logger_(logger), options_(std::move(options))
    {
        if (options_.batch_size == 0)
            options_.batch_size = 1;
    }

    void set_progress_callback(progress_callback callback)
    {
        progress_ = std::move(callback);
    }

    [[nodiscard]] const pipeline_options& options() const noexcept
    {
        return options_;
    }

    [[nodiscard]] std::string archive_mailbox(std::string_view source_mailbox) const
    {
        return options_.archive_prefix + std::string(source_mailbox);
    }

    /**
    Running the migration of one mailbox; both sessions are closed before returning.

    @param source              Source endpoint.
    @param destination         Destination endpoint.
    @param source_mailbox      Mailbox to empty.
    @param destination_mailbox Mailbox receiving the messages.
    @return                    Outcome and counters.
    **/
    awaitable<mailbox_report> run(const mailshift::store::endpoint_config& source,
        const mailshift::store::endpoint_config& destination, std::string source_mailbox, std::string destination_mailbox)
    {
        run_state state{source, destination, {}, {}, {}, false};
        state.report.source_mailbox = std::move(source_mailbox);
        state.report.destination_mailbox = std::move(destination_mailbox);
        state.report.dry_run = options_.dry_run;

        MAILSHIFT_INFO(logger_, "Migrating " << state.report.source_mailbox << " -> " << state.report.destination_mailbox
            << (options_.dry_run ? " (dry run)" : ""));
        co_await migrate(state);

        co_await sessions_.close(std::move(state.source_session));
        co_await sessions_.close(std::move(state.destination_session));

        const mailbox_report& r = state.report;
        if (r.completed())
        {
            MAILSHIFT_INFO(logger_, "Finished " << r.source_mailbox << ": " << r.transferred
                << (r.dry_run ? " would transfer" : " transferred") << ", " << r.already_transferred << " already done, "
                << r.failed_appends << " append failures, " << r.failed_moves << " move failures, "
                << r.skipped_batches << " skipped batches");
        }
        else
        {
            MAILSHIFT_ERROR(logger_, "Aborted " << r.source_mailbox << ": " << r.status
                << " after " << r.transferred << " transfers");
        }
        co_return std::move(state.report);
    }

private:
    struct run_state
    {
        const mailshift::store::endpoint_config& source;
        const mailshift::store::endpoint_config& destination;
        session_ptr source_session;
        session_ptr destination_session;
        mailbox_report report;
        /// A reconnect failed; the mailbox cannot go on.
        bool session_lost;
    };

    awaitable<void> migrate(run_state& state)
    {
        mailbox_report& report = state.report;

        auto src = co_await sessions_.open(state.source);
        if (!src)
        {
            report.status = mailbox_status::source_connect_failed;
            co_return;
        }
        state.source_session = std::move(*src);
        auto dst = co_await sessions_.open(state.destination);
        if (!dst)
        {
            report.status = mailbox_status::destination_connect_failed;
            co_return;
        }
        state.destination_session = std::move(*dst);

        if (!co_await prepare_destination(state))
        {
            MAILSHIFT_ERROR(logger_, "Destination mailbox " << report.destination_mailbox << " unavailable, skipping "
                << report.source_mailbox);
            report.status = mailbox_status::destination_unavailable;
            co_return;
        }

        const std::string archive = archive_mailbox(report.source_mailbox);
        if (!options_.dry_run && !co_await sessions_.ensure_mailbox_exists(*state.source_session, archive))
            MAILSHIFT_WARN(logger_, "Archive mailbox " << archive << " unavailable; moves will fail");

        auto selected = co_await state.source_session->select(report.source_mailbox);
        if (!selected)
        {
            MAILSHIFT_ERROR(logger_, "Cannot select source mailbox " << report.source_mailbox << ": "
                << selected.error().to_string());
            report.status = mailbox_status::source_unavailable;
            co_return;
        }

        auto keys = co_await search(state);
        if (!keys)
        {
            report.status = state.session_lost ? mailbox_status::session_lost : mailbox_status::search_failed;
            co_return;
        }
        report.found = keys->size();
        const std::size_t batch_count = (keys->size() + options_.batch_size - 1) / options_.batch_size;
        MAILSHIFT_INFO(logger_, report.source_mailbox << ": " << keys->size() << " messages in " << batch_count
            << " batches");

        std::size_t processed = 0;
        for (std::size_t b = 0; b < batch_count; ++b)
        {
            const auto first = keys->begin() + static_cast<std::ptrdiff_t>(b * options_.batch_size);
            const auto last = keys->begin() + static_cast<std::ptrdiff_t>(std::min(keys->size(), (b + 1) * options_.batch_size));
            const std::vector<mailshift::store::message_key> batch(first, last);
            ++report.batches;

            co_await transfer_batch(state, batch, archive);
            if (state.session_lost)
            {
                report.status = mailbox_status::session_lost;
                co_return;
            }
            if (report.status != mailbox_status::completed)
                co_return;

            processed += batch.size();
            if (progress_)
                progress_(batch_progress{report.source_mailbox, b + 1, batch_count, processed, keys->size(), report});

            if (b + 1 < batch_count)
                co_await mailshift::detail::sleep_for(options_.batch_delay);
        }
    }

    /// Selects (creating when allowed) the destination mailbox.
    awaitable<bool> prepare_destination(run_state& state)
    {
        const std::string& mailbox = state.report.destination_mailbox;
        if (!options_.dry_run)
            co_return co_await sessions_.ensure_mailbox_selected(*state.destination_session, mailbox);

        auto selected = co_await state.destination_session->select(mailbox);
        if (!selected)
        {
            if (selected.error().is_session_abort())
                co_return false;
            MAILSHIFT_INFO(logger_, "[dry run] destination mailbox " << mailbox << " would be created");
        }
        co_return true;
    }

    /// Search on the source, reconnecting and reselecting before each retry.
    awaitable<result<std::vector<mailshift::store::message_key>>> search(run_state& state)
    {
        auto keys = co_await with_backoff_recovery(options_.search_policy, logger_, "Search " + state.report.source_mailbox,
            [&]() { return state.source_session->search_all(); },
            [&]() { return recover_source(state); });
        if (!keys)
            MAILSHIFT_ERROR(logger_, "Search failed on " << state.report.source_mailbox << ": " << keys.error().to_string());
        co_return std::move(keys);
    }

    awaitable<void> transfer_batch(run_state& state, const std::vector<mailshift::store::message_key>& batch,
        const std::string& archive)
    {
        mailbox_report& report = state.report;

        auto fetched = co_await with_recovery(options_.fetch_policy, logger_, "Fetch of " + std::to_string(batch.size())
            + " messages from " + report.source_mailbox,
            [&]() { return state.source_session->fetch(batch); },
            [&]() { return recover_source(state); });
        if (state.session_lost)
            co_return;
        if (!fetched)
        {
            MAILSHIFT_ERROR(logger_, "Skipping batch of " << batch.size() << " messages from " << report.source_mailbox
                << " (keys " << batch.front() << ".." << batch.back() << "): " << fetched.error().to_string());
            ++report.skipped_batches;
            co_return;
        }

        for (const auto& key : batch)
        {
            auto done = ledger_.is_transferred(report.source_mailbox, key);
            if (!done)
            {
                MAILSHIFT_ERROR(logger_, "Ledger lookup failed: " << done.error().to_string());
                report.status = mailbox_status::ledger_failed;
                co_return;
            }
            if (*done)
            {
                ++report.already_transferred;
                continue;
            }

            const auto found = fetched->find(key);
            if (found == fetched->end())
            {
                MAILSHIFT_DEBUG(logger_, "Message " << key << " of " << report.source_mailbox << " no longer exists");
                ++report.vanished;
                continue;
            }
            const mailshift::store::fetched_message& message = found->second;
            const auto message_id = extract_message_id(message.raw);

            if (options_.dry_run)
            {
                MAILSHIFT_INFO(logger_, "[dry run] would transfer " << report.source_mailbox << "/" << key
                    << " (" << message_id.value_or("no Message-ID") << ")");
                ++report.transferred;
                continue;
            }

            auto appended = co_await with_recovery(options_.append_policy, logger_, "Append of " + report.source_mailbox
                + "/" + key,
                [&]() { return state.destination_session->append(report.destination_mailbox, message); },
                [&]() { return recover_destination(state); });
            if (state.session_lost)
                co_return;
            if (!appended)
            {
                MAILSHIFT_ERROR(logger_, "Append of " << report.source_mailbox << "/" << key
                    << " failed, message left in place: " << appended.error().to_string());
                ++report.failed_appends;
                continue;
            }

            const std::vector<mailshift::store::message_key> move_keys{key};
            auto moved = co_await state.source_session->move(move_keys, archive);
            if (!moved)
            {
                MAILSHIFT_ERROR(logger_, "Failed to move " << report.source_mailbox << "/" << key << " to " << archive
                    << ", not recorded: " << moved.error().to_string());
                ++report.failed_moves;
                if (moved.error().is_session_abort())
                {
                    auto recovered = co_await recover_source(state);
                    if (!recovered)
                        co_return;
                }
                continue;
            }

            mailshift::ledger::transfer_record record;
            record.source_mailbox = report.source_mailbox;
            record.source_key = key;
            record.destination_mailbox = report.destination_mailbox;
            record.message_id = message_id;
            auto recorded = ledger_.record_transfer(record);
            if (!recorded)
            {
                MAILSHIFT_ERROR(logger_, "Ledger write failed for " << report.source_mailbox << "/" << key << ": "
                    << recorded.error().to_string());
                report.status = mailbox_status::ledger_failed;
                co_return;
            }
            ++report.transferred;
            MAILSHIFT_DEBUG(logger_, "Transferred " << report.source_mailbox << "/" << key);
        }
    }

    /// New source session with the source mailbox selected again.
    awaitable<result_void> recover_source(run_state& state)
    {
        auto reopened = co_await sessions_.reopen(std::move(state.source_session), state.source);
        if (!reopened)
        {
            state.session_lost = true;
            co_return fail(std::move(reopened).error());
        }
        state.source_session = std::move(*reopened);
        auto selected = co_await state.source_session->select(state.report.source_mailbox);
        if (!selected)
        {
            MAILSHIFT_ERROR(logger_, "Cannot reselect " << state.report.source_mailbox << ": "
                << selected.error().to_string());
            state.session_lost = true;
            co_return fail(std::move(selected).error());
        }
        co_return ok();
    }

    /// New destination session with the destination mailbox ensured again.
    awaitable<result_void> recover_destination(run_state& state)
    {
        auto reopened = co_await sessions_.reopen(std::move(state.destination_session), state.destination);
        if (!reopened)
        {
            state.session_lost = true;
            co_return fail(std::move(reopened).error());
        }
        state.destination_session = std::move(*reopened);
        if (!co_await sessions_.ensure_mailbox_selected(*state.destination_session, state.report.destination_mailbox))
        {
            state.session_lost = true;
            co_return fail(error_code::invalid_mailbox, "Destination mailbox unavailable after reconnect.");
        }
        co_return ok();
    }

    session_manager& sessions_;
    mailshift::ledger::transfer_ledger& ledger_;
    mailshift::log::logger& logger_;
    pipeline_options options_;
    progress_callback progress_;
};

} // namespace mailshift::migrate
