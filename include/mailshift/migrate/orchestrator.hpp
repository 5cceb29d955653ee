/*

orchestrator.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <mailshift/detail/asio_decl.hpp>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/result.hpp>
#include <mailshift/migrate/pipeline.hpp>
#include <mailshift/migrate/session_manager.hpp>
#include <mailshift/store/endpoint.hpp>

namespace mailshift::migrate
{

using mailbox_mapping = std::map<std::string, std::string>;

/// Mapped destination name, or the source name when unmapped.
[[nodiscard]] inline std::string resolve_destination(const std::string& source_mailbox,
    const std::optional<mailbox_mapping>& mapping)
{
    if (mapping.has_value())
    {
        const auto it = mapping->find(source_mailbox);
        if (it != mapping->end())
            return it->second;
    }
    return source_mailbox;
}

struct migration_summary
{
    std::vector<mailbox_report> reports;
    /// Source mailboxes never handed to the pipeline, excluded or archives.
    std::vector<std::string> skipped;

    [[nodiscard]] std::size_t aborted() const noexcept
    {
        std::size_t n = 0;
        for (const auto& r : reports)
            if (!r.completed())
                ++n;
        return n;
    }

    [[nodiscard]] std::size_t transferred() const noexcept
    {
        std::size_t n = 0;
        for (const auto& r : reports)
            n += r.transferred;
        return n;
    }
};

/**
Runs the pipeline once per source mailbox, in listing order.

Only the listing itself can fail the run; a mailbox that aborts is reported and the next one is
attempted.
**/
class orchestrator
{
public:
    orchestrator(session_manager& sessions, batch_pipeline& pipeline, mailshift::log::logger& logger)
        : sessions_(sessions), pipeline_(pipeline), logger_(logger)
    {
    }

    /**
    Migrating every mailbox of the source account.

    @param source      Source endpoint.
    @param destination Destination endpoint.
    @param exclude     Source mailbox names to leave alone.
    @param mapping     Source to destination names; identity when absent.
    @return            Per-mailbox reports, or the listing failure.
    **/
    awaitable<result<migration_summary>> run(const mailshift::store::endpoint_config& source,
        const mailshift::store::endpoint_config& destination, const std::set<std::string>& exclude,
        const std::optional<mailbox_mapping>& mapping)
    {
        std::vector<std::string> mailboxes;
        MAILSHIFT_CO_TRY_ASSIGN(mailboxes, co_await list_source(source));
        MAILSHIFT_INFO(logger_, "Found " << mailboxes.size() << " mailboxes on " << source.describe());

        const std::string& archive_prefix = pipeline_.options().archive_prefix;
        migration_summary summary;
        for (const auto& mailbox : mailboxes)
        {
            if (exclude.contains(mailbox))
            {
                MAILSHIFT_INFO(logger_, "Skipping excluded mailbox " << mailbox);
                summary.skipped.push_back(mailbox);
                continue;
            }
            if (!archive_prefix.empty() && mailbox.starts_with(archive_prefix))
            {
                MAILSHIFT_INFO(logger_, "Skipping archive mailbox " << mailbox);
                summary.skipped.push_back(mailbox);
                continue;
            }

            summary.reports.push_back(co_await pipeline_.run(source, destination, mailbox,
                resolve_destination(mailbox, mapping)));
        }

        MAILSHIFT_INFO(logger_, "Migration finished: " << summary.reports.size() << " mailboxes, "
            << summary.aborted() << " aborted, " << summary.transferred() << " messages"
            << (pipeline_.options().dry_run ? " would be transferred" : " transferred"));
        co_return std::move(summary);
    }

private:
    awaitable<result<std::vector<std::string>>> list_source(const mailshift::store::endpoint_config& source)
    {
        session_ptr session;
        MAILSHIFT_CO_TRY_ASSIGN(session, co_await sessions_.open(source));
        auto names = co_await sessions_.list_mailboxes(*session);
        co_await sessions_.close(std::move(session));
        co_return std::move(names);
    }

    session_manager& sessions_;
    batch_pipeline& pipeline_;
    mailshift::log::logger& logger_;
};

} // namespace mailshift::migrate
