/*

transfer_ledger.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Durable record of migrated messages, stored in a SQLite database.

*/


#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <sqlite3.h>
#include <mailshift/detail/result.hpp>

namespace mailshift::ledger
{

/// One migrated message; (source_mailbox, source_key) is unique in the ledger.
struct transfer_record
{
    std::string source_mailbox;
    std::string source_key;
    std::optional<std::string> destination_mailbox;
    std::optional<std::string> message_id;
    /// Seconds since the epoch, stamped by the ledger when the record is written.
    std::int64_t transferred_at = 0;
};

namespace detail
{
    struct db_closer
    {
        void operator()(sqlite3* db) const noexcept { sqlite3_close_v2(db); }
    };

    struct stmt_finalizer
    {
        void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
    };

    using db_ptr = std::unique_ptr<sqlite3, db_closer>;
    using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_finalizer>;

    inline constexpr const char* SCHEMA =
        "CREATE TABLE IF NOT EXISTS transfers ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " src_mailbox TEXT NOT NULL,"
        " src_uid TEXT NOT NULL,"
        " dst_mailbox TEXT,"
        " message_id TEXT,"
        " transferred_at INTEGER NOT NULL,"
        " UNIQUE(src_mailbox, src_uid));"
        "CREATE INDEX IF NOT EXISTS idx_message_id ON transfers(message_id);";

    inline constexpr const char* SELECT_COLUMNS =
        "SELECT src_mailbox, src_uid, dst_mailbox, message_id, transferred_at FROM transfers";

    inline std::optional<std::string> column_text(sqlite3_stmt* stmt, int col)
    {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
            return std::nullopt;
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
        const int size = sqlite3_column_bytes(stmt, col);
        return std::string(text, static_cast<std::size_t>(size));
    }
} // namespace detail

/**
Transfer ledger.

Writes are durable before record_transfer() returns (WAL journal, synchronous FULL).
Opening an existing ledger keeps its records. Not thread safe; one writer per database.
**/
class transfer_ledger
{
public:
    /// Busy timeout applied to concurrent readers of the same file.
    static constexpr int BUSY_TIMEOUT_MS = 5000;

    /**
    Opening or creating the ledger.

    @param path Database file, or `:memory:` for a private in-memory ledger.
    @return     The ledger, or `ledger_open_failed`.
    **/
    [[nodiscard]] static result<transfer_ledger> open(const std::string& path)
    {
        sqlite3* raw = nullptr;
        const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        detail::db_ptr db(raw);
        if (rc != SQLITE_OK)
        {
            std::string reason = db ? sqlite3_errmsg(db.get()) : sqlite3_errstr(rc);
            return fail<transfer_ledger>(error_code::ledger_open_failed, "Cannot open ledger " + path + ".", reason);
        }
        sqlite3_busy_timeout(db.get(), BUSY_TIMEOUT_MS);

        transfer_ledger ledger(std::move(db), path);
        auto init = ledger.exec("PRAGMA journal_mode=WAL;"
                                "PRAGMA synchronous=FULL;", error_code::ledger_open_failed);
        if (!init)
            return fail<transfer_ledger>(std::move(init).error());
        init = ledger.exec(detail::SCHEMA, error_code::ledger_open_failed);
        if (!init)
            return fail<transfer_ledger>(std::move(init).error());
        return ok(std::move(ledger));
    }

    transfer_ledger(transfer_ledger&&) noexcept = default;
    transfer_ledger& operator=(transfer_ledger&&) noexcept = default;

    [[nodiscard]] const std::string& path() const noexcept
    {
        return path_;
    }

    /// True iff a record for (mailbox, key) exists.
    [[nodiscard]] result<bool> is_transferred(std::string_view mailbox, std::string_view key)
    {
        detail::stmt_ptr stmt;
        MAILSHIFT_TRY_ASSIGN(stmt, prepare("SELECT 1 FROM transfers WHERE src_mailbox = ?1 AND src_uid = ?2 LIMIT 1;",
            error_code::ledger_query_failed));
        bind_text(stmt.get(), 1, mailbox);
        bind_text(stmt.get(), 2, key);

        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW)
            return ok(true);
        if (rc == SQLITE_DONE)
            return ok(false);
        return fail<bool>(error_code::ledger_query_failed, "Ledger lookup failed.", sqlite3_errmsg(db_.get()));
    }

    /**
    Recording a migrated message; an existing record with the same key pair is replaced.

    @param record Record to store; its `transferred_at` is ignored and set to the current time.
    @return       Success once the record is durable, or `ledger_write_failed`.
    **/
    [[nodiscard]] result_void record_transfer(const transfer_record& record)
    {
        detail::stmt_ptr stmt;
        MAILSHIFT_TRY_ASSIGN(stmt, prepare(
            "INSERT OR REPLACE INTO transfers (src_mailbox, src_uid, dst_mailbox, message_id, transferred_at)"
            " VALUES (?1, ?2, ?3, ?4, ?5);", error_code::ledger_write_failed));
        bind_text(stmt.get(), 1, record.source_mailbox);
        bind_text(stmt.get(), 2, record.source_key);
        bind_optional(stmt.get(), 3, record.destination_mailbox);
        bind_optional(stmt.get(), 4, record.message_id);
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(now));

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
            return fail(error_code::ledger_write_failed, "Ledger write failed.", sqlite3_errmsg(db_.get()));
        return ok();
    }

    /// Records carrying the given Message-ID; an auxiliary lookup, several records may match.
    [[nodiscard]] result<std::vector<transfer_record>> find_by_message_id(std::string_view message_id)
    {
        return query_records(std::string(detail::SELECT_COLUMNS) + " WHERE message_id = ?1 ORDER BY id;", message_id);
    }

    [[nodiscard]] result<std::vector<transfer_record>> records_for(std::string_view mailbox)
    {
        return query_records(std::string(detail::SELECT_COLUMNS) + " WHERE src_mailbox = ?1 ORDER BY id;", mailbox);
    }

    [[nodiscard]] result<std::vector<transfer_record>> all_records()
    {
        return query_records(std::string(detail::SELECT_COLUMNS) + " ORDER BY id;", std::nullopt);
    }

    [[nodiscard]] result<std::int64_t> count()
    {
        detail::stmt_ptr stmt;
        MAILSHIFT_TRY_ASSIGN(stmt, prepare("SELECT COUNT(*) FROM transfers;", error_code::ledger_query_failed));
        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
            return fail<std::int64_t>(error_code::ledger_query_failed, "Ledger count failed.", sqlite3_errmsg(db_.get()));
        return ok(static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 0)));
    }

private:
    transfer_ledger(detail::db_ptr db, std::string path)
        : db_(std::move(db)), path_(std::move(path))
    {
    }

    result_void exec(const char* sql, error_code code)
    {
        char* message = nullptr;
        if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &message) != SQLITE_OK)
        {
            std::string reason = message != nullptr ? message : sqlite3_errmsg(db_.get());
            sqlite3_free(message);
            return fail(code, "Ledger initialization failed.", std::move(reason));
        }
        return ok();
    }

    result<detail::stmt_ptr> prepare(const std::string& sql, error_code code)
    {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_.get(), sql.c_str(), static_cast<int>(sql.size()) + 1, &raw, nullptr) != SQLITE_OK)
        {
            sqlite3_finalize(raw);
            return fail<detail::stmt_ptr>(code, "Ledger statement failed.", sqlite3_errmsg(db_.get()));
        }
        return ok(detail::stmt_ptr(raw));
    }

    static void bind_text(sqlite3_stmt* stmt, int index, std::string_view value)
    {
        sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    static void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value)
    {
        if (value.has_value())
            bind_text(stmt, index, *value);
        else
            sqlite3_bind_null(stmt, index);
    }

    result<std::vector<transfer_record>> query_records(const std::string& sql, std::optional<std::string_view> param)
    {
        detail::stmt_ptr stmt;
        MAILSHIFT_TRY_ASSIGN(stmt, prepare(sql, error_code::ledger_query_failed));
        if (param.has_value())
            bind_text(stmt.get(), 1, *param);

        std::vector<transfer_record> records;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
        {
            transfer_record record;
            record.source_mailbox = detail::column_text(stmt.get(), 0).value_or(std::string{});
            record.source_key = detail::column_text(stmt.get(), 1).value_or(std::string{});
            record.destination_mailbox = detail::column_text(stmt.get(), 2);
            record.message_id = detail::column_text(stmt.get(), 3);
            record.transferred_at = static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 4));
            records.push_back(std::move(record));
        }
        if (rc != SQLITE_DONE)
            return fail<std::vector<transfer_record>>(error_code::ledger_query_failed, "Ledger query failed.",
                sqlite3_errmsg(db_.get()));
        return ok(std::move(records));
    }

    detail::db_ptr db_;
    std::string path_;
};

} // namespace mailshift::ledger
