/*

ledger_dump.cpp
---------------

Prints the records of a transfer ledger: all of them, those of one source mailbox, or those
carrying a given Message-ID.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <ctime>
#include <iostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "example_util.hpp"
#include <mailshift/ledger/transfer_ledger.hpp>


namespace po = boost::program_options;
using mailshift::ledger::transfer_record;


static std::string format_time(std::int64_t epoch)
{
    const auto t = static_cast<std::time_t>(epoch);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char stamp[32]{};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%SZ", &tm_buf);
    return stamp;
}


int main(int argc, char* argv[])
{
    std::string database;
    std::string mailbox;
    std::string message_id;

    po::options_description desc("Usage: mailshift-ledger --database <file> [options]");
    desc.add_options()
        ("help,h", "show this help")
        ("database,d", po::value<std::string>(&database)->required(), "ledger database file")
        ("mailbox", po::value<std::string>(&mailbox), "only records of this source mailbox")
        ("message-id", po::value<std::string>(&message_id), "only records carrying this Message-ID");
    try
    {
        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help") != 0)
        {
            std::cout << desc << "\n";
            return 0;
        }
        po::notify(vm);
    }
    catch (const po::error& exc)
    {
        std::cerr << exc.what() << "\n" << desc << "\n";
        return 2;
    }

    auto ledger = mailshift::ledger::transfer_ledger::open(database);
    if (!ledger)
    {
        print_error(ledger.error());
        return 1;
    }

    mailshift::result<std::vector<transfer_record>> records;
    if (!message_id.empty())
        records = ledger->find_by_message_id(message_id);
    else if (!mailbox.empty())
        records = ledger->records_for(mailbox);
    else
        records = ledger->all_records();
    if (!records)
    {
        print_error(records.error());
        return 1;
    }

    for (const auto& r : *records)
    {
        std::cout << format_time(r.transferred_at) << '\t' << r.source_mailbox << '\t' << r.source_key << '\t'
                  << r.destination_mailbox.value_or("-") << '\t' << r.message_id.value_or("-") << '\n';
    }
    std::cout << records->size() << " records\n";
    return 0;
}
