#pragma once

#include <iostream>
#include <mailshift/detail/log.hpp>
#include <mailshift/detail/result.hpp>

inline void print_error(const mailshift::error& err)
{
    std::cerr << "Error: " << mailshift::error_code_to_string(err.code()) << " - " << err.message() << "\n";
    if (!err.server_response().empty())
        std::cerr << "Detail: " << err.server_response() << "\n";
}

inline void setup_logging(mailshift::log::logger& logger, bool verbose, bool trace)
{
    logger.set_level(trace ? mailshift::log::level::trace
        : verbose ? mailshift::log::level::debug : mailshift::log::level::info);
    logger.set_trace_enabled(trace);
}
