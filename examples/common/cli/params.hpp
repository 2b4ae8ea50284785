#pragma once

#include <string>
#include <string_view>
#include <ostream>
#include <iostream>
#include <cstdint>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "gemstream/config/defaults.hpp"
#include "lcr/log/logger.hpp"

namespace gemstream::examples::cli {

struct Params {
    std::string symbol{};
    std::string url           = std::string(config::market_data_url);
    bool top_of_book          = true;
    std::string log_level     = "info";
    std::uint64_t max_messages = 0;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL          : " << url << "\n"
           << "  Symbol       : " << symbol << "\n"
           << "  Top of book  : " << (top_of_book ? "true" : "false") << "\n"
           << "  Log Level    : " << log_level << "\n"
           << "  Max messages : " << max_messages << (max_messages == 0 ? " (unlimited)" : "") << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-s,--symbol", params.symbol, "Instrument to stream (e.g. -s BTCUSD)")->required()->check(symbol_validator);
    app.add_option("--url", params.url, "Market data base endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("--top-of-book", params.top_of_book, "Request top-of-book updates only")->default_val(params.top_of_book);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))->default_val(params.log_level);
    app.add_option("--max-messages", params.max_messages, "Stop after N decoded messages (0 = unlimited)")->default_val(params.max_messages);

    app.footer(
        "Streams trades and best bid/offer updates until interrupted.\n"
        "Press Ctrl+C to exit cleanly."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(lcr::log::level_from_string(params.log_level));
    return params;
}

} // namespace gemstream::examples::cli
