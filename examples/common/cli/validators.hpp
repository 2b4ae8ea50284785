#pragma once

#include <string>
#include <cctype>

#include <CLI/CLI.hpp>


namespace gemstream::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator (TLS transport only)
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with wss:// (plain ws:// is not supported)";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Symbol validator (Gemini symbols are plain tickers: BTCUSD)
// -------------------------------------------------------------
inline auto symbol_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty()) {
            return "Symbol must not be empty";
        }
        for (unsigned char c : value) {
            if (!std::isalnum(c)) {
                return "Symbol must be alphanumeric (e.g. BTCUSD)";
            }
        }
        return {};
    },
    "Trading symbol validator"
);

} // namespace gemstream::examples::cli
