#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "gemstream/transport/error.hpp"


namespace gemstream::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string target;   // path + query, always starts with '/'
    };


    // ---------------------------------------------------------------------
    // Minimal ws:// / wss:// URL parser. Accepts the URLs exchanges publish
    // and rejects malformed inputs without attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://api.gemini.com/v1/marketdata/BTCUSD?top_of_book=true
    //   ws://localhost:8080/stream
    //   wss://example.com?x=1          (target becomes "/?x=1")
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port]
        std::size_t end = url.find_first_of("/?", pos);
        std::string hostport = (end == std::string::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        std::size_t colon = hostport.find(':');
        if (colon != std::string::npos) {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        } else {
            out.host = hostport;
            out.port = out.secure ? "443" : "80";
        }
        // 4) Target (default "/" if missing)
        if (end == std::string::npos) {
            out.target = "/";
        } else if (url[end] == '?') {
            out.target = "/" + url.substr(end);
        } else {
            out.target = url.substr(end);
        }

        // Validate host / port
        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }

        return Error::None;
    }

} // namespace gemstream::transport
