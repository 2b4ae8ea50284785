#pragma once

#include <string>
#include <string_view>


namespace gemstream::protocol::gemini {

// Build the per-instrument market data URL:
//
//   <base>/<symbol>[?top_of_book=true]
//
// A trailing '/' on the base is tolerated.
[[nodiscard]]
inline std::string make_market_data_url(std::string_view base, std::string_view symbol, bool top_of_book) {
    std::string url(base);
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += '/';
    url += symbol;
    if (top_of_book) {
        url += "?top_of_book=true";
    }
    return url;
}

} // namespace gemstream::protocol::gemini
