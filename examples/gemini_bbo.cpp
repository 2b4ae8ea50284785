#include <atomic>
#include <csignal>
#include <chrono>
#include <iostream>
#include <thread>

#include "gemstream.hpp"
#include "common/cli/params.hpp"

using namespace gemstream;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::configure(argc, argv,
        "gemstream - Gemini Market Data Example\n"
        "Streams trades and the best bid/offer for one instrument from the Gemini v1 market data API.\n"
    );
    params.dump("=== Runtime Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    Session<transport::beast::WebSocket> session;

    session.on_trade([](const trade::TradeReport& report) {
        std::cout << report << std::endl;
    });

    session.on_bbo([](const bbo::BestBidOffer& bbo) {
        std::cout << bbo << std::endl;
    });

    const auto url = protocol::gemini::make_market_data_url(params.url, params.symbol, params.top_of_book);
    if (!session.connect(url)) {
        GS_FATAL("Unable to connect to " << url);
        return EXIT_FAILURE;
    }

    // Frames are processed on the transport thread; this loop drives liveness and reconnects
    while (running.load()) {
        session.poll();
        if (params.max_messages != 0 &&
            session.telemetry().messages_decoded.load(std::memory_order_relaxed) >= params.max_messages) {
            GS_INFO("Reached " << params.max_messages << " decoded messages, stopping.");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    session.close();

    std::cout << session.telemetry() << std::endl;
    std::cout << "[SUMMARY] Final " << session.bbo() << std::endl;
    return EXIT_SUCCESS;
}
