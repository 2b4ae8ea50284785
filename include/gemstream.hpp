#pragma once

// Umbrella header: everything needed to stream Gemini market data.

#include "gemstream/config/defaults.hpp"
#include "gemstream/protocol/gemini/endpoint.hpp"
#include "gemstream/protocol/gemini/decoder.hpp"
#include "gemstream/protocol/gemini/router.hpp"
#include "gemstream/bbo/aggregator.hpp"
#include "gemstream/trade/report.hpp"
#include "gemstream/session.hpp"
#include "gemstream/transport/beast/websocket.hpp"
