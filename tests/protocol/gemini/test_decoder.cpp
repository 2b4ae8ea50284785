#include <cassert>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>

#include "gemstream/protocol/gemini/decoder.hpp"
#include "common/test_check.hpp"
#include "common/json_helpers.hpp"

using namespace gemstream::protocol::gemini;

/*
================================================================================
Gemini Market Message Decoder: Unit Tests
================================================================================

Covers the raw text → MarketMessage path:
  • Envelope fields: required (events, eventId, socket_sequence) vs nullable
    (timestamp, timestampms)
  • Per-event dispatch on "type" with optional-field defaults
  • Unknown event types and sides kept as sentinels, never errors
  • All-or-nothing: any rejected event rejects the whole message
================================================================================
*/

// ============================================================================
// SUCCESS CASES
// ============================================================================

void test_decode_change_with_all_fields() {
    std::cout << "[TEST] Decode change event with all fields..." << std::endl;

    constexpr std::string_view json = R"json(
    {
        "type": "update",
        "eventId": 5375461993,
        "timestamp": 1547760288,
        "timestampms": 1547760288001,
        "socket_sequence": 15,
        "events": [
            { "type": "change", "side": "bid", "price": "3641.00",
              "remaining": "0.0", "delta": "-0.0062", "reason": "trade" }
        ]
    }
    )json";

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);

    TEST_CHECK(msg.event_id == 5375461993ULL);
    TEST_CHECK(msg.socket_sequence == 15);
    TEST_CHECK(msg.timestamp.has_value() && *msg.timestamp == 1547760288ULL);
    TEST_CHECK(msg.timestampms.has_value() && *msg.timestampms == 1547760288001ULL);
    TEST_CHECK(msg.events.size() == 1);

    const auto* q = std::get_if<schema::Quote>(&msg.events[0]);
    TEST_CHECK(q != nullptr);
    TEST_CHECK(q->price == 3641.0);
    TEST_CHECK(q->remaining == 0.0);
    TEST_CHECK(q->side == MarketSide::Bid);
    TEST_CHECK(q->reason == "trade");
    TEST_CHECK(q->delta.has_value() && *q->delta == -0.0062);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_change_defaults() {
    std::cout << "[TEST] Decode change event with only price..." << std::endl;

    constexpr std::string_view json = R"json(
    {"eventId": 1, "socket_sequence": 0, "events": [ {"type": "change", "price": "10.5"} ]}
    )json";

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);
    TEST_CHECK(msg.events.size() == 1);

    const auto* q = std::get_if<schema::Quote>(&msg.events[0]);
    TEST_CHECK(q != nullptr);
    TEST_CHECK(q->price == 10.5);
    TEST_CHECK(q->remaining == 0.0);
    TEST_CHECK(q->reason.empty());
    TEST_CHECK(q->side == MarketSide::Unknown);
    TEST_CHECK(!q->delta.has_value());

    // Both timestamps absent together is accepted
    TEST_CHECK(!msg.timestamp.has_value());
    TEST_CHECK(!msg.timestampms.has_value());

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_trade() {
    std::cout << "[TEST] Decode trade event..." << std::endl;

    const std::string json = json::gemini::update(7, 3, json::gemini::trade("100.50", "2.0", "ask"));

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);
    TEST_CHECK(msg.events.size() == 1);
    TEST_CHECK(schema::kind_of(msg.events[0]) == MessageKind::Trade);

    const auto* t = std::get_if<schema::Trade>(&msg.events[0]);
    TEST_CHECK(t != nullptr);
    TEST_CHECK(t->price == 100.5);
    TEST_CHECK(t->amount == 2.0);
    TEST_CHECK(t->maker_side == MarketSide::Ask);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_unknown_event_type() {
    std::cout << "[TEST] Unknown event type is kept as placeholder..." << std::endl;

    // Only "type" and "price" are read from an unknown type
    constexpr std::string_view json = R"json(
    {"eventId": 2, "socket_sequence": 1, "events": [
        {"type": "auction_open", "price": "7.5", "auction_open_ms": 1},
        {"type": "change", "side": "ask", "price": "5", "remaining": "1"}
    ]}
    )json";

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);
    TEST_CHECK(msg.events.size() == 2);
    TEST_CHECK(schema::kind_of(msg.events[0]) == MessageKind::Unknown);
    TEST_CHECK(std::holds_alternative<schema::UnknownEvent>(msg.events[0]));
    TEST_CHECK(schema::kind_of(msg.events[1]) == MessageKind::Change);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_unrecognized_side_is_unknown() {
    std::cout << "[TEST] Unrecognized side decodes to Unknown..." << std::endl;

    const std::string json = json::gemini::update(3, 2, json::gemini::change("BID", "1", "1"));

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);
    const auto* q = std::get_if<schema::Quote>(&msg.events[0]);
    TEST_CHECK(q != nullptr);
    TEST_CHECK(q->side == MarketSide::Unknown);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_empty_events() {
    std::cout << "[TEST] Empty events array is valid..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json::gemini::update(4, 5, ""), msg) == parser::Result::Parsed);
    TEST_CHECK(msg.events.empty());
    TEST_CHECK(msg.socket_sequence == 5);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_preserves_wire_order() {
    std::cout << "[TEST] Events keep wire order..." << std::endl;

    const std::string events =
        json::gemini::trade("1", "1", "bid") + "," +
        json::gemini::change("bid", "2", "1") + "," +
        json::gemini::change("ask", "3", "1");

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json::gemini::update(5, 6, events), msg) == parser::Result::Parsed);
    TEST_CHECK(msg.events.size() == 3);
    TEST_CHECK(schema::kind_of(msg.events[0]) == MessageKind::Trade);
    TEST_CHECK(std::get<schema::Quote>(msg.events[1]).price == 2.0);
    TEST_CHECK(std::get<schema::Quote>(msg.events[2]).price == 3.0);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decode_null_timestamps() {
    std::cout << "[TEST] Null timestamps decode as absent..." << std::endl;

    constexpr std::string_view json = R"json(
    {"eventId": 9, "timestamp": null, "timestampms": 1700000000000, "socket_sequence": 2, "events": []}
    )json";

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);
    TEST_CHECK(!msg.timestamp.has_value());
    TEST_CHECK(msg.timestampms.has_value() && *msg.timestampms == 1700000000000ULL);

    std::cout << "[TEST] OK" << std::endl;
}

// ============================================================================
// FAILURE CASES
// ============================================================================

void test_reject_invalid_json() {
    std::cout << "[TEST] Reject invalid JSON..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    auto r = decoder.decode(R"({"eventId": 1, "events": [)", msg);
    TEST_CHECK(r == parser::Result::InvalidJson);
    TEST_CHECK(parser::is_malformed_message(r));
    TEST_CHECK(msg.events.empty());

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_missing_events() {
    std::cout << "[TEST] Reject message without events..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    auto r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0})", msg);
    TEST_CHECK(r == parser::Result::InvalidSchema);
    TEST_CHECK(parser::is_malformed_message(r));

    r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": {}})", msg);
    TEST_CHECK(r == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_missing_envelope_fields() {
    std::cout << "[TEST] Reject missing eventId / socket_sequence..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(R"({"socket_sequence": 0, "events": []})", msg) == parser::Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"eventId": "1", "socket_sequence": 0, "events": []})", msg) == parser::Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"eventId": 1, "events": []})", msg) == parser::Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"({"eventId": 1, "socket_sequence": 4294967296, "events": []})", msg) == parser::Result::InvalidSchema);
    TEST_CHECK(decoder.decode(R"([1, 2, 3])", msg) == parser::Result::InvalidSchema);

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_bad_price() {
    std::cout << "[TEST] Reject change event with non-decimal price..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;

    auto r = decoder.decode(json::gemini::update(1, 0, json::gemini::change("bid", "abc", "1")), msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);
    TEST_CHECK(parser::is_malformed_event_field(r));

    // A number instead of a decimal string is rejected too
    r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"change","price":1.5}]})", msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);

    // Missing price
    r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"change","side":"bid"}]})", msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_unknown_event_without_price() {
    std::cout << "[TEST] Reject unknown event type with missing or bad price..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;

    auto r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"liquidation"}]})", msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);
    TEST_CHECK(parser::is_malformed_event_field(r));

    r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"liquidation","price":"x"}]})", msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);

    // Rejects the whole message, valid siblings included
    r = decoder.decode(json::gemini::update(1, 0,
        json::gemini::change("bid", "1", "1") + R"(,{"type":"auction_open"})"), msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);

    // With a valid price the same type is accepted as a placeholder
    r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"liquidation","price":"3"}]})", msg);
    TEST_CHECK(r == parser::Result::Parsed);
    TEST_CHECK(std::holds_alternative<schema::UnknownEvent>(msg.events[0]));

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_trade_without_amount() {
    std::cout << "[TEST] Reject trade event without amount..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    auto r = decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"trade","price":"1"}]})", msg);
    TEST_CHECK(r == parser::Result::InvalidEventField);

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_bad_optional_decimal() {
    std::cout << "[TEST] Reject unparseable remaining / delta..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json::gemini::update(1, 0, json::gemini::change("bid", "1", "1.2.3")), msg) == parser::Result::InvalidEventField);
    TEST_CHECK(decoder.decode(
        R"({"eventId": 1, "socket_sequence": 0, "events": [{"type":"change","price":"1","delta":""}]})", msg) == parser::Result::InvalidEventField);

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_event_without_type() {
    std::cout << "[TEST] Reject event without type or not an object..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [{"price":"1"}]})", msg) == parser::Result::InvalidEventField);
    TEST_CHECK(decoder.decode(R"({"eventId": 1, "socket_sequence": 0, "events": [42]})", msg) == parser::Result::InvalidEventField);

    std::cout << "[TEST] OK" << std::endl;
}

void test_reject_is_all_or_nothing() {
    std::cout << "[TEST] One bad event rejects the whole batch..." << std::endl;

    const std::string events =
        json::gemini::change("bid", "1", "1") + "," +
        json::gemini::change("ask", "oops", "1");

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode(json::gemini::update(11, 1, events), msg) == parser::Result::InvalidEventField);
    TEST_CHECK(msg.events.empty());
    TEST_CHECK(msg.event_id == 0);

    std::cout << "[TEST] OK" << std::endl;
}

void test_decoder_reuse_after_failure() {
    std::cout << "[TEST] Decoder is stateless across calls..." << std::endl;

    Decoder decoder;
    schema::MarketMessage msg;
    TEST_CHECK(decoder.decode("not json", msg) == parser::Result::InvalidJson);

    const std::string json = json::gemini::update(12, 3, json::gemini::change("ask", "2", "3"));
    TEST_CHECK(decoder.decode(json, msg) == parser::Result::Parsed);
    TEST_CHECK(msg.event_id == 12);

    schema::MarketMessage again;
    TEST_CHECK(decoder.decode(json, again) == parser::Result::Parsed);
    TEST_CHECK(again.events.size() == msg.events.size());
    TEST_CHECK(std::get<schema::Quote>(again.events[0]).price == std::get<schema::Quote>(msg.events[0]).price);

    std::cout << "[TEST] OK" << std::endl;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    test_decode_change_with_all_fields();
    test_decode_change_defaults();
    test_decode_trade();
    test_decode_unknown_event_type();
    test_decode_unrecognized_side_is_unknown();
    test_decode_empty_events();
    test_decode_preserves_wire_order();
    test_decode_null_timestamps();

    test_reject_invalid_json();
    test_reject_missing_events();
    test_reject_missing_envelope_fields();
    test_reject_bad_price();
    test_reject_unknown_event_without_price();
    test_reject_trade_without_amount();
    test_reject_bad_optional_decimal();
    test_reject_event_without_type();
    test_reject_is_all_or_nothing();
    test_decoder_reuse_after_failure();

    std::cout << "\n[GEMSTREAM] Decoder tests passed!" << std::endl;
    return 0;
}
