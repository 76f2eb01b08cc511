#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "infra/codec/WireCodec.h"

using infra::codec::DecodeError;
using infra::codec::WireCodec;

namespace {

bool expectError(const std::string& frame, DecodeError expected) {
    const auto decoded = WireCodec::decode(frame);
    if (!decoded.failed() || decoded.error != expected) {
        std::cerr << "Frame " << frame << " expected " << infra::codec::toString(expected) << " got "
                  << infra::codec::toString(decoded.error) << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    {
        const auto decoded = WireCodec::decode(
            R"({"v":1,"type":"entity_update","id":"BTCUSDT","seq":42,"ts":1700000000000,)"
            R"("fields":{"last":64123.5,"volume":9007199254740993,"halted":false,"venue":"X"}})");
        if (decoded.failed()) {
            std::cerr << "entity_update failed to decode: " << decoded.detail << "\n";
            return 1;
        }
        const auto* update = std::get_if<domain::EntityUpdate>(&decoded.value);
        if (!update || update->id != "BTCUSDT" || !update->wireSeq || *update->wireSeq != 42
            || update->timestampMs != 1700000000000LL || update->replace) {
            std::cerr << "entity_update envelope decoded incorrectly\n";
            return 1;
        }
        const auto* volume = std::get_if<std::int64_t>(&update->fields.at("volume"));
        if (!volume || *volume != 9007199254740993LL) {
            std::cerr << "Integer field lost precision\n";
            return 1;
        }
        if (std::get<double>(update->fields.at("last")) != 64123.5 || std::get<bool>(update->fields.at("halted"))
            || std::get<std::string>(update->fields.at("venue")) != "X") {
            std::cerr << "Scalar fields decoded incorrectly\n";
            return 1;
        }
    }

    {
        const auto removal = WireCodec::decode(R"({"v":1,"type":"entity_remove","id":"ETH"})");
        const auto heartbeat = WireCodec::decode(R"({"v":1,"type":"heartbeat","ts":5})");
        const auto notice = WireCodec::decode(R"({"v":1,"type":"error","code":429,"message":"slow down"})");
        if (removal.failed() || std::get<domain::EntityRemoval>(removal.value).id != "ETH") {
            std::cerr << "entity_remove failed to decode\n";
            return 1;
        }
        if (heartbeat.failed() || std::get<domain::Heartbeat>(heartbeat.value).timestampMs != 5) {
            std::cerr << "heartbeat failed to decode\n";
            return 1;
        }
        if (notice.failed() || !(std::get<domain::ErrorNotice>(notice.value) == domain::ErrorNotice{429, "slow down"})) {
            std::cerr << "error notice failed to decode\n";
            return 1;
        }
    }

    if (!expectError("not json at all", DecodeError::Malformed)
        || !expectError("[1,2,3]", DecodeError::Malformed)
        || !expectError(R"({"type":"heartbeat"})", DecodeError::Malformed)
        || !expectError(R"({"v":"1","type":"heartbeat"})", DecodeError::Malformed)
        || !expectError(R"({"v":1})", DecodeError::Malformed)
        || !expectError(R"({"v":1,"type":"entity_update","fields":{}})", DecodeError::Malformed)
        || !expectError(R"({"v":1,"type":"entity_update","id":"","fields":{}})", DecodeError::Malformed)
        || !expectError(R"({"v":1,"type":"entity_update","id":"a","fields":{"x":[1]}})", DecodeError::Malformed)
        || !expectError(R"({"v":1,"type":"entity_update","id":"a","fields":{},"seq":-1})", DecodeError::Malformed)
        || !expectError(R"({"v":1,"type":"error","message":"no code"})", DecodeError::Malformed)) {
        return 1;
    }

    if (!expectError(R"({"v":2,"type":"heartbeat"})", DecodeError::SchemaMismatch)
        || !expectError(R"({"v":0,"type":"heartbeat"})", DecodeError::SchemaMismatch)) {
        return 1;
    }

    if (!expectError(R"({"v":1,"type":"order_book","id":"a"})", DecodeError::UnknownShape)) {
        return 1;
    }

    {
        const std::string frame = WireCodec::encode(domain::OutboundCommand{domain::Subscribe{{"BTC", "ETH"}}});
        const auto decoded = WireCodec::decodeCommand(frame);
        if (decoded.failed() || !(std::get<domain::Subscribe>(decoded.value) == domain::Subscribe{{"BTC", "ETH"}})) {
            std::cerr << "subscribe command did not survive the codec: " << frame << "\n";
            return 1;
        }
        if (frame.find("\"op\":\"subscribe\"") == std::string::npos || frame.find("\"v\":1") == std::string::npos) {
            std::cerr << "subscribe frame missing op or version: " << frame << "\n";
            return 1;
        }
    }

    {
        const auto hello = WireCodec::decodeCommand(WireCodec::encode(domain::OutboundCommand{domain::Hello{"desk-7"}}));
        if (hello.failed() || std::get<domain::Hello>(hello.value).stationId != "desk-7") {
            std::cerr << "hello command did not survive the codec\n";
            return 1;
        }
        if (WireCodec::decodeCommand(R"({"v":1,"op":"teleport"})").error != DecodeError::UnknownShape) {
            std::cerr << "unknown op must be UnknownShape\n";
            return 1;
        }
    }

    {
        domain::EntityUpdate update;
        update.id = "a";
        update.fields["n"] = std::int64_t{-3};
        update.replace = true;
        const auto decoded = WireCodec::decode(WireCodec::encode(domain::InboundEvent{update}));
        if (decoded.failed() || !(std::get<domain::EntityUpdate>(decoded.value) == update)) {
            std::cerr << "encoded entity_update did not decode to the same event\n";
            return 1;
        }
    }

    {
        bool threw = false;
        try {
            WireCodec::encode(domain::InboundEvent{domain::ConnectionStatus{}});
        }
        catch (const std::invalid_argument&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Encoding a connection status must throw\n";
            return 1;
        }
    }

    return 0;
}
