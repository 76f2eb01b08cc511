#include "infra/codec/WireCodec.h"

#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <boost/json.hpp>

namespace infra::codec {
namespace {

namespace json = boost::json;

template <typename T>
Decoded<T> fail(DecodeError error, std::string detail) {
    Decoded<T> result;
    result.ok = false;
    result.error = error;
    result.detail = std::move(detail);
    return result;
}

template <typename T>
Decoded<T> success(T value) {
    Decoded<T> result;
    result.value = std::move(value);
    return result;
}

// Parses the frame and validates the envelope shared by events and commands.
// On success `root` points into `doc`.
template <typename T>
bool parseEnvelope(std::string_view raw, json::value& doc, const json::object*& root, Decoded<T>& failure) {
    json::error_code ec;
    doc = json::parse(json::string_view(raw.data(), raw.size()), ec);
    if (ec) {
        failure = fail<T>(DecodeError::Malformed, "invalid JSON: " + ec.message());
        return false;
    }
    if (!doc.is_object()) {
        failure = fail<T>(DecodeError::Malformed, "frame is not a JSON object");
        return false;
    }
    root = &doc.as_object();

    const json::value* version = root->if_contains("v");
    if (version == nullptr) {
        failure = fail<T>(DecodeError::Malformed, "missing schema version");
        return false;
    }
    if (version->is_int64()) {
        if (version->as_int64() != WireCodec::kSchemaVersion) {
            failure = fail<T>(DecodeError::SchemaMismatch,
                              "unsupported schema version " + std::to_string(version->as_int64()));
            return false;
        }
    }
    else if (version->is_uint64()) {
        failure = fail<T>(DecodeError::SchemaMismatch,
                          "unsupported schema version " + std::to_string(version->as_uint64()));
        return false;
    }
    else {
        failure = fail<T>(DecodeError::Malformed, "schema version is not an integer");
        return false;
    }
    return true;
}

bool readString(const json::object& obj, const char* key, std::string& out) {
    const json::value* value = obj.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return false;
    }
    const auto& str = value->as_string();
    out.assign(str.data(), str.size());
    return true;
}

// Absent is fine; present but not a non-negative integer is not.
bool readOptionalSeq(const json::object& obj, std::optional<std::uint64_t>& out) {
    const json::value* value = obj.if_contains("seq");
    if (value == nullptr) {
        return true;
    }
    if (value->is_uint64()) {
        out = value->as_uint64();
        return true;
    }
    if (value->is_int64() && value->as_int64() >= 0) {
        out = static_cast<std::uint64_t>(value->as_int64());
        return true;
    }
    return false;
}

bool readOptionalTimestamp(const json::object& obj, domain::TimestampMs& out) {
    const json::value* value = obj.if_contains("ts");
    if (value == nullptr) {
        return true;
    }
    if (!value->is_int64()) {
        return false;
    }
    out = static_cast<domain::TimestampMs>(value->as_int64());
    return true;
}

bool readField(const json::value& value, domain::FieldValue& out) {
    switch (value.kind()) {
    case json::kind::double_:
        out = value.get_double();
        return true;
    case json::kind::int64:
        out = static_cast<std::int64_t>(value.get_int64());
        return true;
    case json::kind::uint64:
        // boost::json only yields uint64 above the int64 range
        if (value.get_uint64() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return false;
        }
        out = static_cast<std::int64_t>(value.get_uint64());
        return true;
    case json::kind::bool_:
        out = value.get_bool();
        return true;
    case json::kind::string: {
        const auto& str = value.get_string();
        out = std::string(str.data(), str.size());
        return true;
    }
    default:
        return false;
    }
}

DecodeResult decodeEntityUpdate(const json::object& root) {
    domain::EntityUpdate update;
    if (!readString(root, "id", update.id) || update.id.empty()) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_update without id");
    }
    const json::value* fields = root.if_contains("fields");
    if (fields == nullptr || !fields->is_object()) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_update without fields object");
    }
    for (const auto& member : fields->as_object()) {
        domain::FieldValue parsed;
        if (!readField(member.value(), parsed)) {
            return fail<domain::InboundEvent>(
                DecodeError::Malformed,
                "field '" + std::string(member.key()) + "' of entity '" + update.id + "' is not a scalar");
        }
        update.fields.emplace(std::string(member.key()), std::move(parsed));
    }
    if (!readOptionalSeq(root, update.wireSeq)) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_update seq is not an unsigned integer");
    }
    if (!readOptionalTimestamp(root, update.timestampMs)) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_update ts is not an integer");
    }
    if (const json::value* replace = root.if_contains("replace")) {
        if (!replace->is_bool()) {
            return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_update replace is not a bool");
        }
        update.replace = replace->get_bool();
    }
    return success<domain::InboundEvent>(std::move(update));
}

DecodeResult decodeEntityRemoval(const json::object& root) {
    domain::EntityRemoval removal;
    if (!readString(root, "id", removal.id) || removal.id.empty()) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_remove without id");
    }
    if (!readOptionalSeq(root, removal.wireSeq)) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "entity_remove seq is not an unsigned integer");
    }
    return success<domain::InboundEvent>(std::move(removal));
}

DecodeResult decodeHeartbeat(const json::object& root) {
    domain::Heartbeat heartbeat;
    if (!readOptionalTimestamp(root, heartbeat.timestampMs)) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "heartbeat ts is not an integer");
    }
    return success<domain::InboundEvent>(heartbeat);
}

DecodeResult decodeErrorNotice(const json::object& root) {
    domain::ErrorNotice notice;
    const json::value* code = root.if_contains("code");
    if (code == nullptr || !code->is_int64()) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "error without integer code");
    }
    notice.code = code->get_int64();
    if (!readString(root, "message", notice.message)) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "error without message");
    }
    return success<domain::InboundEvent>(std::move(notice));
}

bool readTopics(const json::object& root, std::vector<std::string>& out) {
    const json::value* topics = root.if_contains("topics");
    if (topics == nullptr || !topics->is_array()) {
        return false;
    }
    for (const auto& topic : topics->as_array()) {
        if (!topic.is_string()) {
            return false;
        }
        const auto& str = topic.get_string();
        out.emplace_back(str.data(), str.size());
    }
    return true;
}

json::array toJsonArray(const std::vector<std::string>& items) {
    json::array array;
    array.reserve(items.size());
    for (const auto& item : items) {
        array.emplace_back(item);
    }
    return array;
}

json::value toJson(const domain::FieldValue& value) {
    return std::visit(
        [](const auto& v) -> json::value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return json::value(json::string(v));
            }
            else {
                return json::value(v);
            }
        },
        value);
}

}  // namespace

const char* toString(DecodeError error) {
    switch (error) {
    case DecodeError::None:
        return "None";
    case DecodeError::Malformed:
        return "Malformed";
    case DecodeError::SchemaMismatch:
        return "SchemaMismatch";
    case DecodeError::UnknownShape:
        return "UnknownShape";
    }
    return "Unknown";
}

DecodeResult WireCodec::decode(std::string_view raw) {
    json::value doc;
    const json::object* root = nullptr;
    DecodeResult failure;
    if (!parseEnvelope(raw, doc, root, failure)) {
        return failure;
    }

    std::string type;
    if (!readString(*root, "type", type)) {
        return fail<domain::InboundEvent>(DecodeError::Malformed, "missing message type");
    }

    if (type == "entity_update") {
        return decodeEntityUpdate(*root);
    }
    if (type == "entity_remove") {
        return decodeEntityRemoval(*root);
    }
    if (type == "heartbeat") {
        return decodeHeartbeat(*root);
    }
    if (type == "error") {
        return decodeErrorNotice(*root);
    }
    return fail<domain::InboundEvent>(DecodeError::UnknownShape, "unknown message type '" + type + "'");
}

std::string WireCodec::encode(const domain::OutboundCommand& command) {
    json::object obj;
    obj["v"] = kSchemaVersion;
    obj["op"] = domain::commandName(command);
    std::visit(
        [&obj](const auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, domain::Subscribe> || std::is_same_v<T, domain::Unsubscribe>) {
                obj["topics"] = toJsonArray(cmd.topics);
            }
            else if constexpr (std::is_same_v<T, domain::Ping>) {
                obj["nonce"] = cmd.nonce;
            }
            else if constexpr (std::is_same_v<T, domain::Hello>) {
                obj["station"] = cmd.stationId;
            }
        },
        command);
    return json::serialize(obj);
}

CommandResult WireCodec::decodeCommand(std::string_view raw) {
    json::value doc;
    const json::object* root = nullptr;
    CommandResult failure;
    if (!parseEnvelope(raw, doc, root, failure)) {
        return failure;
    }

    std::string op;
    if (!readString(*root, "op", op)) {
        return fail<domain::OutboundCommand>(DecodeError::Malformed, "missing command op");
    }

    if (op == "subscribe" || op == "unsubscribe") {
        std::vector<std::string> topics;
        if (!readTopics(*root, topics)) {
            return fail<domain::OutboundCommand>(DecodeError::Malformed, op + " without string topics array");
        }
        if (op == "subscribe") {
            return success<domain::OutboundCommand>(domain::Subscribe{std::move(topics)});
        }
        return success<domain::OutboundCommand>(domain::Unsubscribe{std::move(topics)});
    }
    if (op == "ping") {
        const json::value* nonce = root->if_contains("nonce");
        if (nonce != nullptr && nonce->is_uint64()) {
            return success<domain::OutboundCommand>(domain::Ping{nonce->get_uint64()});
        }
        if (nonce != nullptr && nonce->is_int64() && nonce->get_int64() >= 0) {
            return success<domain::OutboundCommand>(
                domain::Ping{static_cast<std::uint64_t>(nonce->get_int64())});
        }
        return fail<domain::OutboundCommand>(DecodeError::Malformed, "ping without unsigned nonce");
    }
    if (op == "hello") {
        domain::Hello hello;
        if (!readString(*root, "station", hello.stationId)) {
            return fail<domain::OutboundCommand>(DecodeError::Malformed, "hello without station");
        }
        return success<domain::OutboundCommand>(std::move(hello));
    }
    return fail<domain::OutboundCommand>(DecodeError::UnknownShape, "unknown command op '" + op + "'");
}

std::string WireCodec::encode(const domain::InboundEvent& event) {
    json::object obj;
    obj["v"] = kSchemaVersion;
    obj["type"] = domain::eventName(event);
    std::visit(
        [&obj](const auto& ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, domain::EntityUpdate>) {
                obj["id"] = ev.id;
                json::object fields;
                for (const auto& [name, value] : ev.fields) {
                    fields[name] = toJson(value);
                }
                obj["fields"] = std::move(fields);
                if (ev.wireSeq) {
                    obj["seq"] = *ev.wireSeq;
                }
                obj["ts"] = ev.timestampMs;
                if (ev.replace) {
                    obj["replace"] = true;
                }
            }
            else if constexpr (std::is_same_v<T, domain::EntityRemoval>) {
                obj["id"] = ev.id;
                if (ev.wireSeq) {
                    obj["seq"] = *ev.wireSeq;
                }
            }
            else if constexpr (std::is_same_v<T, domain::Heartbeat>) {
                obj["ts"] = ev.timestampMs;
            }
            else if constexpr (std::is_same_v<T, domain::ErrorNotice>) {
                obj["code"] = ev.code;
                obj["message"] = ev.message;
            }
            else {
                throw std::invalid_argument("connection status events are local and have no wire form");
            }
        },
        event);
    return json::serialize(obj);
}

}  // namespace infra::codec
