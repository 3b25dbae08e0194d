// WatchParty - Watch-party signaling and process supervision core
// Signaling message codec

#include "watchparty/signaling/message.hpp"

#include "watchparty/core/json_value.hpp"

namespace watchparty {
namespace signaling {

namespace {

using ParseResult = core::Result<Message, core::Error>;

constexpr struct {
    MessageType type;
    const char* name;
} TYPE_NAMES[] = {
    {MessageType::Auth, "auth"},
    {MessageType::AuthSuccess, "auth_success"},
    {MessageType::AuthFailed, "auth_failed"},
    {MessageType::Chat, "chat"},
    {MessageType::Join, "join"},
    {MessageType::Leave, "leave"},
    {MessageType::Members, "members"},
    {MessageType::SrtPort, "srt_port"},
    {MessageType::Error, "error"},
    {MessageType::Heartbeat, "heartbeat"},
};

ParseResult violation(const std::string& message, const std::string& context = "") {
    return ParseResult::error(core::Error(core::ErrorCode::ProtocolViolation, message, context));
}

/**
 * @brief Helper for reading typed fields of one message object.
 *
 * The first failed required read is remembered; callers check failed()
 * once after reading every field.
 */
class FieldReader {
public:
    FieldReader(const core::JsonValue& object, const char* type)
        : object_(object), type_(type) {}

    std::string requiredString(const char* key) {
        const auto& value = object_[key];
        if (!value.isString()) {
            fail(key);
            return {};
        }
        return value.getString();
    }

    std::string optionalString(const char* key) {
        const auto& value = object_[key];
        return value.isString() ? value.getString() : std::string();
    }

    // A numeric code is accepted and rendered without a fraction
    std::string requiredCode(const char* key) {
        const auto& value = object_[key];
        if (value.isString()) {
            return value.getString();
        }
        if (value.isInteger() && value.getInt() >= 0) {
            return std::to_string(value.getInt());
        }
        fail(key);
        return {};
    }

    uint16_t requiredPort(const char* key) {
        const auto& value = object_[key];
        if (!value.isInteger() || value.getInt() < 1 || value.getInt() > 65535) {
            fail(key);
            return 0;
        }
        return static_cast<uint16_t>(value.getInt());
    }

    void fail(const std::string& key) {
        if (missing_.empty()) {
            missing_ = key;
        }
    }

    bool failed() const { return !missing_.empty(); }

    ParseResult error() const {
        return violation(std::string("missing or invalid field '") + missing_ + "' in " + type_,
                         type_);
    }

private:
    const core::JsonValue& object_;
    const char* type_;
    std::string missing_;
};

core::JsonValue typed(MessageType type) {
    auto object = core::JsonValue::object();
    object.set("type", messageTypeToString(type));
    return object;
}

core::JsonValue toJson(const Message& message) {
    auto json = typed(messageType(message));

    if (auto* auth = std::get_if<AuthRequest>(&message)) {
        json.set("code", auth->code);
        json.set("nickname", auth->nickname);
    } else if (auto* success = std::get_if<AuthSuccess>(&message)) {
        json.set("nickname", success->nickname);
        json.set("srt_port", static_cast<int>(success->srtPort));
        json.set("server_ip", success->serverIp);
    } else if (auto* failed = std::get_if<AuthFailed>(&message)) {
        json.set("message", failed->message);
    } else if (auto* chat = std::get_if<ChatMessage>(&message)) {
        // A client sends only the text
        if (!chat->nickname.empty()) {
            json.set("nickname", chat->nickname);
        }
        json.set("message", chat->message);
        if (!chat->timestamp.empty()) {
            json.set("timestamp", chat->timestamp);
        }
    } else if (auto* join = std::get_if<JoinNotice>(&message)) {
        json.set("nickname", join->nickname);
        json.set("message", join->message);
    } else if (auto* leave = std::get_if<LeaveNotice>(&message)) {
        json.set("nickname", leave->nickname);
        json.set("message", leave->message);
    } else if (auto* list = std::get_if<MemberList>(&message)) {
        auto members = core::JsonValue::array();
        for (const auto& member : list->members) {
            auto entry = core::JsonValue::object();
            entry.set("nickname", member.nickname);
            entry.set("role", core::roleToString(member.role));
            members.push(std::move(entry));
        }
        json.set("members", std::move(members));
    } else if (auto* port = std::get_if<SrtPortNotice>(&message)) {
        json.set("srt_port", static_cast<int>(port->srtPort));
    } else if (auto* error = std::get_if<ErrorMessage>(&message)) {
        json.set("message", error->message);
    }

    return json;
}

} // anonymous namespace

const char* messageTypeToString(MessageType type) {
    for (const auto& entry : TYPE_NAMES) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<MessageType> messageTypeFromString(const std::string& text) {
    for (const auto& entry : TYPE_NAMES) {
        if (text == entry.name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

MessageType messageType(const Message& message) {
    // Variant alternatives are declared in MessageType order
    return static_cast<MessageType>(message.index());
}

core::Result<Message, core::Error> parseMessage(const std::string& text) {
    auto parsed = core::parseJson(text);
    if (parsed.isError()) {
        return ParseResult::error(core::Error(core::ErrorCode::MalformedMessage,
            parsed.error().message + " at offset " + std::to_string(parsed.error().position)));
    }

    const core::JsonValue& json = parsed.value();
    if (!json.isObject()) {
        return violation("message is not a JSON object");
    }
    if (!json["type"].isString()) {
        return violation("missing 'type' field");
    }

    const std::string typeName = json["type"].getString();
    auto type = messageTypeFromString(typeName);
    if (!type) {
        return ParseResult::error(core::Error(core::ErrorCode::UnknownMessageType,
                                              "unknown message type", typeName));
    }

    FieldReader fields(json, messageTypeToString(*type));
    Message message;

    switch (*type) {
        case MessageType::Auth: {
            AuthRequest auth;
            auth.code = fields.requiredCode("code");
            auth.nickname = fields.requiredString("nickname");
            message = auth;
            break;
        }
        case MessageType::AuthSuccess: {
            AuthSuccess success;
            success.nickname = fields.requiredString("nickname");
            success.srtPort = fields.requiredPort("srt_port");
            success.serverIp = fields.optionalString("server_ip");
            message = success;
            break;
        }
        case MessageType::AuthFailed:
            message = AuthFailed{fields.optionalString("message")};
            break;
        case MessageType::Chat: {
            ChatMessage chat;
            chat.nickname = fields.optionalString("nickname");
            chat.message = fields.requiredString("message");
            chat.timestamp = fields.optionalString("timestamp");
            message = chat;
            break;
        }
        case MessageType::Join: {
            JoinNotice join;
            join.nickname = fields.requiredString("nickname");
            join.message = fields.optionalString("message");
            message = join;
            break;
        }
        case MessageType::Leave: {
            LeaveNotice leave;
            leave.nickname = fields.requiredString("nickname");
            leave.message = fields.optionalString("message");
            message = leave;
            break;
        }
        case MessageType::Members: {
            MemberList list;
            const auto& members = json["members"];
            if (!members.isArray()) {
                fields.fail("members");
            }
            for (const auto& entry : members.items()) {
                auto role = core::roleFromString(entry["role"].getString());
                if (!entry.isObject() || !entry["nickname"].isString() || !role) {
                    fields.fail("members");
                    break;
                }
                list.members.emplace_back(entry["nickname"].getString(), *role);
            }
            message = list;
            break;
        }
        case MessageType::SrtPort:
            message = SrtPortNotice{fields.requiredPort("srt_port")};
            break;
        case MessageType::Error:
            message = ErrorMessage{fields.optionalString("message")};
            break;
        case MessageType::Heartbeat:
            message = Heartbeat{};
            break;
    }

    if (fields.failed()) {
        return fields.error();
    }
    return ParseResult::success(std::move(message));
}

std::string serialize(const Message& message) {
    return toJson(message).dump();
}

} // namespace signaling
} // namespace watchparty
