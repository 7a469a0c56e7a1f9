#include "codec.hpp"

#include <stdexcept>

namespace tether::ipc
{

namespace
{

std::string_view strip_line_ending(std::string_view line)
{
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.remove_suffix(1);
    return line;
}

bool is_blank(std::string_view s)
{
    for (char c : s)
    {
        if (c != ' ' && c != '\t')
            return false;
    }
    return true;
}

void set_error(std::string* error, std::string msg)
{
    if (error)
        *error = std::move(msg);
}

std::optional<Json> parse_object(std::string_view line, std::string* error)
{
    line = strip_line_ending(line);
    if (is_blank(line))
    {
        set_error(error, "empty line");
        return std::nullopt;
    }

    Json value;
    try
    {
        value = Json::parse(line.begin(), line.end());
    }
    catch (const Json::parse_error& e)
    {
        set_error(error, std::string("invalid JSON: ") + e.what());
        return std::nullopt;
    }

    if (!value.is_object())
    {
        set_error(error, std::string("expected a JSON object, got ") + value.type_name());
        return std::nullopt;
    }
    return value;
}

std::string dump_total(const Json& value)
{
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}   // namespace

// ─── Status / command plumbing ───────────────────────────────────────────────

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::SpawnFailed:
            return "SpawnError";
        case ErrorCode::WriteFailed:
            return "WriteError";
        case ErrorCode::DecodeFailed:
            return "DecodeError";
        case ErrorCode::NotRunning:
            return "NotRunningError";
        case ErrorCode::InvalidCommand:
            return "InvalidCommand";
        case ErrorCode::SurfaceMissing:
            return "SurfaceMissing";
        case ErrorCode::Io:
            return "IoError";
    }
    return "Unknown";
}

std::string IpcStatus::to_string() const
{
    if (ok())
        return "Ok";
    return std::string(error_code_name(code_)) + ": " + message_;
}

OutboundCommand::OutboundCommand(std::string cmd, Json fields)
    : cmd_(std::move(cmd)), fields_(std::move(fields))
{
    if (fields_.is_null())
        fields_ = Json::object();
    if (!fields_.is_object())
        throw std::invalid_argument("command fields must be a JSON object");
    // "cmd" is carried separately and always wins on the wire.
    fields_.erase("cmd");
}

const Json& OutboundCommand::field(std::string_view key) const
{
    static const Json null_value;
    auto              it = fields_.find(std::string(key));
    return it == fields_.end() ? null_value : *it;
}

// ─── Host side ───────────────────────────────────────────────────────────────

std::string encode_command(const OutboundCommand& cmd)
{
    Json obj   = cmd.fields();
    obj["cmd"] = cmd.cmd();
    return dump_total(obj);
}

std::optional<InboundEvent> decode_event(std::string_view line, std::string* error)
{
    auto obj = parse_object(line, error);
    if (!obj)
        return std::nullopt;

    auto type_it = obj->find("type");
    if (type_it == obj->end())
    {
        set_error(error, "missing \"type\"");
        return std::nullopt;
    }
    if (!type_it->is_string())
    {
        set_error(error, "\"type\" is not a string");
        return std::nullopt;
    }

    InboundEvent event;
    event.event_type = type_it->get<std::string>();
    if (event.event_type.empty())
    {
        set_error(error, "\"type\" is empty");
        return std::nullopt;
    }

    auto data_it = obj->find("data");
    if (data_it != obj->end() && !data_it->is_null())
        event.data = std::move(*data_it);
    return event;
}

std::optional<OutboundCommand> command_from_json(const Json& value, std::string* error)
{
    if (!value.is_object())
    {
        set_error(error, std::string("command must be a JSON object, got ") + value.type_name());
        return std::nullopt;
    }
    auto cmd_it = value.find("cmd");
    if (cmd_it == value.end() || !cmd_it->is_string() || cmd_it->get_ref<const std::string&>().empty())
    {
        set_error(error, "command needs a non-empty string \"cmd\"");
        return std::nullopt;
    }
    return OutboundCommand(cmd_it->get<std::string>(), value);
}

Json event_to_json(const InboundEvent& event)
{
    Json obj;
    obj["type"] = event.event_type;
    obj["data"] = event.data ? *event.data : Json(nullptr);
    return obj;
}

// ─── Worker side ─────────────────────────────────────────────────────────────

std::string encode_event(const InboundEvent& event)
{
    Json obj;
    obj["type"] = event.event_type;
    if (event.data)
        obj["data"] = *event.data;
    return dump_total(obj);
}

std::optional<OutboundCommand> decode_command(std::string_view line, std::string* error)
{
    auto obj = parse_object(line, error);
    if (!obj)
        return std::nullopt;
    return command_from_json(*obj, error);
}

}   // namespace tether::ipc
