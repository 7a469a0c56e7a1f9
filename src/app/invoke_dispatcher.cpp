#include "invoke_dispatcher.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>

#include <tether/logger.hpp>

namespace tether::app
{

// ─── InvokeResult ────────────────────────────────────────────────────────────

InvokeResult InvokeResult::success(ipc::Json result)
{
    InvokeResult r;
    r.result = std::move(result);
    return r;
}

InvokeResult InvokeResult::failure(std::string error)
{
    InvokeResult r;
    r.ok    = false;
    r.error = std::move(error);
    return r;
}

InvokeResult InvokeResult::from_status(const ipc::IpcStatus& status)
{
    return status.ok() ? success() : failure(status.message());
}

ipc::Json InvokeResult::to_json() const
{
    if (ok)
        return {{"ok", true}, {"result", result}};
    return {{"ok", false}, {"error", error}};
}

// ─── InvokeArgs ──────────────────────────────────────────────────────────────

const ipc::Json* InvokeArgs::find(std::string_view key) const
{
    if (!args_.is_object())
        return nullptr;
    auto it = args_.find(std::string(key));
    return it == args_.end() ? nullptr : &*it;
}

bool InvokeArgs::fail(std::string_view key, const char* expected)
{
    if (error_.empty())
    {
        const ipc::Json* v = find(key);
        error_ = "argument '" + std::string(key) + "' "
                 + (v ? std::string("must be ") + expected : std::string("is required"));
    }
    return false;
}

bool InvokeArgs::read_int(std::string_view key, int& out)
{
    const ipc::Json* v = find(key);
    if (!v || !v->is_number_integer())
        return fail(key, "an integer");
    if (v->is_number_unsigned())
    {
        auto u = v->get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int>::max()))
            return fail(key, "an integer");
        out = static_cast<int>(u);
        return true;
    }
    auto i = v->get<int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
        return fail(key, "an integer");
    out = static_cast<int>(i);
    return true;
}

bool InvokeArgs::read_int_or(std::string_view key, int fallback, int& out)
{
    const ipc::Json* v = find(key);
    if (!v || v->is_null())
    {
        out = fallback;
        return true;
    }
    return read_int(key, out);
}

bool InvokeArgs::read_nullable_int(std::string_view key, std::optional<int>& out)
{
    const ipc::Json* v = find(key);
    if (!v || v->is_null())
    {
        out.reset();
        return true;
    }
    int value = 0;
    if (!read_int(key, value))
        return false;
    out = value;
    return true;
}

bool InvokeArgs::read_bool(std::string_view key, bool& out)
{
    const ipc::Json* v = find(key);
    if (!v || !v->is_boolean())
        return fail(key, "a boolean");
    out = v->get<bool>();
    return true;
}

bool InvokeArgs::read_string(std::string_view key, std::string& out)
{
    const ipc::Json* v = find(key);
    if (!v || !v->is_string())
        return fail(key, "a string");
    out = v->get<std::string>();
    return true;
}

bool InvokeArgs::read_nullable_string(std::string_view key, std::optional<std::string>& out)
{
    const ipc::Json* v = find(key);
    if (!v || v->is_null())
    {
        out.reset();
        return true;
    }
    std::string value;
    if (!read_string(key, value))
        return false;
    out = std::move(value);
    return true;
}

bool InvokeArgs::read_string_list(std::string_view key, std::vector<std::string>& out)
{
    const ipc::Json* v = find(key);
    if (!v || !v->is_array())
        return fail(key, "an array of strings");

    std::vector<std::string> values;
    for (const auto& item : *v)
    {
        if (!item.is_string())
            return fail(key, "an array of strings");
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool InvokeArgs::read_object(std::string_view key, ipc::Json& out)
{
    const ipc::Json* v = find(key);
    if (!v || !v->is_object())
        return fail(key, "an object");
    out = *v;
    return true;
}

// ─── InvokeDispatcher ────────────────────────────────────────────────────────

void InvokeDispatcher::register_handler(const std::string& name, Handler handler)
{
    std::lock_guard lock(mutex_);
    handlers_[name] = std::move(handler);
}

bool InvokeDispatcher::has_handler(const std::string& name) const
{
    std::lock_guard lock(mutex_);
    return handlers_.count(name) > 0;
}

std::vector<std::string> InvokeDispatcher::names() const
{
    std::vector<std::string> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(handlers_.size());
        for (const auto& [name, handler] : handlers_)
            out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t InvokeDispatcher::count() const
{
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

InvokeResult InvokeDispatcher::invoke(const std::string& name, const ipc::Json& args) const
{
    Handler handler;
    {
        std::lock_guard lock(mutex_);
        auto            it = handlers_.find(name);
        if (it == handlers_.end())
            return InvokeResult::failure("unknown command: " + name);
        handler = it->second;
    }

    if (!args.is_null() && !args.is_object())
        return InvokeResult::failure("arguments must be an object");

    static const ipc::Json EMPTY_ARGS = ipc::Json::object();
    InvokeArgs             reader(args.is_null() ? EMPTY_ARGS : args);
    try
    {
        return handler(reader);
    }
    catch (const std::exception& e)
    {
        TETHER_LOG_ERROR("host", "Invoke {} failed: {}", name, e.what());
        return InvokeResult::failure(e.what());
    }
}

ipc::Json InvokeDispatcher::handle_request(const ipc::Json& request) const
{
    InvokeResult result;
    auto         name = request.is_object() ? request.find("invoke") : request.end();
    if (!request.is_object() || name == request.end() || !name->is_string())
    {
        result = InvokeResult::failure(R"(request must be {"invoke": <name>, "args": {...}})");
    }
    else
    {
        auto args = request.find("args");
        result    = invoke(name->get<std::string>(), args == request.end() ? ipc::Json() : *args);
    }

    ipc::Json response = result.to_json();
    if (request.is_object())
    {
        auto id = request.find("id");
        if (id != request.end())
            response["id"] = *id;
    }
    return response;
}

}   // namespace tether::app
