#pragma once

#include "../ipc/message.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tether::app
{

// Outcome of one invoke.  Serialized as {"ok": true, "result": ...} or
// {"ok": false, "error": "..."}.
struct InvokeResult
{
    bool        ok = true;
    ipc::Json   result;
    std::string error;

    static InvokeResult success(ipc::Json result = nullptr);
    static InvokeResult failure(std::string error);
    static InvokeResult from_status(const ipc::IpcStatus& status);

    ipc::Json to_json() const;
};

// Typed access to an invoke's argument object.  Every reader returns false
// and records the first error on a missing or mistyped argument.
class InvokeArgs
{
   public:
    explicit InvokeArgs(const ipc::Json& args) : args_(args) {}

    bool read_int(std::string_view key, int& out);
    bool read_int_or(std::string_view key, int fallback, int& out);
    bool read_nullable_int(std::string_view key, std::optional<int>& out);
    bool read_bool(std::string_view key, bool& out);
    bool read_string(std::string_view key, std::string& out);
    bool read_nullable_string(std::string_view key, std::optional<std::string>& out);
    bool read_string_list(std::string_view key, std::vector<std::string>& out);
    bool read_object(std::string_view key, ipc::Json& out);

    const std::string& error() const { return error_; }
    InvokeResult       failure() const { return InvokeResult::failure(error_); }

   private:
    const ipc::Json* find(std::string_view key) const;
    bool             fail(std::string_view key, const char* expected);

    const ipc::Json& args_;
    std::string      error_;
};

// Name -> handler table for presentation-layer requests.
// Thread-safe: register/invoke may be called from any thread.  Handlers run
// outside the registry lock.
class InvokeDispatcher
{
   public:
    using Handler = std::function<InvokeResult(InvokeArgs&)>;

    InvokeDispatcher()  = default;
    ~InvokeDispatcher() = default;

    InvokeDispatcher(const InvokeDispatcher&)            = delete;
    InvokeDispatcher& operator=(const InvokeDispatcher&) = delete;

    // Overwrites an existing handler with the same name.
    void register_handler(const std::string& name, Handler handler);

    bool                     has_handler(const std::string& name) const;
    std::vector<std::string> names() const;   // sorted
    size_t                   count() const;

    // `args` must be an object (or null for no arguments).
    InvokeResult invoke(const std::string& name, const ipc::Json& args) const;

    // Request line shape: {"invoke": <name>, "args": {...}, "id": <any>}.
    // The response is InvokeResult::to_json() with "id" echoed when present.
    ipc::Json handle_request(const ipc::Json& request) const;

   private:
    mutable std::mutex                       mutex_;
    std::unordered_map<std::string, Handler> handlers_;
};

}   // namespace tether::app
