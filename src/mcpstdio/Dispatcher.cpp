//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Method routing, session preconditions, bounded handler invocation and result shaping
//==========================================================================================================

#include "mcpstdio/Dispatcher.h"
#include "mcpstdio/async/BoundedCall.h"
#include "mcpstdio/errors/Errors.h"
#include "mcpstdio/validation/ArgumentValidator.h"
#include "logging/Logger.h"

#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace mcpstdio {

namespace {

// Bounded FIFO set of id keys.
class IdMemory {
public:
    explicit IdMemory(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

    void Add(const std::string& key) {
        if (members.count(key) != 0) return;
        order.push_back(key);
        members.insert(key);
        while (order.size() > capacity) {
            members.erase(order.front());
            order.pop_front();
        }
    }

    bool Contains(const std::string& key) const { return members.count(key) != 0; }

    bool Take(const std::string& key) {
        if (members.erase(key) == 0) return false;
        for (auto it = order.begin(); it != order.end(); ++it) {
            if (*it == key) { order.erase(it); break; }
        }
        return true;
    }

private:
    std::size_t capacity;
    std::deque<std::string> order;
    std::unordered_set<std::string> members;
};

const JSONValue::Object& requireObjectParams(const JSONRPCRequest& req) {
    static const JSONValue::Object empty;
    if (!req.params.has_value()) {
        return empty;
    }
    if (!std::holds_alternative<JSONValue::Object>(req.params->value)) {
        throw errors::McpException(errors::invalidParams("", "params must be an object"));
    }
    return std::get<JSONValue::Object>(req.params->value);
}

std::string requireString(const JSONValue::Object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end() || !it->second) {
        throw errors::McpException(errors::invalidParams(key, "is required"));
    }
    if (!std::holds_alternative<std::string>(it->second->value)) {
        throw errors::McpException(errors::invalidParams(key, "must be a string"));
    }
    return std::get<std::string>(it->second->value);
}

std::optional<JSONValue> optionalMember(const JSONValue::Object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end() || !it->second) return std::nullopt;
    return *(it->second);
}

JSONValue toArray(std::vector<JSONValue> items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (auto& v : items) arr.push_back(std::make_shared<JSONValue>(std::move(v)));
    return JSONValue{std::move(arr)};
}

JSONValue::Object makeToolObj(const Tool& t) {
    JSONValue::Object to;
    to["name"] = std::make_shared<JSONValue>(t.name);
    to["description"] = std::make_shared<JSONValue>(t.description);
    if (std::holds_alternative<std::nullptr_t>(t.inputSchema.value)) {
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>(std::string("object"));
        to["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    } else {
        to["inputSchema"] = std::make_shared<JSONValue>(t.inputSchema);
    }
    if (t.annotations.has_value()) {
        const ToolAnnotations& a = t.annotations.value();
        JSONValue::Object ao;
        if (a.title) ao["title"] = std::make_shared<JSONValue>(*a.title);
        if (a.readOnlyHint) ao["readOnlyHint"] = std::make_shared<JSONValue>(*a.readOnlyHint);
        if (a.destructiveHint) ao["destructiveHint"] = std::make_shared<JSONValue>(*a.destructiveHint);
        if (a.idempotentHint) ao["idempotentHint"] = std::make_shared<JSONValue>(*a.idempotentHint);
        if (a.openWorldHint) ao["openWorldHint"] = std::make_shared<JSONValue>(*a.openWorldHint);
        to["annotations"] = std::make_shared<JSONValue>(std::move(ao));
    }
    return to;
}

JSONValue::Object makeResourceObj(const Resource& r) {
    JSONValue::Object ro;
    ro["uri"] = std::make_shared<JSONValue>(r.uri);
    ro["name"] = std::make_shared<JSONValue>(r.name);
    if (r.description.has_value()) ro["description"] = std::make_shared<JSONValue>(r.description.value());
    if (r.mimeType.has_value()) ro["mimeType"] = std::make_shared<JSONValue>(r.mimeType.value());
    return ro;
}

JSONValue::Object makeResourceTemplateObj(const ResourceTemplate& rt) {
    JSONValue::Object rto;
    rto["uriTemplate"] = std::make_shared<JSONValue>(rt.uriTemplate);
    rto["name"] = std::make_shared<JSONValue>(rt.name);
    if (rt.description.has_value()) rto["description"] = std::make_shared<JSONValue>(rt.description.value());
    if (rt.mimeType.has_value()) rto["mimeType"] = std::make_shared<JSONValue>(rt.mimeType.value());
    return rto;
}

JSONValue::Object makePromptObj(const Prompt& p) {
    JSONValue::Object po;
    po["name"] = std::make_shared<JSONValue>(p.name);
    po["description"] = std::make_shared<JSONValue>(p.description);
    JSONValue::Array args;
    for (const auto& a : p.arguments) {
        JSONValue::Object ao;
        ao["name"] = std::make_shared<JSONValue>(a.name);
        if (a.description.has_value()) ao["description"] = std::make_shared<JSONValue>(a.description.value());
        ao["required"] = std::make_shared<JSONValue>(a.required);
        args.push_back(std::make_shared<JSONValue>(std::move(ao)));
    }
    po["arguments"] = std::make_shared<JSONValue>(std::move(args));
    return po;
}

} // namespace

class Dispatcher::Impl {
public:
    std::shared_ptr<const CapabilityRegistries> registries;
    Session& session;
    DispatcherOptions options;

    std::mutex cancelMutex;
    std::string inFlightKey;
    std::function<void()> inFlightCancel;
    IdMemory pendingCancels;
    IdMemory answered;

    Impl(std::shared_ptr<const CapabilityRegistries> regs, Session& s, DispatcherOptions opts)
        : registries(std::move(regs)), session(s), options(opts),
          pendingCancels(opts.cancellationMemory), answered(opts.cancellationMemory) {
        if (!registries) {
            throw std::invalid_argument("Dispatcher requires capability registries");
        }
        // Timed waits compute now() + timeout in nanoseconds; keep that sum representable.
        constexpr std::chrono::milliseconds maxTimeout = std::chrono::hours(24);
        if (options.handlerTimeout < std::chrono::milliseconds::zero() || options.handlerTimeout > maxTimeout) {
            LOG_WARN("Handler timeout {} ms out of range; using {} ms",
                     options.handlerTimeout.count(), maxTimeout.count());
            options.handlerTimeout = maxTimeout;
        }
    }

    //------------------------------------------------------------------------------------------------------
    // Cancellation bookkeeping
    //------------------------------------------------------------------------------------------------------
    void cancel(const std::string& key) {
        std::function<void()> fire;
        {
            std::lock_guard<std::mutex> lock(cancelMutex);
            if (inFlightCancel && inFlightKey == key) {
                fire = inFlightCancel;
            } else if (answered.Contains(key)) {
                LOG_DEBUG("Cancellation for already answered request {} ignored", key);
                return;
            } else {
                pendingCancels.Add(key);
                LOG_DEBUG("Cancellation for request {} recorded before dispatch", key);
                return;
            }
        }
        LOG_INFO("Cancelling in-flight request {}", key);
        fire();
    }

    void cancelInFlight() {
        std::function<void()> fire;
        {
            std::lock_guard<std::mutex> lock(cancelMutex);
            fire = inFlightCancel;
        }
        if (fire) fire();
    }

    bool consumePendingCancel(const std::string& key) {
        std::lock_guard<std::mutex> lock(cancelMutex);
        return pendingCancels.Take(key);
    }

    void markAnswered(const std::string& key) {
        std::lock_guard<std::mutex> lock(cancelMutex);
        answered.Add(key);
    }

    //------------------------------------------------------------------------------------------------------
    // Bounded handler invocation: start, await with the configured deadline, honour cancellation.
    //------------------------------------------------------------------------------------------------------
    template <typename R>
    R invoke(const std::string& key, const std::string& label, std::function<R(std::stop_token)> fn) {
        auto call = std::make_shared<async::BoundedCall<R>>(std::move(fn));
        {
            std::lock_guard<std::mutex> lock(cancelMutex);
            inFlightKey = key;
            inFlightCancel = [call]() { call->Cancel(); };
        }
        struct InFlightReset {
            Impl* self;
            ~InFlightReset() {
                std::lock_guard<std::mutex> lock(self->cancelMutex);
                self->inFlightKey.clear();
                self->inFlightCancel = nullptr;
            }
        } reset{this};

        if (!call->Start()) {
            LOG_INFO("{} cancelled before start", label);
            throw errors::McpException(errors::internalError("Request cancelled"));
        }
        switch (call->Await(options.handlerTimeout)) {
            case async::CallOutcome::Completed:
                return call->TakeResult();
            case async::CallOutcome::TimedOut:
                LOG_WARN("{} timed out after {} ms", label, options.handlerTimeout.count());
                throw errors::McpException(errors::internalError("Request timed out"));
            case async::CallOutcome::Cancelled:
                LOG_INFO("{} cancelled while running", label);
                throw errors::McpException(errors::internalError("Request cancelled"));
        }
        throw errors::McpException(errors::internalError());
    }

    //------------------------------------------------------------------------------------------------------
    // Method handlers
    //------------------------------------------------------------------------------------------------------
    JSONValue handleToolsList() {
        JSONValue::Array arr;
        for (const auto& e : registries->tools.Entries()) {
            arr.push_back(std::make_shared<JSONValue>(makeToolObj(e.descriptor)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(arr));
        return JSONValue{std::move(result)};
    }

    JSONValue handleToolsCall(const JSONRPCRequest& req, const std::string& key) {
        const auto& o = requireObjectParams(req);
        const std::string name = requireString(o, "name");
        const ToolEntry* entry = registries->tools.Find(name);
        if (entry == nullptr) {
            throw errors::McpException(errors::capabilityNotFound("Tool", name));
        }
        std::optional<JSONValue> arguments = optionalMember(o, "arguments");
        if (auto err = validation::ValidateToolArguments(entry->descriptor.inputSchema, arguments)) {
            throw errors::McpException(std::move(err.value()));
        }
        JSONValue args = arguments.value_or(JSONValue{JSONValue::Object{}});
        LOG_DEBUG("Calling tool '{}' (id={})", name, key);
        // The worker may outlive a timed-out dispatch, so it owns copies of everything it touches
        CallToolResult tr = invoke<CallToolResult>(key, "tool '" + name + "'",
            [handler = entry->handler, args](std::stop_token st) { return handler(args, st); });

        JSONValue::Object obj;
        obj["content"] = std::make_shared<JSONValue>(toArray(std::move(tr.content)));
        obj["isError"] = std::make_shared<JSONValue>(tr.isError);
        return JSONValue{std::move(obj)};
    }

    JSONValue handleResourcesList() {
        JSONValue::Array arr;
        for (const auto& e : registries->resources.Entries()) {
            arr.push_back(std::make_shared<JSONValue>(makeResourceObj(e.descriptor)));
        }
        JSONValue::Object result;
        result["resources"] = std::make_shared<JSONValue>(std::move(arr));
        return JSONValue{std::move(result)};
    }

    JSONValue handleResourceTemplatesList() {
        JSONValue::Array arr;
        for (const auto& e : registries->resourceTemplates.Entries()) {
            arr.push_back(std::make_shared<JSONValue>(makeResourceTemplateObj(e.descriptor)));
        }
        JSONValue::Object result;
        result["resourceTemplates"] = std::make_shared<JSONValue>(std::move(arr));
        return JSONValue{std::move(result)};
    }

    JSONValue handleResourcesRead(const JSONRPCRequest& req, const std::string& key) {
        const auto& o = requireObjectParams(req);
        const std::string uri = requireString(o, "uri");
        ResourceHandler handler;
        if (const ResourceEntry* entry = registries->resources.Find(uri)) {
            handler = entry->handler;
        } else if (const ResourceTemplateEntry* tmpl = registries->MatchTemplate(uri)) {
            handler = tmpl->handler;
        }
        if (!handler) {
            throw errors::McpException(errors::capabilityNotFound("Resource", uri));
        }
        LOG_DEBUG("Reading resource '{}' (id={})", uri, key);
        ReadResourceResult rr = invoke<ReadResourceResult>(key, "resource '" + uri + "'",
            [handler = std::move(handler), uri](std::stop_token st) { return handler(uri, st); });

        JSONValue::Object obj;
        obj["contents"] = std::make_shared<JSONValue>(toArray(std::move(rr.contents)));
        return JSONValue{std::move(obj)};
    }

    JSONValue handlePromptsList() {
        JSONValue::Array arr;
        for (const auto& e : registries->prompts.Entries()) {
            arr.push_back(std::make_shared<JSONValue>(makePromptObj(e.descriptor)));
        }
        JSONValue::Object result;
        result["prompts"] = std::make_shared<JSONValue>(std::move(arr));
        return JSONValue{std::move(result)};
    }

    JSONValue handlePromptsGet(const JSONRPCRequest& req, const std::string& key) {
        const auto& o = requireObjectParams(req);
        const std::string name = requireString(o, "name");
        const PromptEntry* entry = registries->prompts.Find(name);
        if (entry == nullptr) {
            throw errors::McpException(errors::capabilityNotFound("Prompt", name));
        }
        std::optional<JSONValue> arguments = optionalMember(o, "arguments");
        if (auto err = validation::ValidatePromptArguments(entry->descriptor.arguments, arguments)) {
            throw errors::McpException(std::move(err.value()));
        }
        JSONValue args = arguments.value_or(JSONValue{JSONValue::Object{}});
        LOG_DEBUG("Getting prompt '{}' (id={})", name, key);
        GetPromptResult pr = invoke<GetPromptResult>(key, "prompt '" + name + "'",
            [handler = entry->handler, args](std::stop_token st) { return handler(args, st); });

        JSONValue::Object obj;
        obj["description"] = std::make_shared<JSONValue>(
            pr.description.empty() ? entry->descriptor.description : pr.description);
        obj["messages"] = std::make_shared<JSONValue>(toArray(std::move(pr.messages)));
        return JSONValue{std::move(obj)};
    }

    JSONValue route(const JSONRPCRequest& req, const std::string& key) {
        const MethodKind kind = classifyMethod(req.method);
        if (kind == MethodKind::Initialize) {
            return session.Initialize(req.params);
        }
        if (kind == MethodKind::Ping) {
            return JSONValue{JSONValue::Object{}};
        }
        if (!session.IsInitialized() && (isCapabilityMethod(kind) || isCapabilityNamespace(req.method))) {
            LOG_WARN("Rejecting '{}' (id={}): session is {}", req.method, key, toString(session.State()));
            throw errors::McpException(errors::notInitialized());
        }
        switch (kind) {
            case MethodKind::ToolsList: return handleToolsList();
            case MethodKind::ToolsCall: return handleToolsCall(req, key);
            case MethodKind::ResourcesList: return handleResourcesList();
            case MethodKind::ResourcesRead: return handleResourcesRead(req, key);
            case MethodKind::ResourceTemplatesList: return handleResourceTemplatesList();
            case MethodKind::PromptsList: return handlePromptsList();
            case MethodKind::PromptsGet: return handlePromptsGet(req, key);
            default: break;
        }
        throw errors::McpException(errors::methodNotFound(req.method));
    }

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req) {
        FUNC_SCOPE();
        const std::string key = idToString(req.id);
        std::unique_ptr<JSONRPCResponse> resp;
        try {
            if (consumePendingCancel(key)) {
                LOG_INFO("Request {} ('{}') was cancelled before dispatch", key, req.method);
                throw errors::McpException(errors::internalError("Request cancelled"));
            }
            resp = std::make_unique<JSONRPCResponse>(req.id, route(req, key));
        } catch (...) {
            // Every failure, expected or not, funnels through the mapper
            resp = errors::makeErrorResponse(req.id, errors::mapException(std::current_exception(), req.method));
        }
        markAnswered(key);
        return resp;
    }

    void dispatchNotification(const JSONRPCNotification& note) {
        FUNC_SCOPE();
        try {
            switch (classifyNotification(note.method)) {
                case NotificationKind::Initialized:
                    session.MarkClientInitialized();
                    return;
                case NotificationKind::Cancelled: {
                    if (!note.params.has_value() || !std::holds_alternative<JSONValue::Object>(note.params->value)) {
                        LOG_WARN("notifications/cancelled without params object ignored");
                        return;
                    }
                    const auto& o = std::get<JSONValue::Object>(note.params->value);
                    auto it = o.find("requestId");
                    if (it == o.end() || !it->second) {
                        LOG_WARN("notifications/cancelled without requestId ignored");
                        return;
                    }
                    std::optional<JSONRPCId> id;
                    if (std::holds_alternative<std::string>(it->second->value)) {
                        id = JSONRPCId{std::get<std::string>(it->second->value)};
                    } else if (std::holds_alternative<int64_t>(it->second->value)) {
                        id = JSONRPCId{std::get<int64_t>(it->second->value)};
                    }
                    if (!id.has_value()) {
                        LOG_WARN("notifications/cancelled with non string/integer requestId ignored");
                        return;
                    }
                    auto reason = optionalMember(o, "reason");
                    LOG_DEBUG("Cancellation requested for {} (reason={})", idToString(*id),
                              reason ? serializeJSONValue(*reason) : std::string("none"));
                    cancel(idToString(*id));
                    return;
                }
                case NotificationKind::Unknown:
                    LOG_DEBUG("Ignoring notification '{}'", note.method);
                    return;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Notification '{}' failed: {}", note.method, e.what());
        }
    }
};

Dispatcher::Dispatcher(std::shared_ptr<const CapabilityRegistries> registries, Session& session,
                       DispatcherOptions options)
    : pImpl(std::make_unique<Impl>(std::move(registries), session, options)) {}

Dispatcher::~Dispatcher() = default;

std::unique_ptr<JSONRPCResponse> Dispatcher::Dispatch(const JSONRPCRequest& request) {
    return pImpl->dispatchRequest(request);
}

void Dispatcher::Dispatch(const JSONRPCNotification& notification) {
    pImpl->dispatchNotification(notification);
}

void Dispatcher::Cancel(const JSONRPCId& id) {
    pImpl->cancel(idToString(id));
}

void Dispatcher::CancelInFlight() {
    pImpl->cancelInFlight();
}

} // namespace mcpstdio
