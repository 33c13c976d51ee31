//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server loop implementation
//==========================================================================================================

#include "mcpstdio/Server.h"
#include "mcpstdio/EnvelopeValidator.h"
#include "mcpstdio/errors/Errors.h"
#include "logging/Logger.h"

#include <atomic>
#include <mutex>

namespace mcpstdio {

const char* toString(ServeResult result) {
    switch (result) {
        case ServeResult::EndOfStream: return "EndOfStream";
        case ServeResult::Stopped: return "Stopped";
        case ServeResult::WriteFailed: return "WriteFailed";
        case ServeResult::ReadFailed: return "ReadFailed";
    }
    return "Unknown";
}

class Server::Impl {
public:
    Session session;
    Dispatcher dispatcher;

    std::atomic<bool> stopRequested{false};
    std::mutex transportMutex;
    ITransport* activeTransport{nullptr};

    Impl(std::shared_ptr<const CapabilityRegistries> registries, ServerOptions options)
        : session(options.serverInfo, registries ? registries->Advertised() : ServerCapabilities{},
                  options.instructions),
          dispatcher(registries, session, options.dispatcher) {}

    std::unique_ptr<JSONRPCResponse> handleFrame(const std::string& frame) {
        Envelope env = ValidateEnvelope(frame);
        if (std::holds_alternative<EnvelopeRejection>(env)) {
            const auto& rej = std::get<EnvelopeRejection>(env);
            LOG_WARN("Rejected frame (id={}): {}", idToString(rej.id), rej.error.message);
            return errors::makeErrorResponse(rej.id, rej.error);
        }
        if (std::holds_alternative<JSONRPCNotification>(env)) {
            const auto& note = std::get<JSONRPCNotification>(env);
            LOG_DEBUG("<- notification {}", note.method);
            dispatcher.Dispatch(note);
            return nullptr;
        }
        const auto& req = std::get<JSONRPCRequest>(env);
        LOG_DEBUG("<- request {} id={}", req.method, idToString(req.id));
        auto resp = dispatcher.Dispatch(req);
        if (resp && resp->IsError()) {
            if (auto err = errors::mcpErrorFromResponse(*resp)) {
                LOG_INFO("-> error {} for {} id={}: {}", err->code, req.method, idToString(req.id), err->message);
            }
        }
        return resp;
    }

    bool write(ITransport& transport, const JSONRPCResponse& resp) {
        if (!transport.WriteFrame(resp.Serialize())) {
            LOG_ERROR("Failed to write response for id={}; closing session", idToString(resp.id));
            return false;
        }
        return true;
    }

    ServeResult serve(ITransport& transport) {
        {
            std::lock_guard<std::mutex> lock(transportMutex);
            activeTransport = &transport;
        }
        LOG_INFO("Serving session {}", transport.GetSessionId());

        ServeResult result = ServeResult::EndOfStream;
        bool running = true;
        while (running) {
            if (stopRequested.load()) {
                result = ServeResult::Stopped;
                break;
            }
            ReadResult r = transport.ReadFrame();
            switch (r.status) {
                case ReadStatus::Frame: {
                    auto resp = handleFrame(r.frame);
                    if (resp && !write(transport, *resp)) {
                        result = ServeResult::WriteFailed;
                        running = false;
                    }
                    break;
                }
                case ReadStatus::TooLarge: {
                    JSONValue::Object data;
                    data["reason"] = std::make_shared<JSONValue>(std::string("frame exceeds size limit"));
                    auto err = errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue{std::move(data)});
                    auto resp = errors::makeErrorResponse(JSONRPCId{nullptr}, err);
                    if (!write(transport, *resp)) {
                        result = ServeResult::WriteFailed;
                        running = false;
                    }
                    break;
                }
                case ReadStatus::EndOfStream:
                    result = ServeResult::EndOfStream;
                    running = false;
                    break;
                case ReadStatus::Interrupted:
                    break;
                case ReadStatus::Error:
                    result = ServeResult::ReadFailed;
                    running = false;
                    break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(transportMutex);
            activeTransport = nullptr;
        }
        session.Close();
        LOG_INFO("Serve loop finished: {}", toString(result));
        return result;
    }

    void stop() {
        stopRequested.store(true);
        dispatcher.CancelInFlight();
        std::lock_guard<std::mutex> lock(transportMutex);
        if (activeTransport) {
            activeTransport->Interrupt();
        }
    }
};

Server::Server(std::shared_ptr<const CapabilityRegistries> registries, ServerOptions options)
    : pImpl(std::make_unique<Impl>(std::move(registries), std::move(options))) {}

Server::~Server() = default;

ServeResult Server::Serve(ITransport& transport) {
    return pImpl->serve(transport);
}

std::unique_ptr<JSONRPCResponse> Server::HandleFrame(const std::string& frame) {
    return pImpl->handleFrame(frame);
}

void Server::Stop() {
    pImpl->stop();
}

void Server::Cancel(const JSONRPCId& id) {
    pImpl->dispatcher.Cancel(id);
}

const Session& Server::GetSession() const {
    return pImpl->session;
}

} // namespace mcpstdio
