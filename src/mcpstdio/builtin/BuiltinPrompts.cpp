//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinPrompts.cpp
// Purpose: review-code prompt
//==========================================================================================================

#include "mcpstdio/builtin/BuiltinCapabilities.h"
#include "mcpstdio/typed/Content.h"
#include "mcpstdio/errors/Errors.h"
#include "logging/Logger.h"

#include <fmt/format.h>

namespace mcpstdio {
namespace builtin {

namespace {

GetPromptResult reviewCode(const JSONValue& args, std::stop_token) {
    auto code = typed::getStringField(args, "code");
    if (!code.has_value()) {
        throw errors::McpException(errors::invalidParams("code", "is required"));
    }
    std::string focus = typed::getStringField(args, "focus").value_or("general");
    LOG_DEBUG("Generating code review prompt, focus={}", focus);

    std::string text = "Please review the following code for potential issues and suggest improvements";
    if (focus != "general") {
        text += fmt::format(", focusing specifically on {}", focus);
    }
    text += fmt::format(":\n\n```\n{}\n```", code.value());

    GetPromptResult r;
    r.description = fmt::format("Requesting {} review for code snippet", focus);
    r.messages.push_back(typed::makePromptMessage("user", text));
    return r;
}

} // namespace

void RegisterBuiltinPrompts(RegistryBuilder& builder) {
    std::vector<PromptArgument> arguments;
    arguments.push_back(PromptArgument{"code", std::string("The code snippet to review"), true});
    arguments.push_back(PromptArgument{
        "focus", std::string("Optional area of focus for the review (performance, security, style, general)"),
        false});
    builder.RegisterPrompt(Prompt("review-code", "Generates a prompt to ask the LLM to review code",
                                  std::move(arguments)),
                           reviewCode);
}

} // namespace builtin
} // namespace mcpstdio
