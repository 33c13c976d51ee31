//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: RegistryBuilder uniqueness, ordering, template matching and advertised capabilities
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "mcpstdio/Registry.h"
#include "mcpstdio/typed/Content.h"

using namespace mcpstdio;

namespace {

CallToolResult okTool(const JSONValue&, std::stop_token) {
    return typed::makeTextResult("ok");
}

ReadResourceResult okResource(const std::string& uri, std::stop_token) {
    ReadResourceResult r;
    r.contents.push_back(typed::makeTextResourceContents(uri, std::string("text/plain"), "body"));
    return r;
}

GetPromptResult okPrompt(const JSONValue&, std::stop_token) {
    GetPromptResult r;
    r.messages.push_back(typed::makePromptMessage("user", "hi"));
    return r;
}

} // namespace

TEST(Registry, KeepsRegistrationOrder) {
    RegistryBuilder b;
    b.RegisterTool(Tool("zeta", "z"), okTool)
     .RegisterTool(Tool("alpha", "a"), okTool)
     .RegisterTool(Tool("mid", "m"), okTool);
    auto regs = b.Build();
    ASSERT_EQ(regs->tools.Size(), 3u);
    EXPECT_EQ(regs->tools.Entries()[0].descriptor.name, "zeta");
    EXPECT_EQ(regs->tools.Entries()[1].descriptor.name, "alpha");
    EXPECT_EQ(regs->tools.Entries()[2].descriptor.name, "mid");
    ASSERT_NE(regs->tools.Find("alpha"), nullptr);
    EXPECT_EQ(regs->tools.Find("missing"), nullptr);
}

TEST(Registry, RejectsDuplicatesEmptyKeysAndMissingHandlers) {
    RegistryBuilder b;
    b.RegisterTool(Tool("greet", "g"), okTool);
    EXPECT_THROW(b.RegisterTool(Tool("greet", "again"), okTool), std::invalid_argument);
    EXPECT_THROW(b.RegisterTool(Tool("", "empty"), okTool), std::invalid_argument);
    EXPECT_THROW(b.RegisterTool(Tool("nohandler", "x"), ToolHandler{}), std::invalid_argument);

    b.RegisterResource(Resource("config://app", "cfg"), okResource);
    EXPECT_THROW(b.RegisterResource(Resource("config://app", "dup"), okResource), std::invalid_argument);

    b.RegisterPrompt(Prompt("p", "d"), okPrompt);
    EXPECT_THROW(b.RegisterPrompt(Prompt("p", "dup"), okPrompt), std::invalid_argument);

    auto regs = b.Build();
    EXPECT_EQ(regs->tools.Size(), 1u);
    EXPECT_EQ(regs->resources.Size(), 1u);
    EXPECT_EQ(regs->prompts.Size(), 1u);
}

TEST(Registry, TemplatesNeedExactlyOneVariable) {
    RegistryBuilder b;
    EXPECT_THROW(b.RegisterResourceTemplate(ResourceTemplate("file:///plain", "n"), okResource),
                 std::invalid_argument);
    EXPECT_THROW(b.RegisterResourceTemplate(ResourceTemplate("file:///{a}/{b}", "n"), okResource),
                 std::invalid_argument);
    EXPECT_THROW(b.RegisterResourceTemplate(ResourceTemplate("file:///{}", "n"), okResource),
                 std::invalid_argument);
    EXPECT_NO_THROW(b.RegisterResourceTemplate(ResourceTemplate("file:///data/{filename}", "n"), okResource));
}

TEST(Registry, MatchTemplateExtractsVariable) {
    RegistryBuilder b;
    b.RegisterResourceTemplate(ResourceTemplate("file:///data/{filename}", "Data"), okResource);
    b.RegisterResourceTemplate(ResourceTemplate("db://{table}/rows", "Rows"), okResource);
    auto regs = b.Build();

    const auto* t = regs->MatchTemplate("file:///data/notes.txt");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->descriptor.name, "Data");
    EXPECT_EQ(t->ExtractVariable("file:///data/notes.txt"), "notes.txt");

    const auto* rows = regs->MatchTemplate("db://users/rows");
    ASSERT_NE(rows, nullptr);
    EXPECT_EQ(rows->ExtractVariable("db://users/rows"), "users");

    EXPECT_EQ(regs->MatchTemplate("file:///data/"), nullptr);
    EXPECT_EQ(regs->MatchTemplate("file:///etc/passwd"), nullptr);
}

TEST(Registry, AdvertisesOnlyNonEmptyRegistries) {
    RegistryBuilder b;
    b.RegisterTool(Tool("t", "d"), okTool);
    auto regs = b.Build();
    auto caps = regs->Advertised();
    EXPECT_TRUE(caps.tools.has_value());
    EXPECT_FALSE(caps.resources.has_value());
    EXPECT_FALSE(caps.prompts.has_value());

    RegistryBuilder onlyTemplates;
    onlyTemplates.RegisterResourceTemplate(ResourceTemplate("x://{id}", "x"), okResource);
    EXPECT_TRUE(onlyTemplates.Build()->Advertised().resources.has_value());
}

TEST(Registry, BuildResetsBuilder) {
    RegistryBuilder b;
    b.RegisterTool(Tool("t", "d"), okTool);
    auto first = b.Build();
    auto second = b.Build();
    EXPECT_EQ(first->tools.Size(), 1u);
    EXPECT_EQ(second->tools.Size(), 0u);
    EXPECT_NO_THROW(b.RegisterTool(Tool("t", "d"), okTool));
}
