//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinTools.cpp
// Purpose: greet, calculate-bmi and fetch-weather
//==========================================================================================================

#include "mcpstdio/builtin/BuiltinCapabilities.h"
#include "mcpstdio/typed/Content.h"
#include "mcpstdio/errors/Errors.h"
#include "logging/Logger.h"

#include <condition_variable>
#include <mutex>

#include <fmt/format.h>

namespace mcpstdio {
namespace builtin {

namespace {

JSONValue stringProperty(const std::string& description) {
    JSONValue::Object prop;
    prop["type"] = std::make_shared<JSONValue>(std::string("string"));
    prop["description"] = std::make_shared<JSONValue>(description);
    return JSONValue{prop};
}

JSONValue objectSchema(JSONValue::Object properties, const std::vector<std::string>& required) {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    JSONValue::Array req;
    for (const auto& r : required) {
        req.push_back(std::make_shared<JSONValue>(r));
    }
    schema["required"] = std::make_shared<JSONValue>(std::move(req));
    return JSONValue{schema};
}

// Arguments have already passed schema validation, so the fields exist with the declared types.
std::string stringArg(const JSONValue& args, const char* key) {
    auto v = typed::getStringField(args, key);
    if (!v.has_value()) {
        throw errors::McpException(errors::invalidParams(key, "is required"));
    }
    return v.value();
}

double numberArg(const JSONValue& args, const char* key) {
    if (std::holds_alternative<JSONValue::Object>(args.value)) {
        const auto& o = std::get<JSONValue::Object>(args.value);
        auto it = o.find(key);
        if (it != o.end() && it->second) {
            if (std::holds_alternative<int64_t>(it->second->value)) {
                return static_cast<double>(std::get<int64_t>(it->second->value));
            }
            if (std::holds_alternative<double>(it->second->value)) {
                return std::get<double>(it->second->value);
            }
        }
    }
    throw errors::McpException(errors::invalidParams(key, "must be a number"));
}

CallToolResult greet(const JSONValue& args, std::stop_token) {
    std::string name = stringArg(args, "name");
    LOG_DEBUG("greet: {}", name);
    return typed::makeTextResult(fmt::format("Hello, {}! Welcome to MCP.", name));
}

CallToolResult calculateBmi(const JSONValue& args, std::stop_token) {
    double weightKg = numberArg(args, "weightKg");
    double heightM = numberArg(args, "heightM");
    if (heightM <= 0.0) {
        return typed::makeTextResult("Height must be positive", true);
    }
    if (weightKg <= 0.0) {
        return typed::makeTextResult("Weight must be positive", true);
    }
    double bmi = weightKg / (heightM * heightM);
    return typed::makeTextResult(fmt::format("BMI: {:.2f}", bmi));
}

CallToolResult fetchWeather(const JSONValue& args, std::stop_token st, std::chrono::milliseconds latency) {
    std::string city = stringArg(args, "city");
    LOG_DEBUG("fetch-weather: {} (latency {} ms)", city, latency.count());

    if (latency.count() > 0) {
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        cv.wait_for(lock, st, latency, []() { return false; });
        if (st.stop_requested()) {
            LOG_DEBUG("fetch-weather: stopped before upstream reply for {}", city);
            throw errors::DomainError("Weather lookup cancelled");
        }
    }

    JSONValue::Object data;
    data["city"] = std::make_shared<JSONValue>(city);
    data["temperature"] = std::make_shared<JSONValue>(std::string("72°F"));
    data["condition"] = std::make_shared<JSONValue>(std::string("Partly Cloudy"));
    data["humidity"] = std::make_shared<JSONValue>(std::string("65%"));
    data["windSpeed"] = std::make_shared<JSONValue>(std::string("10 mph"));
    std::string body = serializeJSONValue(JSONValue{data});
    return typed::makeTextResult(fmt::format("Weather for {}:\n{}", city, body));
}

} // namespace

void RegisterBuiltinTools(RegistryBuilder& builder, const BuiltinOptions& options) {
    {
        JSONValue::Object props;
        props["name"] = std::make_shared<JSONValue>(stringProperty("The name of the person to greet"));
        ToolAnnotations ann;
        ann.title = "Greet Tool";
        ann.readOnlyHint = true;
        builder.RegisterTool(Tool("greet", "Greets a person with a friendly message",
                                  objectSchema(std::move(props), {"name"}), ann),
                             greet);
    }
    {
        JSONValue::Object weight;
        weight["type"] = std::make_shared<JSONValue>(std::string("number"));
        weight["description"] = std::make_shared<JSONValue>(std::string("Weight in kilograms"));
        JSONValue::Object height;
        height["type"] = std::make_shared<JSONValue>(std::string("number"));
        height["description"] = std::make_shared<JSONValue>(std::string("Height in meters"));
        height["minimum"] = std::make_shared<JSONValue>(0.1);
        JSONValue::Object props;
        props["weightKg"] = std::make_shared<JSONValue>(std::move(weight));
        props["heightM"] = std::make_shared<JSONValue>(std::move(height));
        ToolAnnotations ann;
        ann.title = "BMI Calculator";
        ann.readOnlyHint = true;
        builder.RegisterTool(Tool("calculate-bmi", "Calculates Body Mass Index from weight and height",
                                  objectSchema(std::move(props), {"weightKg", "heightM"}), ann),
                             calculateBmi);
    }
    {
        JSONValue::Object props;
        props["city"] = std::make_shared<JSONValue>(stringProperty("The city name"));
        ToolAnnotations ann;
        ann.title = "Fetch Weather";
        ann.readOnlyHint = true;
        ann.openWorldHint = true;
        std::chrono::milliseconds latency = options.weatherLatency;
        builder.RegisterTool(Tool("fetch-weather", "Fetches weather information for a given city",
                                  objectSchema(std::move(props), {"city"}), ann),
                             [latency](const JSONValue& args, std::stop_token st) {
                                 return fetchWeather(args, st, latency);
                             });
    }
}

void RegisterBuiltinCapabilities(RegistryBuilder& builder, const BuiltinOptions& options) {
    RegisterBuiltinTools(builder, options);
    RegisterBuiltinResources(builder, options);
    RegisterBuiltinPrompts(builder);
}

} // namespace builtin
} // namespace mcpstdio
