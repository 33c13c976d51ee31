//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentValidator.cpp
// Purpose: Schema-subset validation of tool and prompt arguments
//==========================================================================================================

#include "mcpstdio/validation/ArgumentValidator.h"
#include "logging/Logger.h"

#include <cmath>
#include <fmt/format.h>

namespace mcpstdio {
namespace validation {

namespace {

const JSONValue* member(const JSONValue::Object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<double> asNumber(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return static_cast<double>(std::get<int64_t>(v.value));
    if (std::holds_alternative<double>(v.value)) return std::get<double>(v.value);
    return std::nullopt;
}

bool matchesType(const std::string& type, const JSONValue& v) {
    if (type == "object") return std::holds_alternative<JSONValue::Object>(v.value);
    if (type == "array") return std::holds_alternative<JSONValue::Array>(v.value);
    if (type == "string") return std::holds_alternative<std::string>(v.value);
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "null") return std::holds_alternative<std::nullptr_t>(v.value);
    if (type == "number") return asNumber(v).has_value();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (std::holds_alternative<double>(v.value)) {
            double d = std::get<double>(v.value);
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    // Unknown type keywords do not constrain
    return true;
}

bool jsonEquals(const JSONValue& a, const JSONValue& b) {
    auto na = asNumber(a);
    auto nb = asNumber(b);
    if (na.has_value() && nb.has_value()) return *na == *nb;
    return serializeJSONValue(a) == serializeJSONValue(b);
}

// Schema string lengths count code points; parsed strings are well-formed UTF-8.
int64_t codePointCount(const std::string& text) {
    int64_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string join(const std::string& base, const std::string& key) {
    return base.empty() ? key : base + "." + key;
}

std::optional<errors::McpError> validateValue(const JSONValue& schema, const JSONValue& value, const std::string& path) {
    if (!std::holds_alternative<JSONValue::Object>(schema.value)) {
        return std::nullopt;
    }
    const auto& s = std::get<JSONValue::Object>(schema.value);

    if (const JSONValue* type = member(s, "type")) {
        bool ok = true;
        std::string expected;
        if (std::holds_alternative<std::string>(type->value)) {
            expected = std::get<std::string>(type->value);
            ok = matchesType(expected, value);
        } else if (std::holds_alternative<JSONValue::Array>(type->value)) {
            ok = false;
            for (const auto& t : std::get<JSONValue::Array>(type->value)) {
                if (!t || !std::holds_alternative<std::string>(t->value)) continue;
                const auto& name = std::get<std::string>(t->value);
                expected += expected.empty() ? name : "|" + name;
                if (matchesType(name, value)) { ok = true; break; }
            }
        }
        if (!ok) {
            return errors::invalidParams(path, "must be of type " + expected);
        }
    }

    if (const JSONValue* en = member(s, "enum")) {
        if (std::holds_alternative<JSONValue::Array>(en->value)) {
            bool found = false;
            for (const auto& candidate : std::get<JSONValue::Array>(en->value)) {
                if (candidate && jsonEquals(*candidate, value)) { found = true; break; }
            }
            if (!found) {
                return errors::invalidParams(path, "must be one of " + serializeJSONValue(*en));
            }
        }
    }

    if (auto n = asNumber(value)) {
        const JSONValue* bound = nullptr;
        if ((bound = member(s, "minimum")) && asNumber(*bound) && *n < *asNumber(*bound)) {
            return errors::invalidParams(path, fmt::format("must be >= {}", *asNumber(*bound)));
        }
        if ((bound = member(s, "maximum")) && asNumber(*bound) && *n > *asNumber(*bound)) {
            return errors::invalidParams(path, fmt::format("must be <= {}", *asNumber(*bound)));
        }
        if ((bound = member(s, "exclusiveMinimum")) && asNumber(*bound) && *n <= *asNumber(*bound)) {
            return errors::invalidParams(path, fmt::format("must be > {}", *asNumber(*bound)));
        }
        if ((bound = member(s, "exclusiveMaximum")) && asNumber(*bound) && *n >= *asNumber(*bound)) {
            return errors::invalidParams(path, fmt::format("must be < {}", *asNumber(*bound)));
        }
    }

    if (std::holds_alternative<std::string>(value.value)) {
        const auto len = codePointCount(std::get<std::string>(value.value));
        const JSONValue* bound = nullptr;
        if ((bound = member(s, "minLength")) && std::holds_alternative<int64_t>(bound->value) &&
            len < std::get<int64_t>(bound->value)) {
            return errors::invalidParams(path, fmt::format("must be at least {} characters", std::get<int64_t>(bound->value)));
        }
        if ((bound = member(s, "maxLength")) && std::holds_alternative<int64_t>(bound->value) &&
            len > std::get<int64_t>(bound->value)) {
            return errors::invalidParams(path, fmt::format("must be at most {} characters", std::get<int64_t>(bound->value)));
        }
    }

    if (std::holds_alternative<JSONValue::Object>(value.value)) {
        const auto& obj = std::get<JSONValue::Object>(value.value);
        if (const JSONValue* req = member(s, "required")) {
            if (std::holds_alternative<JSONValue::Array>(req->value)) {
                for (const auto& r : std::get<JSONValue::Array>(req->value)) {
                    if (!r || !std::holds_alternative<std::string>(r->value)) continue;
                    const auto& name = std::get<std::string>(r->value);
                    if (member(obj, name.c_str()) == nullptr) {
                        return errors::invalidParams(join(path, name), "is required");
                    }
                }
            }
        }
        const JSONValue* props = member(s, "properties");
        const JSONValue::Object* propObj = (props && std::holds_alternative<JSONValue::Object>(props->value))
            ? &std::get<JSONValue::Object>(props->value) : nullptr;
        const JSONValue* additional = member(s, "additionalProperties");
        const bool closed = additional && std::holds_alternative<bool>(additional->value) &&
                            !std::get<bool>(additional->value);
        for (const auto& [key, val] : obj) {
            const JSONValue* propSchema = propObj ? member(*propObj, key.c_str()) : nullptr;
            if (propSchema == nullptr) {
                if (closed) {
                    return errors::invalidParams(join(path, key), "is not allowed");
                }
                continue;
            }
            if (auto err = validateValue(*propSchema, val ? *val : JSONValue{}, join(path, key))) {
                return err;
            }
        }
    }

    if (std::holds_alternative<JSONValue::Array>(value.value)) {
        if (const JSONValue* items = member(s, "items")) {
            const auto& arr = std::get<JSONValue::Array>(value.value);
            for (std::size_t k = 0; k < arr.size(); ++k) {
                if (auto err = validateValue(*items, arr[k] ? *arr[k] : JSONValue{}, fmt::format("{}[{}]", path, k))) {
                    return err;
                }
            }
        }
    }

    return std::nullopt;
}

} // namespace

std::optional<errors::McpError> ValidateToolArguments(const JSONValue& schema,
                                                      const std::optional<JSONValue>& arguments) {
    JSONValue args = arguments.value_or(JSONValue{JSONValue::Object{}});
    if (!std::holds_alternative<JSONValue::Object>(args.value)) {
        return errors::invalidParams("arguments", "must be an object");
    }
    auto err = validateValue(schema, args, "");
    if (err) {
        LOG_DEBUG("Tool arguments rejected: {}", err->message);
    }
    return err;
}

std::optional<errors::McpError> ValidatePromptArguments(const std::vector<PromptArgument>& declared,
                                                        const std::optional<JSONValue>& arguments) {
    JSONValue args = arguments.value_or(JSONValue{JSONValue::Object{}});
    if (!std::holds_alternative<JSONValue::Object>(args.value)) {
        return errors::invalidParams("arguments", "must be an object");
    }
    const auto& obj = std::get<JSONValue::Object>(args.value);
    for (const auto& [key, val] : obj) {
        if (!val || !std::holds_alternative<std::string>(val->value)) {
            return errors::invalidParams(key, "must be a string");
        }
    }
    for (const auto& arg : declared) {
        if (arg.required && member(obj, arg.name.c_str()) == nullptr) {
            return errors::invalidParams(arg.name, "is required");
        }
    }
    return std::nullopt;
}

} // namespace validation
} // namespace mcpstdio
