//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: tools/list parsing and input-schema parameter enumeration
//==========================================================================================================

#include "mcphost/ToolCatalog.h"

#include <format>
#include <set>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

using errors::ErrorKind;
using errors::SessionError;

std::vector<ParameterDefinition> ToolDescriptor::Parameters() const {
    std::vector<ParameterDefinition> params;
    const JSONValue* props = inputSchema.Find("properties");
    if (!props || !props->IsObject()) {
        return params;
    }

    std::set<std::string> required;
    if (const JSONValue* req = inputSchema.Find("required")) {
        if (const auto* arr = std::get_if<JSONValue::Array>(&req->value)) {
            for (const auto& el : *arr) {
                if (el) {
                    if (const auto* s = std::get_if<std::string>(&el->value)) required.insert(*s);
                }
            }
        }
    }

    for (const auto& [name, schema] : std::get<JSONValue::Object>(props->value)) {
        ParameterDefinition p;
        p.name = name;
        p.type = "string";
        if (schema) {
            if (const JSONValue* t = schema->Find("type")) {
                if (const auto* s = std::get_if<std::string>(&t->value)) {
                    p.type = *s;
                } else if (const auto* alts = std::get_if<JSONValue::Array>(&t->value)) {
                    // Union types such as ["integer", "null"]: report the first concrete tag
                    for (const auto& alt : *alts) {
                        const auto* s2 = alt ? std::get_if<std::string>(&alt->value) : nullptr;
                        if (s2 && *s2 != "null") { p.type = *s2; break; }
                    }
                }
            }
            if (const std::string* d = schema->FindString("description")) {
                p.description = *d;
            }
        }
        p.required = required.count(name) != 0;
        params.push_back(std::move(p));
    }
    return params;
}

ToolCatalog::ToolCatalog(std::vector<ToolDescriptor> tools) : tools_(std::move(tools)) {}

ToolCatalog ToolCatalog::FromListResult(const JSONValue& result) {
    FUNC_SCOPE();
    const JSONValue* toolsVal = result.Find("tools");
    const auto* arr = toolsVal ? std::get_if<JSONValue::Array>(&toolsVal->value) : nullptr;
    if (!arr) {
        throw SessionError(ErrorKind::MalformedCatalog, "tools/list result has no 'tools' array");
    }

    std::vector<ToolDescriptor> tools;
    tools.reserve(arr->size());
    std::set<std::string> seen;
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const auto& entry = (*arr)[i];
        if (!entry || !entry->IsObject()) {
            throw SessionError(ErrorKind::MalformedCatalog, std::format("tools[{}] is not an object", i));
        }
        const std::string* name = entry->FindString("name");
        if (!name || name->empty()) {
            throw SessionError(ErrorKind::MalformedCatalog, std::format("tools[{}] has no name", i));
        }
        if (!seen.insert(*name).second) {
            throw SessionError(ErrorKind::MalformedCatalog, std::format("duplicate tool name '{}'", *name));
        }
        ToolDescriptor t;
        t.name = *name;
        if (const std::string* d = entry->FindString("description")) {
            t.description = *d;
        }
        if (const JSONValue* schema = entry->Find("inputSchema")) {
            t.inputSchema = *schema;
        } else {
            t.inputSchema = JSONValue(JSONValue::Object{});
        }
        tools.push_back(std::move(t));
    }
    LOG_DEBUG("ToolCatalog: parsed {} tool(s)", tools.size());
    return ToolCatalog(std::move(tools));
}

const ToolDescriptor* ToolCatalog::Find(const std::string& name) const {
    for (const auto& t : tools_) {
        if (t.name == name) {
            return &t;
        }
    }
    return nullptr;
}

std::vector<std::string> ToolCatalog::Names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : tools_) {
        names.push_back(t.name);
    }
    return names;
}

} // namespace mcphost
