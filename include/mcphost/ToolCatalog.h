//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.h
// Purpose: Immutable tool and parameter descriptors parsed from a tools/list result
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// ParameterDefinition
// Purpose: One argument of a tool, derived from its input schema.
// Fields:
//   type: The schema's "type" tag; "string" when absent.
//   required: true iff the name appears in the schema's "required" list.
//==========================================================================================================
struct ParameterDefinition {
    std::string name;
    std::string type;
    std::string description;
    bool required{false};
};

//==========================================================================================================
// ToolDescriptor
// Purpose: One advertised tool.
// Fields:
//   name: Non-empty, unique within its catalog.
//   description: Empty when the peer omitted it.
//   inputSchema: The peer's schema document, kept opaque.
//==========================================================================================================
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    //==========================================================================================================
    // Parameters
    // Purpose: Enumerates inputSchema.properties in lexical name order. A schema without properties yields none.
    //==========================================================================================================
    std::vector<ParameterDefinition> Parameters() const;
};

//==========================================================================================================
// ToolCatalog
// Purpose: Ordered sequence of tool descriptors in the order the peer listed them.
//==========================================================================================================
class ToolCatalog {
public:
    ToolCatalog() = default;
    explicit ToolCatalog(std::vector<ToolDescriptor> tools);

    //==========================================================================================================
    // FromListResult
    // Purpose: Parses the result of tools/list ({ tools: [ { name, description?, inputSchema? } ] }).
    // Throws:
    //   errors::SessionError(MalformedCatalog) when tools is missing or not an array, an entry is not an
    //   object, an entry lacks a string name, or a name repeats.
    //==========================================================================================================
    static ToolCatalog FromListResult(const JSONValue& result);

    const std::vector<ToolDescriptor>& Tools() const { return tools_; }
    const ToolDescriptor* Find(const std::string& name) const;
    std::vector<std::string> Names() const;

    std::size_t size() const { return tools_.size(); }
    bool empty() const { return tools_.empty(); }
    std::vector<ToolDescriptor>::const_iterator begin() const { return tools_.begin(); }
    std::vector<ToolDescriptor>::const_iterator end() const { return tools_.end(); }

private:
    std::vector<ToolDescriptor> tools_;
};

} // namespace mcphost
