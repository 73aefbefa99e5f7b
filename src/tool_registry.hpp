#pragma once
#include "loop_types.hpp"
#include <string>
#include <map>
#include <vector>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace orga {

// Thrown by a tool implementation; `retriable` tells recovery whether
// another attempt can succeed.
class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message, bool retriable = true)
        : std::runtime_error(message), retriable_(retriable) {}
    bool retriable() const { return retriable_; }

private:
    bool retriable_;
};

struct ToolOutcome {
    bool ok = true;
    std::string output; // payload on success, error text on failure
    bool retriable = false;
    ExecutionErrorKind kind = ExecutionErrorKind::invocation_failed;

    static ToolOutcome success(std::string output) {
        return {true, std::move(output), false, ExecutionErrorKind::invocation_failed};
    }
    static ToolOutcome failure(std::string error, bool retriable,
                               ExecutionErrorKind kind = ExecutionErrorKind::invocation_failed) {
        return {false, std::move(error), retriable, kind};
    }
};

// Hand-off point to whatever actually runs tools (in-process, sandbox, ...).
// Implementations must be safe to call from several threads at once.
class ToolInvoker {
public:
    virtual ~ToolInvoker() = default;
    virtual ToolOutcome invoke(const std::string& tool_name,
                               const std::string& arguments,
                               Millis timeout) = 0;
};

using ToolFunction = std::function<std::string(const nlohmann::json& args, Millis timeout)>;

struct ToolDef {
    std::string name;
    std::string description;
    nlohmann::json parameters;
    ToolFunction func;
};

// In-process tools. Register everything before the first run; lookups are
// not synchronized against registration.
class ToolRegistry : public ToolInvoker {
public:
    void register_tool(ToolDef def) {
        tools_[def.name] = std::move(def);
    }

    bool has(const std::string& name) const {
        return tools_.count(name) > 0;
    }

    ToolOutcome invoke(const std::string& name, const std::string& arguments, Millis timeout) override {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return ToolOutcome::failure("Unknown tool: " + name, false, ExecutionErrorKind::tool_not_found);
        }
        nlohmann::json args;
        try {
            args = arguments.empty() ? nlohmann::json::object() : nlohmann::json::parse(arguments);
        } catch (const nlohmann::json::parse_error& e) {
            return ToolOutcome::failure(std::string("Invalid arguments: ") + e.what(), false);
        }
        try {
            return ToolOutcome::success(it->second.func(args, timeout));
        } catch (const ToolError& e) {
            return ToolOutcome::failure(e.what(), e.retriable());
        } catch (const std::exception& e) {
            return ToolOutcome::failure(e.what(), true);
        }
    }

    std::vector<ToolDefinition> definitions() const {
        std::vector<ToolDefinition> defs;
        for (auto& [name, def] : tools_) {
            defs.push_back({def.name, def.description, def.parameters});
        }
        return defs;
    }

private:
    std::map<std::string, ToolDef> tools_;
};

} // namespace orga
