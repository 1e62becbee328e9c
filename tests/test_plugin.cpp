#include <catch2/catch.hpp>
#include "plugin.hpp"
#include <algorithm>

using namespace toolbelt;

// Tests use unique prefixed names to avoid colliding with real registrations.

// ── Helpers ─────────────────────────────────────────────────────

class PluginTestTool : public Tool {
public:
    std::string name_;
    PluginTestTool(const std::string& name) : name_(name) {}
    ToolResult execute(const std::string&) override { return {true, "ok"}; }
    std::string tool_name() const override { return name_; }
    std::string description() const override { return "test"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }
};

// ── Built-in static registrations ───────────────────────────────

TEST_CASE("PluginRegistry: built-in tool types are registered", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_tool("bash"));
    REQUIRE(reg.has_tool("process"));
    REQUIRE(reg.has_tool("mcp"));
}

TEST_CASE("PluginRegistry: tool_types returns sorted list", "[plugin]") {
    auto types = PluginRegistry::instance().tool_types();
    REQUIRE(std::is_sorted(types.begin(), types.end()));
}

// ── Tool registration & creation ────────────────────────────────

TEST_CASE("PluginRegistry: register and create custom tool", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_tool("_test_tool", [](const ToolConfig& config) {
        return std::make_unique<PluginTestTool>(config.name);
    });
    REQUIRE(reg.has_tool("_test_tool"));

    ToolConfig tc;
    tc.name = "custom";
    tc.type = "_test_tool";
    auto tool = reg.create_tool(tc);
    REQUIRE(tool != nullptr);
    REQUIRE(tool->tool_name() == "custom");
    REQUIRE(tool->execute("{}").output == "ok");
}

TEST_CASE("PluginRegistry: create unknown tool type throws", "[plugin]") {
    ToolConfig tc;
    tc.name = "x";
    tc.type = "_nonexistent_tool";
    REQUIRE_THROWS_AS(PluginRegistry::instance().create_tool(tc), std::invalid_argument);
    REQUIRE_FALSE(PluginRegistry::instance().has_tool("_nonexistent_tool"));
}

TEST_CASE("PluginRegistry: created tools keep their configured names", "[plugin]") {
    ToolConfig tc;
    tc.name = "my_shell";
    tc.type = "bash";
    tc.settings["workspace"] = "/tmp";
    auto tool = PluginRegistry::instance().create_tool(tc);
    REQUIRE(tool->tool_name() == "my_shell");
}

TEST_CASE("PluginRegistry: create_tools skips unknown types", "[plugin]") {
    Config cfg;
    cfg.tools["shell"] = ToolConfig{"shell", "bash", "", {{"workspace", "/tmp"}}, {}};
    cfg.tools["search"] = ToolConfig{"search", "mcp", "", {{"command", "server"}}, {}};
    cfg.tools["odd"] = ToolConfig{"odd", "_nonexistent_tool", "", {}, {}};

    auto tools = PluginRegistry::instance().create_tools(cfg);
    REQUIRE(tools.size() == 2);
    std::vector<std::string> names;
    for (const auto& t : tools) names.push_back(t->tool_name());
    REQUIRE(names == std::vector<std::string>{"search", "shell"});
}
