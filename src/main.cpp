#include "config.hpp"
#include "plugin.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: toolbelt [options]\n"
              << "\n"
              << "Options:\n"
              << "  --list               List configured tools and exit\n"
              << "  --tool NAME          Run a single tool invocation and exit\n"
              << "  --args JSON          Arguments for --tool (default: {})\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  NAME JSON            Invoke tool NAME with JSON arguments\n"
              << "  /tools               List configured tools\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLBELT_WORKSPACE        Workspace directory for every tool\n"
              << "  TOOLBELT_DEFAULT_TIMEOUT  Foreground timeout in seconds (default: 30)\n"
              << "  TOOLBELT_MCP_TIMEOUT_MS   Per-call MCP timeout (default: 5000)\n";
}

static void list_tools(const std::vector<std::unique_ptr<toolbelt::Tool>>& tools,
                       const toolbelt::Config& config) {
    for (const auto& tool : tools) {
        const auto* tc = config.find_tool(tool->tool_name());
        std::cout << tool->tool_name() << " (" << (tc ? tc->type : "?") << ")\n";
    }
}

static toolbelt::Tool* find_tool(const std::vector<std::unique_ptr<toolbelt::Tool>>& tools,
                                 const std::string& name) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

static void reset_all(const std::vector<std::unique_ptr<toolbelt::Tool>>& tools) {
    for (const auto& tool : tools) {
        tool->reset();
    }
}

int main(int argc, char* argv[]) try {
    bool list = false;
    std::string tool_name;
    std::string args_json = "{}";

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list = true;
        } else if (std::strcmp(argv[i], "--tool") == 0 && i + 1 < argc) {
            tool_name = argv[++i];
        } else if (std::strcmp(argv[i], "--args") == 0 && i + 1 < argc) {
            args_json = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = toolbelt::Config::load();
    auto tools = toolbelt::PluginRegistry::instance().create_tools(config);

    if (list) {
        list_tools(tools, config);
        return 0;
    }

    // Single invocation mode
    if (!tool_name.empty()) {
        auto* tool = find_tool(tools, tool_name);
        if (!tool) {
            std::cerr << "Error: unknown tool " << tool_name << "\n";
            return 1;
        }
        auto result = tool->execute(args_json);
        std::cout << result.output << '\n';
        reset_all(tools);
        return result.success ? 0 : 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Interactive REPL
    std::cout << "toolbelt: " << tools.size() << " tools configured\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "toolbelt> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = toolbelt::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/tools") {
                list_tools(tools, config);
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  NAME JSON  Invoke tool NAME, e.g. bash {\"command_arguments\":\"ls\"}\n"
                          << "  /tools     List configured tools\n"
                          << "  /quit      Exit\n"
                          << "  /exit      Exit\n"
                          << "  /help      Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        auto space = line.find_first_of(" \t");
        std::string name = line.substr(0, space);
        std::string json = space == std::string::npos
            ? "{}" : toolbelt::trim(line.substr(space + 1));

        auto* tool = find_tool(tools, name);
        if (!tool) {
            std::cout << "Unknown tool: " << name << "\n";
            continue;
        }

        auto result = tool->execute(json);
        std::cout << (result.success ? "" : "[error] ") << result.output << "\n\n";
    }

    reset_all(tools);
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
