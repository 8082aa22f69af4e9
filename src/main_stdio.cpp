#include "core/CircularDependencyAnalyzer.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/FindCircularDepsTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <atomic>

namespace {
    constexpr const char* kVersion = "1.0.0";

    std::atomic<bool> shutdown_requested{false};
    cycle_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int signal) {
        spdlog::info("Received signal {}, shutting down gracefully", signal);
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    // stdout carries protocol messages and reports, so logs go to stderr
    void setup_logging(spdlog::level::level_enum level) {
        auto logger = spdlog::stderr_color_mt("stderr");
        spdlog::set_default_logger(logger);
        spdlog::set_level(level);
    }

    int run_single_scan(const std::filesystem::path& root, bool include_node_modules) {
        cycle_mcp::CircularDependencyAnalyzer analyzer;
        try {
            std::cout << analyzer.scan_to_json(root, include_node_modules).dump(2) << std::endl;
            return 0;
        } catch (const cycle_mcp::ScanError& e) {
            std::cout << nlohmann::json{{"error", e.what()}}.dump(2) << std::endl;
            return 1;
        }
    }
}

int main(int argc, char** argv) {
    CLI::App app{"MCP Stdio Server - Circular Import Detection (TypeScript & JavaScript)"};

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical, off)")
        ->default_val("info")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    std::string project_root;
    app.add_option("-r,--project-root", project_root,
                   "Directory that relative tool paths resolve against (default: current directory)")
        ->envname("PROJECT_ROOT")
        ->check(CLI::ExistingDirectory);

    std::string scan_path;
    app.add_option("-s,--scan", scan_path, "Scan a directory once, print the report and exit");

    bool include_node_modules = false;
    app.add_flag("--include-node-modules", include_node_modules,
                 "Also scan node_modules directories (with --scan)");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "import-cycle-mcp version " << kVersion << std::endl;
        return 0;
    }

    setup_logging(spdlog::level::from_str(log_level));

    if (!scan_path.empty()) {
        std::filesystem::path root(scan_path);
        if (root.is_relative() && !project_root.empty()) {
            root = std::filesystem::path(project_root) / root;
        }
        return run_single_scan(root, include_node_modules);
    }

    spdlog::info("Starting MCP Stdio Server");
    spdlog::info("Log level: {}", log_level);

    try {
        setup_signal_handlers();

        std::filesystem::path root = project_root.empty()
            ? std::filesystem::current_path()
            : std::filesystem::path(project_root);
        spdlog::info("Project root: {}", root.string());

        auto analyzer = std::make_shared<cycle_mcp::CircularDependencyAnalyzer>();
        auto transport = std::make_unique<cycle_mcp::StdioTransport>();
        auto server = std::make_unique<cycle_mcp::MCPServer>(std::move(transport));

        global_server = server.get();

        auto circular_tool = std::make_shared<cycle_mcp::FindCircularDepsTool>(analyzer, root);
        server->register_tool(
            cycle_mcp::FindCircularDepsTool::get_info(),
            [circular_tool](const nlohmann::json& args) {
                return circular_tool->execute(args);
            }
        );

        spdlog::info("All tools registered, starting server");

        // Blocks until stdin closes or a signal arrives
        server->run();

        global_server = nullptr;
        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
