#pragma once

#include "ITransport.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <atomic>
#include <nlohmann/json.hpp>

namespace cycle_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return JSON result; an object with an "error" key marks a failed call
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief Identity reported to clients during the initialize handshake
 */
struct ServerIdentity {
    std::string name = "import-cycle-mcp";
    std::string version = "1.0.0";
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Handles tool registration and request routing.
 * Supports methods: initialize, ping, tools/list, tools/call.
 * Notifications (requests without an id) never get a response.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     * @param identity Name and version sent in serverInfo
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport,
                       ServerIdentity identity = ServerIdentity());

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport reports end of input.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     */
    void stop();

    /**
     * @brief Whether the client has completed the initialize handshake
     */
    bool is_initialized() const { return initialized_; }

private:
    /**
     * @brief Handle incoming JSON-RPC message
     * @return JSON-RPC response, or null for notifications
     */
    json handle_request(const json& request);

    /**
     * @brief Handle tools/list method
     * @return JSON array of available tools with schemas
     */
    json handle_tools_list();

    /**
     * @brief Handle tools/call method
     *
     * The tool result is returned as one text content item. Results carrying
     * an "error" key are flagged with isError.
     *
     * @param params Request parameters with tool name and arguments
     */
    json handle_tools_call(const json& params);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    json create_result_response(const json& id, json result);

    /**
     * @brief Create JSON-RPC error response
     * @param id Request ID (or null)
     * @param code Error code
     * @param message Error message
     */
    json create_error_response(const json& id, int code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    ServerIdentity identity_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
    std::atomic<bool> running_{false};
    bool initialized_{false};
};

} // namespace cycle_mcp
