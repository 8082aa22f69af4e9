#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace cycle_mcp {

namespace {

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

constexpr const char* kProtocolVersion = "2024-11-05";

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerIdentity identity)
    : transport_(std::move(transport)), identity_(std::move(identity)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    spdlog::info("MCPServer initialized");
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::info("Registered tool: {}", info.name);
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        try {
            IncomingMessage incoming = transport_->read_message();

            if (incoming.status == IncomingMessage::Status::CLOSED) {
                spdlog::info("Transport closed, stopping server");
                break;
            }

            if (incoming.status == IncomingMessage::Status::PARSE_ERROR) {
                transport_->write_message(create_error_response(json(), kParseError,
                    "Parse error: " + incoming.error));
                continue;
            }

            json response = handle_request(incoming.payload);

            // Notifications produce no response
            if (!response.is_null()) {
                transport_->write_message(response);
            }

        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            try {
                transport_->write_message(create_error_response(json(), kInternalError,
                    std::string("Internal error: ") + e.what()));
            } catch (const std::exception& write_error) {
                spdlog::error("Failed to send error response: {}", write_error.what());
            }
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

json MCPServer::handle_request(const json& request) {
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return create_error_response(json(), kInvalidRequest,
            "Invalid Request: missing or invalid jsonrpc field");
    }

    const bool is_notification = !request.contains("id");
    json id = request.value("id", json());

    if (!request.contains("method") || !request["method"].is_string()) {
        return create_error_response(id, kInvalidRequest, "Invalid Request: missing method field");
    }

    std::string method = request["method"];
    json params = request.value("params", json::object());

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    if (is_notification) {
        if (method == "notifications/initialized") {
            spdlog::info("Client sent initialized notification, server is ready");
        } else {
            spdlog::debug("Ignoring notification: {}", method);
        }
        return json();
    }

    try {
        if (method == "initialize") {
            json result = handle_initialize(params);
            initialized_ = true;
            return create_result_response(id, std::move(result));
        } else if (method == "ping") {
            return create_result_response(id, json::object());
        } else if (method == "tools/list") {
            return create_result_response(id, handle_tools_list());
        } else if (method == "tools/call") {
            return create_result_response(id, handle_tools_call(params));
        } else {
            return create_error_response(id, kMethodNotFound, "Method not found: " + method);
        }
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Invalid params for method {}: {}", method, e.what());
        return create_error_response(id, kInvalidParams, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        return create_error_response(id, kInternalError, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& [name, info] : tools_) {
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MCPServer::handle_tools_call(const json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }

    std::string tool_name = params["name"];
    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        throw std::invalid_argument("arguments must be an object");
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    auto handler_it = handlers_.find(tool_name);
    if (handler_it == handlers_.end()) {
        throw std::invalid_argument("Unknown tool: " + tool_name);
    }

    json result = handler_it->second(arguments);
    const bool is_error = result.is_object() && result.contains("error");

    json response = {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", result.dump(2)}
            }
        })}
    };
    if (is_error) {
        response["isError"] = true;
    }
    return response;
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", identity_.name},
            {"version", identity_.version}
        }}
    };
}

json MCPServer::create_result_response(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

json MCPServer::create_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace cycle_mcp
