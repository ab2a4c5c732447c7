#include "chat_planner.hpp"
#include "analysis_errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sandlyst {

std::string build_chat_request(const ChatPlannerConfig& config, const std::vector<ChatMessage>& history) {
    json messages = json::array();
    for (const auto& message : history) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }

    json request = {
        {"model", config.model},
        {"messages", messages},
        {"temperature", config.temperature}
    };
    return request.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string parse_chat_response(const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::parse_error& e) {
        throw PlannerError(std::string("response is not JSON: ") + e.what());
    }

    if (response.contains("error") && !response["error"].is_null()) {
        const json& error = response["error"];
        std::string message = error.is_object() && error.contains("message") && error["message"].is_string()
            ? error["message"].get<std::string>()
            : error.dump();
        throw PlannerError("API error: " + message);
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        throw PlannerError("response has no choices");
    }

    const json& first = response["choices"][0];
    if (!first.contains("message") || !first["message"].is_object()) {
        throw PlannerError("first choice has no message");
    }
    const json& content = first["message"].value("content", json());
    if (!content.is_string()) {
        throw PlannerError("message content is not text");
    }
    return content.get<std::string>();
}

ChatCompletionsPlanner::ChatCompletionsPlanner(const ChatPlannerConfig& config, Logger* logger)
    : config_(config),
      client_(config.api_url, config.timeout_ms),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }
    if (config_.api_key.empty()) {
        throw PlannerError("no API key configured for " + config_.api_url);
    }
    client_.set_max_attempts(config_.max_attempts);
}

std::string ChatCompletionsPlanner::send(const std::vector<ChatMessage>& history) {
    std::map<std::string, std::string> headers;
    headers["Authorization"] = "Bearer " + config_.api_key;

    http::HttpResponse response;
    try {
        // Path is empty: api_url already names the endpoint
        response = client_.post("", build_chat_request(config_, history), headers);
    } catch (const http::HttpClientError& e) {
        throw PlannerError(e.what(), e.status_code());
    }

    logger_->log_debug(LogContext(), "Planner response received", {
        {"model", config_.model},
        {"status_code", std::to_string(response.status_code)},
        {"duration_ms", std::to_string(response.duration.count())}
    });

    return parse_chat_response(response.body);
}

std::string ChatCompletionsPlanner::get_name() const {
    return "chat-completions:" + config_.model;
}

} // namespace sandlyst
