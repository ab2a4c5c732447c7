#ifndef SANDLYST_CHAT_PLANNER_HPP
#define SANDLYST_CHAT_PLANNER_HPP

#include "planner_interface.hpp"
#include "api/http_client.hpp"
#include "../../sandlyst-sandbox/src/logger.hpp"
#include <string>
#include <vector>

namespace sandlyst {

struct ChatPlannerConfig {
    std::string api_url;        // Full chat-completions endpoint
    std::string api_key;        // Bearer token
    std::string model;
    double temperature;
    int timeout_ms;             // Per request
    int max_attempts;           // HTTP attempts per send (retries on 408/429/5xx)

    ChatPlannerConfig()
        : api_url("https://dashscope.aliyuncs.com/compatible-mode/v1/chat/completions"),
          model("qwen-max"),
          temperature(0.2),
          timeout_ms(120000),
          max_attempts(3) {}
};

// Build the request body for an OpenAI-compatible chat-completions endpoint
std::string build_chat_request(const ChatPlannerConfig& config, const std::vector<ChatMessage>& history);

// Pull choices[0].message.content out of a response body. Throws PlannerError.
std::string parse_chat_response(const std::string& body);

/**
 * Planner backed by an OpenAI-compatible chat-completions API.
 * Safe to share between sessions: each send() uses its own connection.
 */
class ChatCompletionsPlanner : public IPlanner {
public:
    explicit ChatCompletionsPlanner(const ChatPlannerConfig& config, Logger* logger = nullptr);

    std::string send(const std::vector<ChatMessage>& history) override;
    std::string get_name() const override;

private:
    ChatPlannerConfig config_;
    http::HttpClient client_;
    Logger* logger_;
};

} // namespace sandlyst

#endif // SANDLYST_CHAT_PLANNER_HPP
