/**
 * @file planner_interface.hpp
 * @brief Abstract interface for the planning entity
 *
 * The orchestrator only needs one capability from a planner: given the
 * conversation so far, produce the next raw reply. Reply decoding, turn
 * accounting and execution stay in the orchestrator, so a planner is free to
 * be a remote chat model, a scripted test double or anything in between.
 */

#ifndef SANDLYST_PLANNER_INTERFACE_HPP
#define SANDLYST_PLANNER_INTERFACE_HPP

#include <string>
#include <vector>

namespace sandlyst {

/**
 * @brief One conversation entry
 */
struct ChatMessage {
    std::string role;       ///< "system", "user" or "assistant"
    std::string content;

    ChatMessage() = default;
    ChatMessage(const std::string& role_, const std::string& content_)
        : role(role_), content(content_) {}
};

/**
 * @brief Planning entity
 */
class IPlanner {
public:
    virtual ~IPlanner() = default;

    /**
     * @brief Produce the next reply for a conversation
     *
     * @param history Full message history, oldest first
     * @return Raw reply text (expected to be a JSON action, not guaranteed)
     *
     * @throws PlannerError On transport failure or an unusable response envelope
     */
    virtual std::string send(const std::vector<ChatMessage>& history) = 0;

    /**
     * @brief Human-readable planner name for logs
     */
    virtual std::string get_name() const = 0;
};

} // namespace sandlyst

#endif // SANDLYST_PLANNER_INTERFACE_HPP
