#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace printvoice {
namespace dialogue {

/**
 * A function the language model may invoke by replying with
 * {"tool": name, "params": {...}}.
 *
 * execute() returns a JSON result that is fed back into the conversation.
 * Expected failures (bad parameters, validation) are reported as
 * {"success": false, "error": ...}; unexpected ones may throw.
 */
class Tool {
public:
    virtual ~Tool() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual nlohmann::json parameterSchema() const = 0;
    virtual nlohmann::json execute(const nlohmann::json& params) = 0;
};

inline nlohmann::json toolFailure(const std::string& error) {
    return nlohmann::json{{"success", false}, {"error", error}};
}

} // namespace dialogue
} // namespace printvoice
