#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace printvoice {
namespace dialogue {

/**
 * Classified language-model reply.
 *
 * PLAIN_TEXT carries the reply text, TOOL_CALL carries the tool name and
 * parameters, MALFORMED_TOOL_CALL means the reply announced a tool call but
 * no usable payload could be extracted.
 */
struct ModelReply {
    enum class Kind {
        PLAIN_TEXT,
        TOOL_CALL,
        MALFORMED_TOOL_CALL
    };

    Kind kind = Kind::PLAIN_TEXT;
    std::string text;
    std::string toolName;
    nlohmann::json params = nlohmann::json::object();
    bool paramsDefaulted = false;
    std::string reason;

    static ModelReply plainText(const std::string& text);
    static ModelReply toolCall(const std::string& name, const nlohmann::json& params, bool defaulted);
    static ModelReply malformed(const std::string& text, const std::string& reason);

    bool isPlainText() const { return kind == Kind::PLAIN_TEXT; }
    bool isToolCall() const { return kind == Kind::TOOL_CALL; }
    bool isMalformed() const { return kind == Kind::MALFORMED_TOOL_CALL; }
};

/**
 * Detects tool calls in free-form model replies.
 *
 * A reply is a candidate when it contains "tool" followed by a colon. The
 * payload is the first balanced {...} region (after removing markdown code
 * fences) that parses as a JSON object. This is a heuristic: a plain reply
 * that merely quotes such a fragment is treated as a tool call too.
 */
class ToolCallParser {
public:
    static ModelReply parse(const std::string& reply);

    static bool hasToolMarker(const std::string& reply);
    static std::string stripCodeFences(const std::string& reply);

    // First balanced brace region that parses as a JSON object
    static std::optional<nlohmann::json> extractFirstJsonObject(const std::string& text);

private:
    static size_t findBalancedEnd(const std::string& text, size_t open);
};

} // namespace dialogue
} // namespace printvoice
