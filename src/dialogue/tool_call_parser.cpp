#include "dialogue/tool_call_parser.hpp"
#include "utils/logging.hpp"

#include <cctype>

namespace printvoice {
namespace dialogue {

namespace {

const char* const kParamKeys[] = {"params", "parameters", "arguments"};

} // namespace

ModelReply ModelReply::plainText(const std::string& text) {
    ModelReply reply;
    reply.kind = Kind::PLAIN_TEXT;
    reply.text = text;
    return reply;
}

ModelReply ModelReply::toolCall(const std::string& name, const nlohmann::json& params, bool defaulted) {
    ModelReply reply;
    reply.kind = Kind::TOOL_CALL;
    reply.toolName = name;
    reply.params = params;
    reply.paramsDefaulted = defaulted;
    return reply;
}

ModelReply ModelReply::malformed(const std::string& text, const std::string& reason) {
    ModelReply reply;
    reply.kind = Kind::MALFORMED_TOOL_CALL;
    reply.text = text;
    reply.reason = reason;
    return reply;
}

bool ToolCallParser::hasToolMarker(const std::string& reply) {
    static const std::string marker = "\"tool\"";
    size_t pos = reply.find(marker);
    while (pos != std::string::npos) {
        size_t next = pos + marker.size();
        while (next < reply.size() && std::isspace(static_cast<unsigned char>(reply[next]))) {
            ++next;
        }
        if (next < reply.size() && reply[next] == ':') {
            return true;
        }
        pos = reply.find(marker, pos + 1);
    }
    return false;
}

std::string ToolCallParser::stripCodeFences(const std::string& reply) {
    std::string result;
    result.reserve(reply.size());

    size_t pos = 0;
    while (pos < reply.size()) {
        size_t fence = reply.find("```", pos);
        if (fence == std::string::npos) {
            result.append(reply, pos, std::string::npos);
            break;
        }
        result.append(reply, pos, fence - pos);

        // Skip the fence and an optional language tag such as ```json
        size_t next = fence + 3;
        while (next < reply.size() && std::isalnum(static_cast<unsigned char>(reply[next]))) {
            ++next;
        }
        pos = next;
    }
    return result;
}

size_t ToolCallParser::findBalancedEnd(const std::string& text, size_t open) {
    int depth = 0;
    bool inString = false;
    bool escaped = false;

    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }

        if (c == '"') {
            inString = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return std::string::npos;
}

std::optional<nlohmann::json> ToolCallParser::extractFirstJsonObject(const std::string& text) {
    size_t open = text.find('{');
    while (open != std::string::npos) {
        size_t close = findBalancedEnd(text, open);
        if (close != std::string::npos) {
            nlohmann::json candidate = nlohmann::json::parse(
                text.begin() + static_cast<std::ptrdiff_t>(open),
                text.begin() + static_cast<std::ptrdiff_t>(close) + 1,
                nullptr, false);
            if (!candidate.is_discarded() && candidate.is_object()) {
                return candidate;
            }
        }
        open = text.find('{', open + 1);
    }
    return std::nullopt;
}

ModelReply ToolCallParser::parse(const std::string& reply) {
    if (!hasToolMarker(reply)) {
        return ModelReply::plainText(reply);
    }

    auto payload = extractFirstJsonObject(stripCodeFences(reply));
    if (!payload) {
        return ModelReply::malformed(reply, "no JSON object found after tool marker");
    }

    auto toolIt = payload->find("tool");
    if (toolIt == payload->end() || !toolIt->is_string() || toolIt->get<std::string>().empty()) {
        return ModelReply::malformed(reply, "tool call payload has no tool name");
    }
    std::string toolName = toolIt->get<std::string>();

    for (const char* key : kParamKeys) {
        auto paramsIt = payload->find(key);
        if (paramsIt == payload->end() || paramsIt->is_null()) {
            continue;
        }
        if (!paramsIt->is_object()) {
            return ModelReply::malformed(reply, std::string("'") + key + "' is not an object");
        }
        return ModelReply::toolCall(toolName, *paramsIt, false);
    }

    utils::Logger::warn("Tool call '" + toolName + "' has no parameters, defaulting to {}");
    return ModelReply::toolCall(toolName, nlohmann::json::object(), true);
}

} // namespace dialogue
} // namespace printvoice
