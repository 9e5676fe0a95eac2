#include "core/message_protocol.hpp"
#include "utils/base64.hpp"
#include <nlohmann/json.hpp>

namespace printvoice {
namespace core {

namespace {

std::string typedObject(MessageType type) {
    nlohmann::json root;
    root["type"] = MessageProtocol::messageTypeToString(type);
    return root.dump();
}

std::string typedObject(MessageType type, const char* key, const std::string& value) {
    nlohmann::json root;
    root["type"] = MessageProtocol::messageTypeToString(type);
    root[key] = value;
    return root.dump();
}

} // namespace

std::string ControlMessage::serialize() const {
    return typedObject(type_);
}

std::string ConnectedMessage::serialize() const {
    return typedObject(type_, "message", message_);
}

std::string RecordingStartedMessage::serialize() const {
    return typedObject(type_, "message", message_);
}

std::string ProcessingStartedMessage::serialize() const {
    return typedObject(type_);
}

std::string TranscriptMessage::serialize() const {
    return typedObject(type_, "text", text_);
}

std::string ResponseTextMessage::serialize() const {
    return typedObject(type_, "text", text_);
}

std::string AudioChunkMessage::serialize() const {
    return typedObject(type_, "data", utils::encodeBase64(audio_));
}

std::string AudioCompleteMessage::serialize() const {
    return typedObject(type_);
}

std::string ProcessingCompleteMessage::serialize() const {
    return typedObject(type_);
}

std::string ResetCompleteMessage::serialize() const {
    return typedObject(type_, "message", message_);
}

std::string ErrorMessage::serialize() const {
    return typedObject(type_, "message", message_);
}

// MessageProtocol implementation
FrameClassification MessageProtocol::classifyFrame(std::string_view frame) {
    FrameClassification result;
    
    nlohmann::json root = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
    if (root.is_discarded()) {
        result.kind = FrameKind::AUDIO;
        return result;
    }
    
    if (!root.is_object()) {
        result.reason = "control frame is not an object";
        return result;
    }
    
    auto typeIt = root.find("type");
    if (typeIt == root.end() || !typeIt->is_string()) {
        result.reason = "missing string field 'type'";
        return result;
    }
    
    MessageType type = stringToMessageType(typeIt->get<std::string>());
    if (!isControlType(type)) {
        result.reason = "unsupported control type '" + typeIt->get<std::string>() + "'";
        return result;
    }
    
    result.kind = FrameKind::CONTROL;
    result.controlType = type;
    return result;
}

MessageType MessageProtocol::getMessageType(const std::string& json) {
    nlohmann::json root = nlohmann::json::parse(json, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return MessageType::UNKNOWN;
    }
    auto typeIt = root.find("type");
    if (typeIt == root.end() || !typeIt->is_string()) {
        return MessageType::UNKNOWN;
    }
    return stringToMessageType(typeIt->get<std::string>());
}

bool MessageProtocol::isControlType(MessageType type) {
    return type == MessageType::START_RECORDING ||
           type == MessageType::STOP_RECORDING ||
           type == MessageType::RESET;
}

bool MessageProtocol::isBestEffort(MessageType type) {
    return type == MessageType::AUDIO_CHUNK;
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "start_recording") return MessageType::START_RECORDING;
    if (typeStr == "stop_recording") return MessageType::STOP_RECORDING;
    if (typeStr == "reset") return MessageType::RESET;
    if (typeStr == "connected") return MessageType::CONNECTED;
    if (typeStr == "recording_started") return MessageType::RECORDING_STARTED;
    if (typeStr == "processing_started") return MessageType::PROCESSING_STARTED;
    if (typeStr == "transcript") return MessageType::TRANSCRIPT;
    if (typeStr == "response_text") return MessageType::RESPONSE_TEXT;
    if (typeStr == "audio_chunk") return MessageType::AUDIO_CHUNK;
    if (typeStr == "audio_complete") return MessageType::AUDIO_COMPLETE;
    if (typeStr == "processing_complete") return MessageType::PROCESSING_COMPLETE;
    if (typeStr == "reset_complete") return MessageType::RESET_COMPLETE;
    if (typeStr == "error") return MessageType::ERROR;
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::START_RECORDING: return "start_recording";
        case MessageType::STOP_RECORDING: return "stop_recording";
        case MessageType::RESET: return "reset";
        case MessageType::CONNECTED: return "connected";
        case MessageType::RECORDING_STARTED: return "recording_started";
        case MessageType::PROCESSING_STARTED: return "processing_started";
        case MessageType::TRANSCRIPT: return "transcript";
        case MessageType::RESPONSE_TEXT: return "response_text";
        case MessageType::AUDIO_CHUNK: return "audio_chunk";
        case MessageType::AUDIO_COMPLETE: return "audio_complete";
        case MessageType::PROCESSING_COMPLETE: return "processing_complete";
        case MessageType::RESET_COMPLETE: return "reset_complete";
        case MessageType::ERROR: return "error";
        case MessageType::UNKNOWN: break;
    }
    return "unknown";
}

} // namespace core
} // namespace printvoice
