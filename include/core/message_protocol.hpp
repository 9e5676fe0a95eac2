#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace printvoice {
namespace core {

// Message types
enum class MessageType {
    UNKNOWN,
    // Client to Server
    START_RECORDING,
    STOP_RECORDING,
    RESET,
    // Server to Client
    CONNECTED,
    RECORDING_STARTED,
    PROCESSING_STARTED,
    TRANSCRIPT,
    RESPONSE_TEXT,
    AUDIO_CHUNK,
    AUDIO_COMPLETE,
    PROCESSING_COMPLETE,
    RESET_COMPLETE,
    ERROR
};

// Base message class
class Message {
public:
    explicit Message(MessageType type) : type_(type) {}
    virtual ~Message() = default;
    
    MessageType getType() const { return type_; }
    virtual std::string serialize() const = 0;
    
protected:
    MessageType type_;
};

// Client to Server: {"type": "start_recording" | "stop_recording" | "reset"}
class ControlMessage : public Message {
public:
    explicit ControlMessage(MessageType type) : Message(type) {}
    std::string serialize() const override;
};

// Server to Client Messages
class ConnectedMessage : public Message {
public:
    explicit ConnectedMessage(const std::string& message = "Voice pipeline ready")
        : Message(MessageType::CONNECTED), message_(message) {}
    const std::string& getMessage() const { return message_; }
    std::string serialize() const override;
    
private:
    std::string message_;
};

class RecordingStartedMessage : public Message {
public:
    explicit RecordingStartedMessage(const std::string& message = "Ready to receive audio")
        : Message(MessageType::RECORDING_STARTED), message_(message) {}
    std::string serialize() const override;
    
private:
    std::string message_;
};

class ProcessingStartedMessage : public Message {
public:
    ProcessingStartedMessage() : Message(MessageType::PROCESSING_STARTED) {}
    std::string serialize() const override;
};

class TranscriptMessage : public Message {
public:
    explicit TranscriptMessage(const std::string& text)
        : Message(MessageType::TRANSCRIPT), text_(text) {}
    const std::string& getText() const { return text_; }
    std::string serialize() const override;
    
private:
    std::string text_;
};

class ResponseTextMessage : public Message {
public:
    explicit ResponseTextMessage(const std::string& text)
        : Message(MessageType::RESPONSE_TEXT), text_(text) {}
    const std::string& getText() const { return text_; }
    std::string serialize() const override;
    
private:
    std::string text_;
};

// Carries synthesized audio; serialized with the bytes base64-encoded
class AudioChunkMessage : public Message {
public:
    explicit AudioChunkMessage(std::vector<uint8_t> audio)
        : Message(MessageType::AUDIO_CHUNK), audio_(std::move(audio)) {}
    const std::vector<uint8_t>& getAudio() const { return audio_; }
    std::string serialize() const override;
    
private:
    std::vector<uint8_t> audio_;
};

class AudioCompleteMessage : public Message {
public:
    AudioCompleteMessage() : Message(MessageType::AUDIO_COMPLETE) {}
    std::string serialize() const override;
};

class ProcessingCompleteMessage : public Message {
public:
    ProcessingCompleteMessage() : Message(MessageType::PROCESSING_COMPLETE) {}
    std::string serialize() const override;
};

class ResetCompleteMessage : public Message {
public:
    explicit ResetCompleteMessage(const std::string& message = "Session reset")
        : Message(MessageType::RESET_COMPLETE), message_(message) {}
    std::string serialize() const override;
    
private:
    std::string message_;
};

class ErrorMessage : public Message {
public:
    explicit ErrorMessage(const std::string& message)
        : Message(MessageType::ERROR), message_(message) {}
    const std::string& getMessage() const { return message_; }
    std::string serialize() const override;
    
private:
    std::string message_;
};

/**
 * Outcome of inspecting one inbound frame. The channel carries either JSON
 * control objects or raw audio: anything that does not parse as JSON is
 * audio, anything that parses must be a known control object.
 */
enum class FrameKind {
    AUDIO,
    CONTROL,
    INVALID
};

struct FrameClassification {
    FrameKind kind = FrameKind::INVALID;
    MessageType controlType = MessageType::UNKNOWN;
    std::string reason;
};

// Message factory and parser
class MessageProtocol {
public:
    static FrameClassification classifyFrame(std::string_view frame);
    
    // Type discriminator of any serialized message, UNKNOWN if unreadable
    static MessageType getMessageType(const std::string& json);
    
    static std::string messageTypeToString(MessageType type);
    static MessageType stringToMessageType(const std::string& typeStr);
    static bool isControlType(MessageType type);
    // Synthesized audio is the only stream a slow client may lose frames of
    static bool isBestEffort(MessageType type);
};

} // namespace core
} // namespace printvoice
