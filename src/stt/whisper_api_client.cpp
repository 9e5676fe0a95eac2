#include "stt/whisper_api_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

namespace printvoice {
namespace stt {

WhisperApiClient::WhisperApiClient(const utils::TranscriptionSettings& settings)
    : settings_(settings), http_(settings.timeoutMs) {
    if (settings_.apiKey.empty()) {
        utils::Logger::warn("OPENAI_API_KEY is not set, transcription calls will fail");
    }
}

std::string WhisperApiClient::extractText(const std::string& responseBody) {
    nlohmann::json response = nlohmann::json::parse(responseBody, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw utils::TranscriptionException("Invalid transcription response", responseBody);
    }
    auto text = response.find("text");
    if (text == response.end() || !text->is_string()) {
        throw utils::TranscriptionException("Transcription response has no text", responseBody);
    }
    return text->get<std::string>();
}

std::string WhisperApiClient::transcribe(const std::vector<uint8_t>& audio,
                                         const utils::CancellationToken& cancel) {
    utils::Logger::debug("Transcribing " + std::to_string(audio.size()) + " bytes of audio");

    std::vector<utils::MultipartPart> parts;
    parts.push_back({"file", std::string(audio.begin(), audio.end()), settings_.fileName, settings_.mimeType});
    parts.push_back({"model", settings_.model, "", ""});
    parts.push_back({"language", settings_.language, "", ""});

    std::vector<std::string> headers = {"Authorization: Bearer " + settings_.apiKey};

    utils::HttpResponse response;
    try {
        response = http_.postMultipart(settings_.endpoint, headers, parts, cancel);
    } catch (const utils::HttpTransferError& e) {
        throw utils::TranscriptionException("Transcription request failed", e.what());
    }

    if (!response.ok()) {
        throw utils::TranscriptionException(
            "Transcription request failed",
            "HTTP " + std::to_string(response.status) + ": " + response.body);
    }

    return extractText(response.body);
}

} // namespace stt
} // namespace printvoice
