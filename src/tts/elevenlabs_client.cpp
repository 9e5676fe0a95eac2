#include "tts/elevenlabs_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <nlohmann/json.hpp>

namespace printvoice {
namespace tts {

ElevenLabsClient::ElevenLabsClient(const utils::SynthesisSettings &settings)
    : settings_(settings), http_(settings.timeoutMs) {
  if (settings_.apiKey.empty()) {
    utils::Logger::warn(
        "ELEVENLABS_API_KEY is not set, speech synthesis calls will fail");
  }
}

std::string ElevenLabsClient::streamUrl() const {
  return settings_.baseUrl + "/" + settings_.voiceId + "/stream";
}

std::string ElevenLabsClient::buildRequestBody(const std::string &text) const {
  nlohmann::json request;
  request["text"] = text;
  request["model_id"] = settings_.modelId;
  request["voice_settings"] = {{"stability", settings_.stability},
                               {"similarity_boost", settings_.similarityBoost}};
  return request.dump();
}

void ElevenLabsClient::streamSynthesis(const std::string &text,
                                       const ChunkCallback &onChunk,
                                       const utils::CancellationToken &cancel) {
  std::vector<std::string> headers = {"xi-api-key: " + settings_.apiKey,
                                      "Accept: audio/mpeg"};

  utils::HttpClient::ChunkHandler forward = [&onChunk](const char *data,
                                                       size_t size) {
    onChunk(reinterpret_cast<const uint8_t *>(data), size);
  };

  utils::HttpResponse response;
  try {
    response = http_.postStreaming(streamUrl(), headers,
                                   buildRequestBody(text), forward, cancel);
  } catch (const utils::HttpTransferError &e) {
    throw utils::SynthesisException("Speech synthesis failed", e.what());
  }

  if (!response.ok()) {
    throw utils::SynthesisException("Speech synthesis failed",
                                    "HTTP " + std::to_string(response.status) +
                                        ": " + response.body);
  }
}

} // namespace tts
} // namespace printvoice
