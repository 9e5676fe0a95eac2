#pragma once

#include "tts/speech_synthesis_client.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace printvoice {
namespace tts {

/**
 * SpeechSynthesisClient backed by the ElevenLabs streaming endpoint
 */
class ElevenLabsClient : public SpeechSynthesisClient {
public:
  explicit ElevenLabsClient(const utils::SynthesisSettings &settings);

  void streamSynthesis(const std::string &text, const ChunkCallback &onChunk,
                       const utils::CancellationToken &cancel) override;

  std::string buildRequestBody(const std::string &text) const;
  std::string streamUrl() const;

private:
  utils::SynthesisSettings settings_;
  utils::HttpClient http_;
};

} // namespace tts
} // namespace printvoice
