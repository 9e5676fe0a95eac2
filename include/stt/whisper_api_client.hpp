#pragma once

#include "stt/transcription_client.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace printvoice {
namespace stt {

// TranscriptionClient backed by the OpenAI audio transcription endpoint
class WhisperApiClient : public TranscriptionClient {
public:
    explicit WhisperApiClient(const utils::TranscriptionSettings& settings);

    std::string transcribe(const std::vector<uint8_t>& audio,
                           const utils::CancellationToken& cancel) override;

    static std::string extractText(const std::string& responseBody);

private:
    utils::TranscriptionSettings settings_;
    utils::HttpClient http_;
};

} // namespace stt
} // namespace printvoice
