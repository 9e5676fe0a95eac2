#include "tts/speech_synthesis_streamer.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace tts {

SpeechSynthesisStreamer::SpeechSynthesisStreamer(
    std::shared_ptr<SpeechSynthesisClient> client)
    : client_(std::move(client)) {}

size_t SpeechSynthesisStreamer::stream(const std::string &text,
                                       const EventSink &emit,
                                       const utils::CancellationToken &cancel) {
  size_t delivered = 0;
  size_t received = 0;

  client_->streamSynthesis(
      text,
      [&](const uint8_t *data, size_t size) {
        if (size == 0) {
          return;
        }
        received++;
        core::AudioChunkMessage chunk(std::vector<uint8_t>(data, data + size));
        if (emit(chunk)) {
          delivered++;
        }
      },
      cancel);

  if (!emit(core::AudioCompleteMessage())) {
    utils::Logger::debug("audio_complete not delivered");
  }

  if (delivered != received) {
    utils::Logger::warn("Delivered " + std::to_string(delivered) + " of " +
                        std::to_string(received) + " audio chunks");
  }
  return delivered;
}

} // namespace tts
} // namespace printvoice
