#pragma once

#include "core/message_protocol.hpp"
#include "tts/speech_synthesis_client.hpp"

#include <functional>
#include <memory>

namespace printvoice {
namespace tts {

/**
 * Relays synthesized audio to a client as audio_chunk events followed by a
 * single audio_complete.
 */
class SpeechSynthesisStreamer {
public:
  // Returns false if the event could not be delivered
  using EventSink = std::function<bool(const core::Message &)>;

  explicit SpeechSynthesisStreamer(
      std::shared_ptr<SpeechSynthesisClient> client);

  /**
   * Stream the speech for text. Each received block becomes one
   * audio_chunk event as soon as it arrives; audio_complete follows the
   * last one. Nothing is emitted after a synthesis failure.
   * @return Number of audio_chunk events delivered
   */
  size_t stream(const std::string &text, const EventSink &emit,
                const utils::CancellationToken &cancel);

private:
  std::shared_ptr<SpeechSynthesisClient> client_;
};

} // namespace tts
} // namespace printvoice
