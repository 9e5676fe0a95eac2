#pragma once

#include "utils/cancellation.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace printvoice {
namespace tts {

/**
 * Abstract interface for streaming Text-to-Speech services
 */
class SpeechSynthesisClient {
public:
  using ChunkCallback = std::function<void(const uint8_t *data, size_t size)>;

  virtual ~SpeechSynthesisClient() = default;

  /**
   * Synthesize speech and deliver encoded audio as it is produced
   * @param text Text to synthesize
   * @param onChunk Called once per received block, in arrival order
   * @param cancel Aborts the synthesis when set
   * @throws utils::SynthesisException if the service rejects the request
   */
  virtual void streamSynthesis(const std::string &text,
                               const ChunkCallback &onChunk,
                               const utils::CancellationToken &cancel) = 0;
};

} // namespace tts
} // namespace printvoice
