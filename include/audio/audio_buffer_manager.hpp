#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string_view>
#include <vector>

namespace printvoice {
namespace audio {

/**
 * AudioBufferManager - bounded, order-preserving store of the raw audio
 * chunks a client streams between start_recording and stop_recording.
 *
 * The buffer is a sliding window over the most recent maxChunks chunks: when
 * full, the single oldest chunk is evicted before the new one is appended.
 * Overflow is never reported as an error. Chunks are opaque (the client's
 * container format, typically webm/opus) and are concatenated verbatim on
 * drain.
 */
class AudioBufferManager {
public:
  struct Statistics {
    size_t acceptedChunks = 0;
    size_t evictedChunks = 0;
    size_t drainedChunks = 0;
    size_t currentChunks = 0;
    size_t currentBytes = 0;
  };

  explicit AudioBufferManager(size_t maxChunks = 1000);

  AudioBufferManager(const AudioBufferManager &) = delete;
  AudioBufferManager &operator=(const AudioBufferManager &) = delete;

  /**
   * Append a chunk. Returns true if an older chunk had to be evicted.
   */
  bool accept(std::string_view chunk);

  /**
   * Concatenate all buffered chunks in arrival order and clear the buffer.
   */
  std::vector<uint8_t> drain();

  void clear();

  size_t chunkCount() const;
  size_t byteCount() const;
  bool empty() const;
  size_t getMaxChunks() const { return maxChunks_; }

  // Copy of the buffered chunks, oldest first
  std::vector<std::vector<uint8_t>> snapshot() const;

  Statistics getStatistics() const;

private:
  const size_t maxChunks_;

  mutable std::mutex mutex_;
  std::deque<std::vector<uint8_t>> chunks_;
  size_t bufferedBytes_;
  Statistics stats_;
};

} // namespace audio
} // namespace printvoice
