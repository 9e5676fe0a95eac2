#include "audio/audio_buffer_manager.hpp"
#include "utils/logging.hpp"

namespace printvoice {
namespace audio {

AudioBufferManager::AudioBufferManager(size_t maxChunks)
    : maxChunks_(maxChunks == 0 ? 1 : maxChunks), bufferedBytes_(0) {}

bool AudioBufferManager::accept(std::string_view chunk) {
  std::lock_guard<std::mutex> lock(mutex_);

  bool evicted = false;
  if (chunks_.size() >= maxChunks_) {
    bufferedBytes_ -= chunks_.front().size();
    chunks_.pop_front();
    stats_.evictedChunks++;
    evicted = true;
  }

  chunks_.emplace_back(chunk.begin(), chunk.end());
  bufferedBytes_ += chunk.size();
  stats_.acceptedChunks++;

  if (evicted) {
    utils::Logger::warn("Maximum audio chunks reached (" +
                        std::to_string(maxChunks_) +
                        "), discarded oldest chunk");
  }
  return evicted;
}

std::vector<uint8_t> AudioBufferManager::drain() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<uint8_t> audio;
  audio.reserve(bufferedBytes_);
  for (const auto &chunk : chunks_) {
    audio.insert(audio.end(), chunk.begin(), chunk.end());
  }

  stats_.drainedChunks += chunks_.size();
  chunks_.clear();
  bufferedBytes_ = 0;
  return audio;
}

void AudioBufferManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_.clear();
  bufferedBytes_ = 0;
}

size_t AudioBufferManager::chunkCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

size_t AudioBufferManager::byteCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bufferedBytes_;
}

bool AudioBufferManager::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.empty();
}

std::vector<std::vector<uint8_t>> AudioBufferManager::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::vector<uint8_t>>(chunks_.begin(), chunks_.end());
}

AudioBufferManager::Statistics AudioBufferManager::getStatistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statistics stats = stats_;
  stats.currentChunks = chunks_.size();
  stats.currentBytes = bufferedBytes_;
  return stats;
}

} // namespace audio
} // namespace printvoice
