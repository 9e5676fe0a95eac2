#pragma once

#include "utils/cancellation.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace printvoice {
namespace stt {

// Abstract interface for speech-to-text services
class TranscriptionClient {
public:
    virtual ~TranscriptionClient() = default;

    // Transcribe one complete recording (container-encoded audio bytes).
    // Throws utils::TranscriptionException on service failure.
    virtual std::string transcribe(const std::vector<uint8_t>& audio,
                                   const utils::CancellationToken& cancel) = 0;
};

} // namespace stt
} // namespace printvoice
