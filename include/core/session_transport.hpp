#pragma once

#include <string>

namespace printvoice {
namespace core {

enum class Delivery {
    RELIABLE,
    // May be discarded under backpressure without failing the connection
    BEST_EFFORT
};

/**
 * Outbound half of one client connection. Implementations must be safe to
 * call from any thread; sends are best-effort and never throw.
 */
class SessionTransport {
public:
    virtual ~SessionTransport() = default;

    // Returns false if the connection is closed or the send failed
    virtual bool send(const std::string& payload, Delivery delivery) = 0;

    virtual void close(int code, const std::string& reason) = 0;

    virtual bool isOpen() const = 0;
};

} // namespace core
} // namespace printvoice
