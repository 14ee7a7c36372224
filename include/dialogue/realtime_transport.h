#pragma once

#include "errors.h"
#include <string>

namespace taco {
namespace dialogue {

/**
 * @brief Outcome of a receive() call
 */
struct Received {
    enum class Status {
        Message,  ///< text holds one complete message
        Timeout,  ///< nothing arrived within the timeout
        Closed    ///< remote closed or the connection failed; no further messages
    };

    Status status = Status::Timeout;
    std::string text;
};

/**
 * @brief Full-duplex message channel to the cloud dialogue engine
 *
 * send() and receive() are called from different threads (uplink and
 * downlink loops); close() may be called from a third and must unblock both.
 */
class IRealtimeTransport {
public:
    virtual ~IRealtimeTransport() = default;

    virtual Result<void> connect() = 0;

    virtual Result<void> send(const std::string& message) = 0;

    virtual Received receive(int timeout_ms) = 0;

    /**
     * @brief Close the channel (idempotent)
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace dialogue
} // namespace taco
