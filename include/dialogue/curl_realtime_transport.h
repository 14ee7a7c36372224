#pragma once

#include "config.h"
#include "dialogue/realtime_transport.h"
#include <memory>

namespace taco {
namespace dialogue {

/**
 * @brief WebSocket transport on libcurl's ws API (CURLOPT_CONNECT_ONLY = 2)
 *
 * Authenticates with "Authorization: Bearer <key>" and "OpenAI-Beta:
 * realtime=v1". Fragmented frames are reassembled before receive() returns.
 *
 * Thread Safety:
 * - send(), receive() and close() may be called concurrently; curl calls are
 *   serialized internally and receive() waits for readability outside the lock.
 */
class CurlRealtimeTransport : public IRealtimeTransport {
public:
    explicit CurlRealtimeTransport(const RealtimeConfig& config);
    ~CurlRealtimeTransport() override;

    CurlRealtimeTransport(const CurlRealtimeTransport&) = delete;
    CurlRealtimeTransport& operator=(const CurlRealtimeTransport&) = delete;

    Result<void> connect() override;
    Result<void> send(const std::string& message) override;
    Received receive(int timeout_ms) override;
    void close() override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace dialogue
} // namespace taco
