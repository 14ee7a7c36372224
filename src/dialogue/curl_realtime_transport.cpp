#include "dialogue/curl_realtime_transport.h"
#include "dialogue/realtime_protocol.h"
#include "logger.h"
#include <curl/curl.h>
#include <poll.h>
#include <algorithm>
#include <mutex>

namespace taco {
namespace dialogue {

class CurlRealtimeTransport::Impl {
public:
    explicit Impl(const RealtimeConfig& config) : config_(config) {}

    ~Impl() {
        close();
    }

    Result<void> connect() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_) return Result<void>();

        curl_ = curl_easy_init();
        if (!curl_) {
            return make_network_error("Failed to initialize CURL");
        }

        const std::string url = protocol::session_url(config_);
        const std::string auth = "Authorization: Bearer " + config_.api_key;
        headers_ = curl_slist_append(headers_, auth.c_str());
        headers_ = curl_slist_append(headers_, "OpenAI-Beta: realtime=v1");

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);  // WebSocket upgrade, then hand-driven I/O
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

        LOG_SESSION("Connecting to " + url);
        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            std::string msg = curl_easy_strerror(res);
            release_locked();
            return make_network_error("Realtime connect failed: " + msg);
        }

        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        if (status != 101) {
            release_locked();
            return make_network_error("Realtime upgrade rejected (HTTP " + std::to_string(status) + ")");
        }

        curl_socket_t sock = CURL_SOCKET_BAD;
        if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK || sock == CURL_SOCKET_BAD) {
            release_locked();
            return make_network_error("Realtime connection has no active socket");
        }

        socket_ = sock;
        open_ = true;
        LOG_EVENT("REALTIME_INIT", "Realtime connection established");
        return Result<void>();
    }

    Result<void> send(const std::string& message) {
        size_t offset = 0;
        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!open_) {
                    return make_network_error("Realtime connection is closed");
                }
                while (offset < message.size()) {
                    size_t sent = 0;
                    CURLcode res = curl_ws_send(curl_, message.data() + offset, message.size() - offset,
                                                &sent, 0, CURLWS_TEXT);
                    offset += sent;
                    if (res == CURLE_AGAIN) break;
                    if (res != CURLE_OK) {
                        open_ = false;
                        return make_network_error(std::string("Realtime send failed: ") + curl_easy_strerror(res));
                    }
                }
                if (offset >= message.size()) {
                    return Result<void>();
                }
            }
            wait_socket(POLLOUT, 50);
        }
    }

    Received receive(int timeout_ms) {
        Received out;
        TimePoint deadline = Clock::now() + Duration(timeout_ms);
        char buffer[16384];

        while (true) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!open_) {
                    out.status = Received::Status::Closed;
                    return out;
                }

                while (true) {
                    size_t received = 0;
                    const struct curl_ws_frame* meta = nullptr;
                    CURLcode res = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);
                    if (res == CURLE_AGAIN) break;
                    if (res != CURLE_OK) {
                        LOG_SESSION(std::string("Realtime receive failed: ") + curl_easy_strerror(res));
                        open_ = false;
                        out.status = Received::Status::Closed;
                        return out;
                    }
                    if (!meta) continue;
                    if (meta->flags & CURLWS_CLOSE) {
                        LOG_SESSION("Realtime connection closed by server");
                        open_ = false;
                        out.status = Received::Status::Closed;
                        return out;
                    }
                    if (meta->flags & (CURLWS_PING | CURLWS_PONG)) continue;

                    pending_.append(buffer, received);
                    if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
                        out.status = Received::Status::Message;
                        out.text.swap(pending_);
                        return out;
                    }
                }
            }

            int64_t remaining = ms_between(Clock::now(), deadline);
            if (remaining <= 0) {
                out.status = Received::Status::Timeout;
                return out;
            }
            wait_socket(POLLIN, static_cast<int>(std::min<int64_t>(remaining, 50)));
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!curl_) return;
        if (open_) {
            size_t sent = 0;
            curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
            LOG_EVENT("REALTIME_STOP", "Realtime connection closed");
        }
        release_locked();
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

private:
    // The socket may be closed concurrently; poll then reports POLLNVAL and the
    // next locked section sees open_ == false.
    void wait_socket(short events, int timeout_ms) {
        curl_socket_t sock;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return;
            sock = socket_;
        }
        struct pollfd pfd;
        pfd.fd = sock;
        pfd.events = events;
        pfd.revents = 0;
        poll(&pfd, 1, timeout_ms);
    }

    void release_locked() {
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        if (headers_) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        socket_ = CURL_SOCKET_BAD;
        open_ = false;
        pending_.clear();
    }

    RealtimeConfig config_;
    mutable std::mutex mutex_;
    CURL* curl_ = nullptr;
    struct curl_slist* headers_ = nullptr;
    curl_socket_t socket_ = CURL_SOCKET_BAD;
    bool open_ = false;
    std::string pending_;
};

CurlRealtimeTransport::CurlRealtimeTransport(const RealtimeConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

CurlRealtimeTransport::~CurlRealtimeTransport() = default;

Result<void> CurlRealtimeTransport::connect() {
    return pimpl_->connect();
}

Result<void> CurlRealtimeTransport::send(const std::string& message) {
    return pimpl_->send(message);
}

Received CurlRealtimeTransport::receive(int timeout_ms) {
    return pimpl_->receive(timeout_ms);
}

void CurlRealtimeTransport::close() {
    pimpl_->close();
}

bool CurlRealtimeTransport::is_open() const {
    return pimpl_->is_open();
}

} // namespace dialogue
} // namespace taco
