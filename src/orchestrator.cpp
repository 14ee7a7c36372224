#include "orchestrator.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

namespace taco {

class Orchestrator::Impl {
public:
    Impl(const Config& config,
         wake::WakeWordListener& listener,
         music::MusicEngine& music,
         audio::SoundPlayer& sounds,
         SessionFactory session_factory)
        : config_(config), listener_(listener), music_(music), sounds_(sounds),
          session_factory_(std::move(session_factory)), running_(true) {}

    ~Impl() {
        cleanup();
    }

    int run() {
        LOG_ORCH("=== Taco Assistant Started ===");
        LOG_ORCH("Say '" + config_.wake_word.keyword_name + "' to start a conversation");

        while (running_) {
            if (!run_cycle() && running_ && !listener_.is_listening()) {
                // Listener could not start (device busy or failed); back off before retrying
                std::this_thread::sleep_for(std::chrono::milliseconds(WAKE_RETRY_DELAY_MS));
            }
        }

        LOG_ORCH("Shutting down");
        cleanup();
        return 0;
    }

    bool run_cycle() {
        if (!running_) return false;

        auto keyword = listener_.poll();
        if (!keyword) {
            return false;
        }
        listener_.stop();
        LOG_ORCH("Wake word '" + *keyword + "' detected, starting conversation");

        if (sounds_.play(config_.sounds.acknowledgment, "acknowledgment")) {
            pause_ms(config_.sounds.post_cue_delay_ms);
        }
        if (!running_) return true;

        run_conversation();
        if (!running_) return true;

        music::MusicStatus status = music_.get_status();
        if (status.is_playing && !status.is_paused) {
            LOG_ORCH("Music is playing, skipping transition sound");
        } else if (sounds_.play(config_.sounds.transition, "transition")) {
            pause_ms(config_.sounds.post_cue_delay_ms);
        }

        LOG_ORCH("Returning to wake word detection");
        return true;
    }

    void request_stop() {
        if (!running_.exchange(false)) return;
        LOG_ORCH("Stop requested");
        std::lock_guard<std::mutex> lock(session_mutex_);
        if (session_) {
            session_->stop();
        }
    }

    bool is_running() const {
        return running_;
    }

    void cleanup() {
        if (cleaned_up_.exchange(true)) return;
        running_ = false;

        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (session_) {
                session_->stop();
            }
        }
        listener_.stop();
        music_.cleanup();
        LOG_ORCH("Cleanup complete");
    }

private:
    static constexpr int WAKE_RETRY_DELAY_MS = 500;

    void run_conversation() {
        std::shared_ptr<dialogue::DialogueSession> session;
        try {
            session = std::shared_ptr<dialogue::DialogueSession>(session_factory_());
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Failed to create conversation session: ") + e.what());
            return;
        }
        if (!session) {
            LOG_ERROR("Failed to create conversation session");
            return;
        }

        {
            // Same lock as request_stop(): a stop issued during session creation is seen here
            std::lock_guard<std::mutex> lock(session_mutex_);
            if (!running_) {
                LOG_ORCH("Stop requested before the conversation started");
                return;
            }
            session_ = session;
        }

        auto done = std::async(std::launch::async, [session] { return session->start(); });

        const auto timeout = Duration(config_.conversation.conversation_timeout_ms);
        if (done.wait_for(timeout) == std::future_status::timeout) {
            LOG_EVENT("CONVERSATION_TIMEOUT", "Conversation exceeded " +
                      std::to_string(config_.conversation.conversation_timeout_ms) +
                      "ms, ending session");
            session->stop();
        }

        Result<void> result = done.get();
        if (result.is_error()) {
            LOG_ERROR("Conversation failed: " + result.error().message);
        } else {
            LOG_ORCH(std::string("Conversation ended (") +
                     dialogue::end_reason_name(session->end_reason()) + ")");
        }

        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.reset();
    }

    void pause_ms(int ms) {
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }

    Config config_;
    wake::WakeWordListener& listener_;
    music::MusicEngine& music_;
    audio::SoundPlayer& sounds_;
    SessionFactory session_factory_;

    std::atomic<bool> running_;
    std::atomic<bool> cleaned_up_{false};

    std::mutex session_mutex_;
    std::shared_ptr<dialogue::DialogueSession> session_;
};

Orchestrator::Orchestrator(const Config& config,
                           wake::WakeWordListener& listener,
                           music::MusicEngine& music,
                           audio::SoundPlayer& sounds,
                           SessionFactory session_factory)
    : pimpl_(std::make_unique<Impl>(config, listener, music, sounds, std::move(session_factory))) {}

Orchestrator::~Orchestrator() = default;

int Orchestrator::run() {
    return pimpl_->run();
}

bool Orchestrator::run_cycle() {
    return pimpl_->run_cycle();
}

void Orchestrator::request_stop() {
    pimpl_->request_stop();
}

bool Orchestrator::is_running() const {
    return pimpl_->is_running();
}

void Orchestrator::cleanup() {
    pimpl_->cleanup();
}

} // namespace taco
