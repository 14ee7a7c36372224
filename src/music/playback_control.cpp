#include "music/music_backends.h"
#include <chrono>

namespace taco {
namespace music {

void PlaybackControl::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
}

void PlaybackControl::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

void PlaybackControl::request_stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        paused_ = false;
    }
    cv_.notify_all();
}

bool PlaybackControl::checkpoint() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !paused_ || stop_; });
    return !stop_;
}

bool PlaybackControl::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

bool PlaybackControl::stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

void PlaybackControl::mark_finished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

bool PlaybackControl::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool PlaybackControl::wait_finished(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return finished_; });
}

} // namespace music
} // namespace taco
