#include "stt/progress_poller.hpp"

#include <iostream>
#include <utility>

// Constructor
ProgressPoller::ProgressPoller(const std::atomic<int>& cell, ProgressSink sink, std::chrono::milliseconds interval)
    : cell_(cell), sink_(std::move(sink)), interval_(interval) {}

// Destructor
ProgressPoller::~ProgressPoller() { stop(); }

// Starts the polling thread
void ProgressPoller::start() {
    if (!sink_) return;
    if (running_.exchange(true)) return;
    thread_ = std::thread(&ProgressPoller::run, this);
}

// Stops the polling thread and waits for it to exit
void ProgressPoller::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) return;
    }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();
}

std::string ProgressPoller::statusLine(int percent) {
    return "Transcribing... " + std::to_string(percent) + "%";
}

void ProgressPoller::run() {
    int lastEmitted = -1;

    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load()) {
        wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
        if (!running_.load()) break;

        const int current = cell_.load(std::memory_order_relaxed);
        if (current == lastEmitted || current <= 0 || current > 100) continue;
        lastEmitted = current;

        lock.unlock();
        try {
            sink_(statusLine(current));
        } catch (const std::exception& e) {
            std::cerr << "[Progress] [ERROR] progress sink threw: " << e.what() << std::endl;
        }
        lock.lock();
    }
}
