#ifndef PROGRESS_POLLER_HPP
#define PROGRESS_POLLER_HPP

#include "stt/segment.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

// Samples a progress cell on a fixed interval and forwards a status line
// only when the value changed. The native callback writes the cell; the
// sink is only ever called from this thread.
class ProgressPoller {
public:
    ProgressPoller(const std::atomic<int>& cell, ProgressSink sink,
                   std::chrono::milliseconds interval = std::chrono::milliseconds(200));
    ~ProgressPoller();

    ProgressPoller(const ProgressPoller&) = delete;
    ProgressPoller& operator=(const ProgressPoller&) = delete;

    void start();
    void stop();

    static std::string statusLine(int percent);

private:
    void run();

    const std::atomic<int>& cell_;
    ProgressSink sink_;
    std::chrono::milliseconds interval_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

#endif
