#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

//thread safe queue, the channel worker pushes outcomes here and the main thread pops them
template <typename T>
class TSQueue {
public:
    void push(T v) {
        { std::lock_guard<std::mutex> lk(m_); q_.push(std::move(v)); }
        cv_.notify_one();
    }

    // waits at most `timeout` for an item, false if none arrived
    bool pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        if (!cv_.wait_for(lk, timeout, [&]{ return !q_.empty(); })) return false;
        out = std::move(q_.front()); q_.pop(); return true;
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::queue<T> q_;
};
