#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace hostwatch {

// Cooperative stop flag shared by the poll loop, probe batches and child
// process supervision. cancel() is safe to call from any thread; the signal
// handler path only touches the atomic (see request_cancel).
class CancellationToken {
public:
    void cancel(){
        flag_.store(true);
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    }
    // Async-signal-safe: sets the flag only. Sleepers notice it on their next
    // wakeup slice.
    void request_cancel() noexcept { flag_.store(true); }

    bool cancelled() const { return flag_.load(); }

    // Sleeps up to d; returns true when cancelled before or during the wait.
    template<class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep,Period> d){
        auto deadline = std::chrono::steady_clock::now() + d;
        std::unique_lock<std::mutex> lock(mutex_);
        while(!flag_.load()){
            auto now = std::chrono::steady_clock::now();
            if(now >= deadline) return false;
            auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(100));
            cv_.wait_for(lock, slice);
        }
        return true;
    }
private:
    std::atomic<bool> flag_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}
