#pragma once
#include <queue>
#include <mutex>
#include <condition_variable>
#include <cstddef>
#include <utility>

template <typename T>
class WorkQueue {
private:
    std::queue<T> items;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool finished = false;

public:
    void push(T item) {
        std::lock_guard<std::mutex> lock(mtx);
        items.push(std::move(item));
        cv.notify_one();
    }

    // Blocks until an item is available. Returns false once the queue is
    // finished and drained.
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return !items.empty() || finished; });

        if (items.empty()) {
            return false; // No more work
        }

        item = std::move(items.front());
        items.pop();
        return true;
    }

    void mark_finished() {
        std::lock_guard<std::mutex> lock(mtx);
        finished = true;
        cv.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }
};
