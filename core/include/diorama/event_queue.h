// EventQueue - Hand work from background threads to the main thread
//
// Worker threads post closures; the main loop drains them once per frame.
// Everything posted runs on the thread that calls drain(), in post order.
//
// Usage:
//   EventQueue queue;
//   std::thread worker([&] { auto node = parse(); queue.post([n = std::move(node)] { ... }); });
//
//   while (running) {
//       queue.drain();   // callbacks run here, on the main thread
//       render();
//   }

#pragma once

#include <functional>
#include <mutex>
#include <vector>

namespace diorama {

class EventQueue {
public:
    using Task = std::function<void()>;

    EventQueue() = default;

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// Enqueue a task. Safe to call from any thread.
    void post(Task task);

    /// Run all tasks posted so far. Main thread only.
    /// Tasks posted while draining run on the next drain().
    /// @return Number of tasks executed
    size_t drain();

    /// Number of tasks waiting to run
    size_t pending() const;

private:
    mutable std::mutex m_mutex;
    std::vector<Task> m_writeBuffer;
    std::vector<Task> m_readBuffer;
};

} // namespace diorama
