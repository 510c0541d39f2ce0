#include <diorama/event_queue.h>

namespace diorama {

void EventQueue::post(Task task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_writeBuffer.push_back(std::move(task));
}

size_t EventQueue::drain() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_writeBuffer.empty()) return 0;
        std::swap(m_readBuffer, m_writeBuffer);
    }

    // Run outside the lock so tasks may post follow-up work
    size_t count = m_readBuffer.size();
    for (auto& task : m_readBuffer) {
        task();
    }
    m_readBuffer.clear();
    return count;
}

size_t EventQueue::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writeBuffer.size();
}

} // namespace diorama
