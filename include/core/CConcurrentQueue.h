/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CConcurrentQueue_h
#define INCLUDED_mxfar_core_CConcurrentQueue_h

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace mxfar {
namespace core {

//! \brief A thread safe multi-producer multi-consumer bounded queue.
//!
//! DESCRIPTION:\n
//! Pushing to a full queue blocks until a consumer pops and popping from
//! an empty queue blocks until a producer pushes. It is the caller's
//! responsibility to ensure the number of items pushed equals the number
//! popped or this will deadlock.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The work units scheduled through this queue, fitting a grid cell or
//! refitting a bootstrap replicate, are coarse so a single mutex is not a
//! bottleneck.
//!
//! \tparam T the type of the objects of the queue.
//! \tparam CAPACITY the maximum number of queued objects.
template<typename T, std::size_t CAPACITY>
class CConcurrentQueue final {
public:
    CConcurrentQueue() = default;
    CConcurrentQueue(const CConcurrentQueue&) = delete;
    CConcurrentQueue& operator=(const CConcurrentQueue&) = delete;

    //! Add \p value blocking while the queue is full.
    void push(T value) {
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_NotFull.wait(lock, [this] { return m_Queue.size() < CAPACITY; });
            m_Queue.push_back(std::move(value));
        }
        m_NotEmpty.notify_one();
    }

    //! Remove the front value blocking while the queue is empty.
    T pop() {
        T result;
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_NotEmpty.wait(lock, [this] { return m_Queue.empty() == false; });
            result = std::move(m_Queue.front());
            m_Queue.pop_front();
        }
        m_NotFull.notify_one();
        return result;
    }

    //! Get the number of queued values.
    std::size_t size() const {
        std::unique_lock<std::mutex> lock{m_Mutex};
        return m_Queue.size();
    }

private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_NotEmpty;
    std::condition_variable m_NotFull;
    std::deque<T> m_Queue;
};
}
}

#endif // INCLUDED_mxfar_core_CConcurrentQueue_h
