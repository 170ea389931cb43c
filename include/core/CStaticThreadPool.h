/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CStaticThreadPool_h
#define INCLUDED_mxfar_core_CStaticThreadPool_h

#include <core/CConcurrentQueue.h>
#include <core/CNonCopyable.h>

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

namespace mxfar {
namespace core {

//! \brief A minimal fixed size thread pool for implementing CThreadPoolExecutor.
//!
//! IMPLEMENTATION:\n
//! This purposely has a very limited interface. The rest of the code uses
//! the pool through core::async and core::parallel_for_each.
class CStaticThreadPool : private CNonCopyable {
public:
    using TTask = std::function<void()>;

public:
    explicit CStaticThreadPool(std::size_t size);
    ~CStaticThreadPool();

    //! Get the number of threads in the pool.
    std::size_t size() const;

    //! Schedule a Callable type to be executed by a thread in the pool.
    //!
    //! \note This can block if the task queue is full, which exerts back
    //! pressure on the scheduling thread.
    void schedule(TTask&& task);

    //! Check if the thread pool has been marked as busy.
    bool busy() const;

    //! Mark the thread pool as busy or free.
    void busy(bool busy);

private:
    class CWrappedTask {
    public:
        CWrappedTask() = default;
        explicit CWrappedTask(TTask&& task);

        //! A task without a callable tells the worker to exit.
        bool isShutdown() const;
        void operator()();

    private:
        TTask m_Task;
    };
    using TWrappedTaskQueue = CConcurrentQueue<CWrappedTask, 128>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();

private:
    std::atomic_bool m_Busy;
    TWrappedTaskQueue m_TaskQueue;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_mxfar_core_CStaticThreadPool_h
