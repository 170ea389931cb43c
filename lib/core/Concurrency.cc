/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/Concurrency.h>

#include <core/CLogger.h>
#include <core/CStaticThreadPool.h>

#include <memory>
#include <thread>

namespace mxfar {
namespace core {
namespace {
//! \brief Executes a function immediately (on the calling thread).
class CImmediateExecutor final : public CExecutor {
public:
    void schedule(std::packaged_task<boost::any()>&& f) override { f(); }
    bool busy() const override { return false; }
    void busy(bool) override {}
};

//! \brief Executes a function in a thread pool.
class CThreadPoolExecutor final : public CExecutor {
public:
    explicit CThreadPoolExecutor(std::size_t size) : m_ThreadPool{size} {}

    void schedule(std::packaged_task<boost::any()>&& f) override {
        // std::function needs a copyable target.
        auto task = std::make_shared<std::packaged_task<boost::any()>>(std::move(f));
        m_ThreadPool.schedule([task] { (*task)(); });
    }
    bool busy() const override { return m_ThreadPool.busy(); }
    void busy(bool value) override { m_ThreadPool.busy(value); }

    std::size_t size() const { return m_ThreadPool.size(); }

private:
    CStaticThreadPool m_ThreadPool;
};

class CExecutorHolder {
public:
    CExecutorHolder()
        : m_ThreadPoolSize{0}, m_Executor{std::make_unique<CImmediateExecutor>()} {}

    static CExecutorHolder makeThreadPool(std::size_t threadPoolSize) {
        if (threadPoolSize == 0) {
            threadPoolSize = std::thread::hardware_concurrency();
        }

        if (threadPoolSize > 0) {
            try {
                return CExecutorHolder{threadPoolSize};
            } catch (const std::exception& e) {
                LOG_ERROR(<< "Failed to create thread pool with '" << e.what()
                          << "'. Falling back to running single threaded");
            }
        } else {
            LOG_ERROR(<< "Failed to determine hardware concurrency and no "
                      << "thread count provided. Falling back to running "
                      << "single threaded");
        }

        return CExecutorHolder{};
    }

    CExecutor& get() const { return *m_Executor; }
    std::size_t threadPoolSize() const { return m_ThreadPoolSize; }

private:
    explicit CExecutorHolder(std::size_t threadPoolSize) {
        auto executor = std::make_unique<CThreadPoolExecutor>(threadPoolSize);
        m_ThreadPoolSize = executor->size();
        m_Executor = std::move(executor);
    }

private:
    std::size_t m_ThreadPoolSize;
    std::unique_ptr<CExecutor> m_Executor;
};

CExecutorHolder& singletonExecutor() {
    static CExecutorHolder executor;
    return executor;
}
}

void startDefaultAsyncExecutor(std::size_t threadPoolSize) {
    // Not thread safe: only called from main or single threaded test code.
    singletonExecutor() = CExecutorHolder::makeThreadPool(threadPoolSize);
    LOG_DEBUG(<< "Started default executor with "
              << singletonExecutor().threadPoolSize() << " threads");
}

void stopDefaultAsyncExecutor() {
    singletonExecutor() = CExecutorHolder{};
}

std::size_t defaultAsyncThreadPoolSize() {
    return singletonExecutor().threadPoolSize();
}

CExecutor& defaultAsyncExecutor() {
    return singletonExecutor().get();
}

bool get_conjunction_of_all(std::vector<future<bool>>& futures) {
    // Every task must finish before we rethrow since they may reference
    // state owned by the caller.
    for (const auto& future : futures) {
        future.wait();
    }
    bool conjunction{true};
    for (auto& future : futures) {
        bool value{future.get()};
        conjunction = conjunction && value;
    }
    return conjunction;
}

namespace concurrency_detail {
CDefaultAsyncExecutorBusyForScope::CDefaultAsyncExecutorBusyForScope()
    : m_WasBusy{defaultAsyncExecutor().busy()} {
    if (m_WasBusy == false) {
        defaultAsyncExecutor().busy(true);
    }
}

CDefaultAsyncExecutorBusyForScope::~CDefaultAsyncExecutorBusyForScope() {
    if (m_WasBusy == false) {
        defaultAsyncExecutor().busy(false);
    }
}

bool CDefaultAsyncExecutorBusyForScope::wasBusy() const {
    return m_WasBusy;
}
}
}
}
