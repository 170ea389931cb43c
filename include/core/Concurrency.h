/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#ifndef INCLUDED_mxfar_core_Concurrency_h
#define INCLUDED_mxfar_core_Concurrency_h

#include <boost/any.hpp>

#include <algorithm>
#include <functional>
#include <future>
#include <type_traits>
#include <vector>

namespace mxfar {
namespace core {
namespace concurrency_detail {
template<typename FUNCTION, typename BOUND_STATE>
struct SCallableWithBoundState {
    SCallableWithBoundState(FUNCTION&& function, BOUND_STATE&& functionState)
        : s_Function{std::forward<FUNCTION>(function)},
          s_FunctionState{std::forward<BOUND_STATE>(functionState)} {}
    template<typename... ARGS>
    void operator()(ARGS&&... args) const {
        s_Function(s_FunctionState, std::forward<ARGS>(args)...);
    }

    mutable std::decay_t<FUNCTION> s_Function;
    mutable std::decay_t<BOUND_STATE> s_FunctionState;
};
}

//! Bind **retrievable** state by copy to an arbitrary Callable.
//!
//! Each partition of parallel_for_each gets its own copy of the state which
//! can be read back from the returned function objects, for example
//! \code{.cpp}
//! auto results = parallel_for_each(0, n, bindRetrievableState(
//!     [&](double& sum, std::size_t i) { sum += values[i]; }, 0.0));
//! double total{0.0};
//! for (const auto& result : results) {
//!     total += result.s_FunctionState;
//! }
//! \endcode
//!
//! The state is always supplied as the first argument to the Callable.
template<typename FUNCTION, typename STATE>
auto bindRetrievableState(FUNCTION&& function, STATE&& state) {
    return concurrency_detail::SCallableWithBoundState<FUNCTION, STATE>(
        std::forward<FUNCTION>(function), std::forward<STATE>(state));
}

//! \brief The base executor hierarchy.
class CExecutor {
public:
    virtual ~CExecutor() = default;
    virtual void schedule(std::packaged_task<boost::any()>&& f) = 0;
    virtual bool busy() const = 0;
    virtual void busy(bool value) = 0;
};

//! Setup the global default executor for async.
//!
//! \note This is not thread safe: call it once at the start of main or in
//! single threaded test code.
//! \note If \p threadPoolSize is zero std::thread::hardware_concurrency is
//! used to size the thread pool.
void startDefaultAsyncExecutor(std::size_t threadPoolSize = 0);

//! Shutdown the thread pool and revert to sequential execution on the
//! calling thread.
void stopDefaultAsyncExecutor();

//! The default async executor.
//!
//! If startDefaultAsyncExecutor hasn't been called tasks run immediately
//! on the calling thread.
CExecutor& defaultAsyncExecutor();

//! Get the default async executor thread pool size.
std::size_t defaultAsyncThreadPoolSize();

namespace concurrency_detail {
template<typename F>
boost::any resultToAny(F& f, const std::false_type&) {
    return boost::any{f()};
}
template<typename F>
boost::any resultToAny(F& f, const std::true_type&) {
    f();
    return boost::any{};
}

template<typename R>
class CTypedFutureAnyWrapper {
public:
    CTypedFutureAnyWrapper() = default;
    CTypedFutureAnyWrapper(std::future<boost::any>&& future)
        : m_Future{std::move(future)} {}

    bool valid() const { return m_Future.valid(); }
    void wait() const { m_Future.wait(); }
    R get() { return boost::any_cast<R>(m_Future.get()); }

private:
    std::future<boost::any> m_Future;
};

//! \brief Marks the default executor busy for the lifetime of the object
//! unless it was already busy.
class CDefaultAsyncExecutorBusyForScope {
public:
    CDefaultAsyncExecutorBusyForScope();
    ~CDefaultAsyncExecutorBusyForScope();
    CDefaultAsyncExecutorBusyForScope(const CDefaultAsyncExecutorBusyForScope&) = delete;
    CDefaultAsyncExecutorBusyForScope&
    operator=(const CDefaultAsyncExecutorBusyForScope&) = delete;

    bool wasBusy() const;

private:
    bool m_WasBusy;
};
}

template<typename R>
using future = concurrency_detail::CTypedFutureAnyWrapper<R>;

//! A version of std::async which uses a specified executor.
//!
//! \note f must be copy constructible and thread safe.
//! \note If f throws calling get on the result rethrows.
//! \warning Waiting in a task on a task enqueued after it can deadlock the
//! pool. Prefer parallel_for_each, which guards against nesting.
template<typename FUNCTION, typename... ARGS>
future<std::invoke_result_t<std::decay_t<FUNCTION>, std::decay_t<ARGS>...>>
async(CExecutor& executor, FUNCTION&& f, ARGS&&... args) {
    using R = std::invoke_result_t<std::decay_t<FUNCTION>, std::decay_t<ARGS>...>;

    // g holds copies of the arguments so it is safe to invoke later.
    auto g = std::bind<R>(std::forward<FUNCTION>(f), std::forward<ARGS>(args)...);

    std::packaged_task<boost::any()> task([g_ = std::move(g)]() mutable {
        return concurrency_detail::resultToAny(g_, std::is_same<R, void>{});
    });
    auto result = task.get_future();

    executor.schedule(std::move(task));

    return future<R>{std::move(result)};
}

//! Get the conjunction of all \p futures.
//!
//! \note This waits on every future and rethrows the first exception.
bool get_conjunction_of_all(std::vector<future<bool>>& futures);

//! Run \p f on each index in [\p start, \p end) using the default async
//! executor.
//!
//! \param[in] partitions The number of tasks into which to partition the range.
//! \param[in] start The first index for which to execute \p f.
//! \param[in] end The end of the indices for which to execute \p f.
//! \param[in,out] f The function to execute on each index. This is expected
//! to be a Callable equivalent to std::function<void(std::size_t)>.
//! \return One copy of \p f per partition.
//! \note f must be copy constructible and thread safe.
//! \note If f throws this will throw.
template<typename FUNCTION>
std::vector<std::decay_t<FUNCTION>>
parallel_for_each(std::size_t partitions, std::size_t start, std::size_t end, FUNCTION&& f) {

    using TFunction = std::decay_t<FUNCTION>;

    if (end <= start) {
        return {std::forward<FUNCTION>(f)};
    }

    partitions = std::min(partitions, end - start);

    // Waiting here on tasks queued in the pool from inside a pool task can
    // deadlock. If the pool is already in use further up the stack we run
    // this range sequentially on the calling thread.
    concurrency_detail::CDefaultAsyncExecutorBusyForScope scope{};

    if (partitions < 2 || scope.wasBusy()) {
        for (std::size_t i = start; i < end; ++i) {
            f(i);
        }
        return {std::forward<FUNCTION>(f)};
    }

    std::vector<TFunction> functions(partitions, TFunction{std::forward<FUNCTION>(f)});

    // Partition j visits indices j, j + m, j + 2m, ... for m partitions. This
    // keeps the threads working on nearby elements at similar times.
    std::vector<future<bool>> tasks;
    tasks.reserve(partitions);
    for (std::size_t offset = 0; offset < partitions; ++offset) {
        auto& g = functions[offset];
        tasks.emplace_back(async(defaultAsyncExecutor(),
                                 [&g, partitions](std::size_t first, std::size_t last) {
                                     for (std::size_t i = first; i < last; i += partitions) {
                                         g(i);
                                     }
                                     return true;
                                 },
                                 start + offset, end));
    }

    get_conjunction_of_all(tasks);

    return functions;
}

//! Overload with one partition per thread.
template<typename FUNCTION>
std::vector<std::decay_t<FUNCTION>>
parallel_for_each(std::size_t start, std::size_t end, FUNCTION&& f) {
    return parallel_for_each(defaultAsyncThreadPoolSize(), start, end,
                             std::forward<FUNCTION>(f));
}
}
}

#endif // INCLUDED_mxfar_core_Concurrency_h
