/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>

namespace mxfar {
namespace core {
namespace {
std::size_t computeSize(std::size_t hint) {
    std::size_t bound{std::thread::hardware_concurrency()};
    std::size_t size{bound > 0 ? std::min(hint, bound) : hint};
    return std::max(size, std::size_t{1});
}
}

CStaticThreadPool::CStaticThreadPool(std::size_t size) : m_Busy{false} {
    size = computeSize(size);
    m_Pool.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        try {
            m_Pool.emplace_back([this] { this->worker(); });
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to start worker " << i << ": " << e.what());
            this->shutdown();
            throw;
        }
    }
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

std::size_t CStaticThreadPool::size() const {
    return m_Pool.size();
}

void CStaticThreadPool::schedule(TTask&& task) {
    m_TaskQueue.push(CWrappedTask{std::forward<TTask>(task)});
}

bool CStaticThreadPool::busy() const {
    return m_Busy.load();
}

void CStaticThreadPool::busy(bool value) {
    m_Busy.store(value);
}

void CStaticThreadPool::shutdown() {
    // One shutdown marker per running worker.
    for (std::size_t i = 0; i < m_Pool.size(); ++i) {
        m_TaskQueue.push(CWrappedTask{});
    }
    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    while (true) {
        CWrappedTask task{m_TaskQueue.pop()};
        if (task.isShutdown()) {
            break;
        }
        task();
    }
}

CStaticThreadPool::CWrappedTask::CWrappedTask(TTask&& task)
    : m_Task{std::forward<TTask>(task)} {
}

bool CStaticThreadPool::CWrappedTask::isShutdown() const {
    return m_Task == nullptr;
}

void CStaticThreadPool::CWrappedTask::operator()() {
    try {
        m_Task();
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Failed executing task with error '" << e.what() << "'");
    }
}
}
}
