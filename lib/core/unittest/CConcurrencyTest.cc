/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <boost/test/unit_test.hpp>

#include <cstring>
#include <numeric>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(CConcurrencyTest)

using namespace mxfar;

namespace {
using TIntVec = std::vector<int>;
using TSizeVec = std::vector<std::size_t>;

double throws() {
    throw std::runtime_error("don't run me");
}
}

BOOST_AUTO_TEST_CASE(testAsyncWithExecutors) {

    core::stopDefaultAsyncExecutor();

    for (auto tag : {"sequential", "parallel"}) {

        LOG_DEBUG(<< "Testing " << tag);

        auto result = core::async(core::defaultAsyncExecutor(), []() { return 42; });
        BOOST_REQUIRE_EQUAL(42, result.get());

        result = core::async(core::defaultAsyncExecutor(), [](int i) { return i; }, 43);
        BOOST_REQUIRE_EQUAL(43, result.get());

        result = core::async(core::defaultAsyncExecutor(),
                             [](int i, int j) { return i + j; }, 22, 22);
        BOOST_REQUIRE_EQUAL(44, result.get());

        core::startDefaultAsyncExecutor(2);
    }

    core::stopDefaultAsyncExecutor();
}

BOOST_AUTO_TEST_CASE(testAsyncWithExecutorsAndExceptions) {

    core::stopDefaultAsyncExecutor();

    for (auto tag : {"sequential", "parallel"}) {

        LOG_DEBUG(<< "Testing " << tag);

        auto result = core::async(core::defaultAsyncExecutor(),
                                  static_cast<double (*)()>(throws));
        BOOST_REQUIRE_THROW(result.get(), std::runtime_error);

        core::startDefaultAsyncExecutor(2);
    }

    core::stopDefaultAsyncExecutor();
}

BOOST_AUTO_TEST_CASE(testParallelForEachWithEmpty) {

    core::stopDefaultAsyncExecutor();

    TIntVec values;
    auto result = core::parallel_for_each(
        0, values.size(),
        core::bindRetrievableState(
            [&values](double& sum, std::size_t i) {
                sum += static_cast<double>(values[i]);
            },
            0.0));
    BOOST_REQUIRE_EQUAL(std::size_t{1}, result.size());
    BOOST_REQUIRE_EQUAL(0.0, result[0].s_FunctionState);
}

BOOST_AUTO_TEST_CASE(testParallelForEach) {

    core::stopDefaultAsyncExecutor();

    TIntVec values(10000);
    std::iota(values.begin(), values.end(), 0);
    double expected{std::accumulate(values.begin(), values.end(), 0.0)};

    for (auto tag : {"sequential", "parallel"}) {

        LOG_DEBUG(<< "Testing " << tag);

        auto results = core::parallel_for_each(
            0, values.size(),
            core::bindRetrievableState(
                [&values](double& sum, std::size_t i) {
                    sum += static_cast<double>(values[i]);
                },
                0.0));

        if (std::strcmp(tag, "sequential") == 0) {
            BOOST_REQUIRE_EQUAL(std::size_t{1}, results.size());
        } else {
            BOOST_REQUIRE_EQUAL(core::defaultAsyncThreadPoolSize(), results.size());
        }

        double sum{0.0};
        for (const auto& result : results) {
            LOG_TRACE(<< "partition sum = " << result.s_FunctionState);
            sum += result.s_FunctionState;
        }
        BOOST_REQUIRE_EQUAL(expected, sum);

        core::startDefaultAsyncExecutor(3);
    }

    core::stopDefaultAsyncExecutor();
}

BOOST_AUTO_TEST_CASE(testParallelForEachWritesEverySlot) {

    core::startDefaultAsyncExecutor(4);

    TSizeVec slots(1001, 0);
    core::parallel_for_each(0, slots.size(), [&slots](std::size_t i) {
        slots[i] = 2 * i + 1;
    });
    for (std::size_t i = 0; i < slots.size(); ++i) {
        BOOST_REQUIRE_EQUAL(2 * i + 1, slots[i]);
    }

    core::stopDefaultAsyncExecutor();
}

BOOST_AUTO_TEST_CASE(testNestedParallelForEach) {

    // Nested loops run sequentially in the pool's threads so this must
    // complete rather than deadlock.

    core::startDefaultAsyncExecutor(2);

    std::vector<TSizeVec> counts(8, TSizeVec(50, 0));
    core::parallel_for_each(0, counts.size(), [&counts](std::size_t i) {
        core::parallel_for_each(0, counts[i].size(),
                                [&counts, i](std::size_t j) { counts[i][j] = i + j; });
    });
    for (std::size_t i = 0; i < counts.size(); ++i) {
        for (std::size_t j = 0; j < counts[i].size(); ++j) {
            BOOST_REQUIRE_EQUAL(i + j, counts[i][j]);
        }
    }

    core::stopDefaultAsyncExecutor();
}

BOOST_AUTO_TEST_CASE(testParallelForEachWithExceptions) {

    for (std::size_t threads : {0, 2}) {
        if (threads > 0) {
            core::startDefaultAsyncExecutor(threads);
        }
        BOOST_REQUIRE_THROW(core::parallel_for_each(0, 100,
                                                    [](std::size_t i) {
                                                        if (i == 37) {
                                                            throw std::runtime_error{"bad index"};
                                                        }
                                                    }),
                            std::runtime_error);
        core::stopDefaultAsyncExecutor();
    }
}

BOOST_AUTO_TEST_SUITE_END()
