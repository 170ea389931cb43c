/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/common/CLinearAlgebraEigen.h>
#include <maths/common/CMathsFuncs.h>

#include <maths/time_series/CFunctionalCoefficientField.h>
#include <maths/time_series/CPartialDirectedCoherence.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(CPartialDirectedCoherenceTest)

using namespace mxfar;

namespace {
using TDoubleVec = std::vector<double>;
using TDenseMatrix = maths::common::TDenseMatrix;
using TDenseMatrixVec = maths::common::TDenseMatrixVec;
using TPdc = maths::time_series::CPartialDirectedCoherence;

TDenseMatrix randomMatrix(test::CRandomNumbers& rng, std::ptrdiff_t rows, std::ptrdiff_t columns) {
    TDoubleVec values;
    rng.generateUniformSamples(-0.5, 0.5, static_cast<std::size_t>(rows * columns), values);
    TDenseMatrix result(rows, columns);
    for (std::ptrdiff_t i = 0; i < rows; ++i) {
        for (std::ptrdiff_t j = 0; j < columns; ++j) {
            result(i, j) = values[static_cast<std::size_t>(i * columns + j)];
        }
    }
    return result;
}
}

BOOST_AUTO_TEST_CASE(testFourierFrequencies) {

    TDoubleVec frequencies{TPdc::fourierFrequencies(10)};
    BOOST_REQUIRE_EQUAL(std::size_t{5}, frequencies.size());
    for (std::size_t i = 0; i < frequencies.size(); ++i) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(0.1 * static_cast<double>(i + 1), frequencies[i], 1e-15);
    }

    frequencies = TPdc::fourierFrequencies(7);
    BOOST_REQUIRE_EQUAL(std::size_t{3}, frequencies.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(3.0 / 7.0, frequencies.back(), 1e-15);

    BOOST_TEST_REQUIRE(TPdc::fourierFrequencies(1).empty());
}

BOOST_AUTO_TEST_CASE(testKnownValues) {

    // Only series 1 drives series 2 so the coherence from 1 to 2 is
    // |a| / sqrt(1 + a^2) at every frequency and nothing flows back.

    double a{0.75};
    TDenseMatrix phi{TDenseMatrix::TBase::Zero(2, 2)};
    phi(1, 0) = a;

    TDoubleVec frequencies{0.05, 0.2, 0.35, 0.5};
    TDenseMatrixVec pdc(TPdc::pdc(TDenseMatrixVec(1, phi), frequencies));
    BOOST_REQUIRE_EQUAL(frequencies.size(), pdc.size());

    TDenseMatrix expected(2, 2);
    expected << 1.0 / std::sqrt(1.0 + a * a), 0.0, a / std::sqrt(1.0 + a * a), 1.0;
    for (const auto& coherence : pdc) {
        LOG_DEBUG(<< "pdc =\n" << coherence);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(expected, coherence, 1e-12);
    }

    // No dynamics means no coherence between different series.
    TDenseMatrixVec zero(TPdc::pdc(TDenseMatrixVec(2, TDenseMatrix::TBase::Zero(3, 3)), frequencies));
    for (const auto& coherence : zero) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(TDenseMatrix::TBase::Identity(3, 3), coherence, 1e-15);
    }
}

BOOST_AUTO_TEST_CASE(testColumnsAreNormalised) {

    test::CRandomNumbers rng;

    TDoubleVec frequencies{TPdc::fourierFrequencies(40)};
    for (std::size_t trial = 0; trial < 20; ++trial) {
        TDenseMatrixVec lags;
        for (std::size_t l = 0; l < 3; ++l) {
            lags.push_back(randomMatrix(rng, 3, 3));
        }
        for (const auto& coherence : TPdc::pdc(lags, frequencies)) {
            BOOST_TEST_REQUIRE(coherence.minCoeff() >= 0.0);
            BOOST_TEST_REQUIRE(coherence.maxCoeff() <= 1.0 + 1e-12);
            for (std::ptrdiff_t j = 0; j < 3; ++j) {
                BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, coherence.col(j).squaredNorm(), 1e-12);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(testStackedMatchesLags) {

    test::CRandomNumbers rng;

    TDenseMatrix stacked{randomMatrix(rng, 2, 6)};
    TDenseMatrixVec lags;
    for (std::ptrdiff_t l = 0; l < 3; ++l) {
        lags.emplace_back(stacked.middleCols(2 * l, 2));
    }

    TDoubleVec frequencies{0.1, 0.25, 0.4};
    TDenseMatrixVec expected(TPdc::pdc(lags, frequencies));
    TDenseMatrixVec actual(TPdc::pdcStacked(stacked, frequencies));
    BOOST_REQUIRE_EQUAL(expected.size(), actual.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(expected[i], actual[i], 1e-15);
    }
}

BOOST_AUTO_TEST_CASE(testZeroColumn) {

    // At frequency zero the first column of I - phi vanishes.

    TDenseMatrix phi{TDenseMatrix::TBase::Zero(2, 2)};
    phi(0, 0) = 1.0;
    phi(0, 1) = 0.5;

    TDenseMatrixVec pdc(TPdc::pdc(TDenseMatrixVec(1, phi), TDoubleVec(1, 0.0)));
    LOG_DEBUG(<< "pdc =\n" << pdc[0]);
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(pdc[0](0, 0)));
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(pdc[0](1, 0)));
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isFinite(pdc[0](0, 1)));
}

BOOST_AUTO_TEST_CASE(testFunctionalCoherence) {

    test::CRandomNumbers rng;

    maths::time_series::CFunctionalCoefficientField::TOptionalDenseMatrixVec cells(4);
    cells[0] = randomMatrix(rng, 2, 4);
    cells[2] = randomMatrix(rng, 2, 4);
    cells[3] = randomMatrix(rng, 2, 4);
    maths::time_series::CFunctionalCoefficientField field{2, cells};

    TDoubleVec frequencies{TPdc::fourierFrequencies(20)};
    auto coherence = TPdc::fpdc(field, frequencies);

    BOOST_REQUIRE_EQUAL(std::size_t{4}, coherence.size());
    BOOST_TEST_REQUIRE(coherence[1].has_value() == false);
    for (std::size_t i : {0, 2, 3}) {
        BOOST_TEST_REQUIRE(coherence[i].has_value());
        TDenseMatrixVec expected(TPdc::pdcStacked(*cells[i], frequencies));
        BOOST_REQUIRE_EQUAL(frequencies.size(), coherence[i]->size());
        for (std::size_t j = 0; j < frequencies.size(); ++j) {
            BOOST_REQUIRE_CLOSE_ABSOLUTE(expected[j], (*coherence[i])[j], 1e-15);
        }
    }
}

BOOST_AUTO_TEST_CASE(testInvalidInput) {

    TDenseMatrixVec none;
    TDenseMatrixVec notSquare(1, TDenseMatrix::TBase::Zero(2, 3));
    TDenseMatrixVec mismatched;
    mismatched.emplace_back(TDenseMatrix::TBase::Zero(2, 2));
    mismatched.emplace_back(TDenseMatrix::TBase::Zero(3, 3));
    TDenseMatrix badStacked{TDenseMatrix::TBase::Zero(2, 5)};
    TDoubleVec frequencies{0.1};

    BOOST_REQUIRE_THROW(TPdc::pdc(none, frequencies), std::invalid_argument);
    BOOST_REQUIRE_THROW(TPdc::pdc(notSquare, frequencies), std::invalid_argument);
    BOOST_REQUIRE_THROW(TPdc::pdc(mismatched, frequencies), std::invalid_argument);
    BOOST_REQUIRE_THROW(TPdc::pdcStacked(badStacked, frequencies), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
