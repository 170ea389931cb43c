/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CLocalLinearCoefficientEstimator.h>
#include <maths/time_series/CMixedLocalLinearCoefficientEstimator.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CFarSimulator.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CMixedLocalLinearCoefficientEstimatorTest)

using namespace mxfar;

namespace {
using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;
using TDenseMatrix = maths::common::TDenseMatrix;
using TDenseMatrixVec = maths::common::TDenseMatrixVec;
using TLocalLinear = maths::time_series::CLocalLinearCoefficientEstimator;
using TMixed = maths::time_series::CMixedLocalLinearCoefficientEstimator;
using TDesign = maths::time_series::CAutoregressiveDesign;

TDenseMatrix rotation(double theta) {
    TDenseMatrix result(2, 2);
    result << std::cos(theta), -std::sin(theta), std::sin(theta), std::cos(theta);
    return result;
}

test::CFarSimulator heterogeneousSimulator() {
    return test::CFarSimulator{1, test::CFarSimulator::EXOGENOUS_REFERENCE,
                               [](double u, const TDoubleVec& effects) {
                                   TDenseMatrix phi(2, 2);
                                   phi << 0.2 + effects[0], 0.1, -0.1,
                                       0.3 + 0.2 * std::tanh(u);
                                   return TDenseMatrixVec{phi};
                               },
                               TDoubleVec{1.0, 1.0}};
}
}

BOOST_AUTO_TEST_CASE(testDescription) {
    BOOST_REQUIRE_EQUAL(std::string{"mixed effects local linear"}, TMixed{}.description());
}

BOOST_AUTO_TEST_CASE(testDeviationsAreShrunkTowardsGroupMean) {

    // Eight heterogeneous series in two groups of four.

    test::CFarSimulator::TGenerator rng{11};
    auto simulator = heterogeneousSimulator();
    auto series = simulator.simulateStacked(rng, 8, 400, TDoubleVec{0.0625});
    auto design = TDesign::buildStacked(TSizeVec{4, 4}, 400, series.s_Y, series.s_U, 1, 1);

    double point{0.0};
    double bwp{0.1};
    auto local = TMixed{}.estimate(design, point, bwp);
    BOOST_TEST_REQUIRE(local.has_value());
    BOOST_REQUIRE_EQUAL(std::size_t{2}, local->s_GroupMeans.size());
    BOOST_REQUIRE_EQUAL(std::size_t{8}, local->s_SubjectDeviations.size());

    double bandwidth{TLocalLinear::bandwidth(design, bwp)};
    TDenseMatrixVec fits;
    for (std::size_t i = 0; i < design.numberSeries(); ++i) {
        const auto& rows = design.series(i);
        auto fit = TLocalLinear::fit(design, rows.s_Begin, rows.s_End, point, bandwidth);
        BOOST_TEST_REQUIRE(fit.has_value());
        fits.push_back(fit->s_Coefficients);
    }

    double shrunk{0.0};
    for (std::size_t group = 0; group < 2; ++group) {
        TDenseMatrix mean{TDenseMatrix::TBase::Zero(fits[0].rows(), fits[0].cols())};
        TDenseMatrix deviations{TDenseMatrix::TBase::Zero(2, 2)};
        TDenseMatrix derivativeDeviations{TDenseMatrix::TBase::Zero(2, 2)};
        for (std::size_t i = 4 * group; i < 4 * group + 4; ++i) {
            mean += fits[i];
            deviations += local->s_SubjectDeviations[i];
            derivativeDeviations += local->s_SubjectDerivativeDeviations[i];
        }
        mean /= 4.0;
        LOG_DEBUG(<< "group " << group << " mean =\n" << local->s_GroupMeans[group]);

        BOOST_REQUIRE_CLOSE_ABSOLUTE(TLocalLinear::levels(mean), local->s_GroupMeans[group], 1e-10);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(TLocalLinear::slopes(mean),
                                     local->s_GroupDerivatives[group], 1e-10);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(TDenseMatrix::TBase::Zero(2, 2), deviations, 1e-10);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(TDenseMatrix::TBase::Zero(2, 2), derivativeDeviations, 1e-10);

        for (std::size_t i = 4 * group; i < 4 * group + 4; ++i) {
            TDenseMatrix raw{TLocalLinear::levels(fits[i] - mean)};
            const auto& deviation = local->s_SubjectDeviations[i];
            LOG_DEBUG(<< "raw =\n" << raw << "\nshrunk =\n" << deviation);
            for (std::ptrdiff_t r = 0; r < 2; ++r) {
                for (std::ptrdiff_t c = 0; c < 2; ++c) {
                    BOOST_TEST_REQUIRE(std::fabs(deviation(r, c)) <= std::fabs(raw(r, c)) + 1e-12);
                    BOOST_TEST_REQUIRE(deviation(r, c) * raw(r, c) >= -1e-12);
                }
            }
            BOOST_REQUIRE_CLOSE_ABSOLUTE(local->s_GroupMeans[group] + deviation,
                                         local->subjectCoefficients(i, group), 1e-12);
            shrunk += std::fabs(deviation(0, 0));
        }
    }

    // The first coefficient varies materially between subjects.
    LOG_DEBUG(<< "total deviation = " << shrunk);
    BOOST_TEST_REQUIRE(shrunk > 0.01);
}

BOOST_AUTO_TEST_CASE(testHomogeneousSeries) {

    // Identical noise free dynamics mean there is nothing to separate the
    // subjects from their group.

    test::CFarSimulator simulator{
        1, test::CFarSimulator::EXOGENOUS_REFERENCE,
        [](double, const TDoubleVec&) { return TDenseMatrixVec{rotation(0.2)}; },
        TDoubleVec{0.0, 0.0}};
    test::CFarSimulator::TGenerator rng{12};
    auto series = simulator.simulateStacked(rng, 4, 300, TDoubleVec{});
    auto design = TDesign::buildStacked(TSizeVec{2, 2}, 300, series.s_Y, series.s_U, 1, 1);

    for (double point : {-0.5, 0.0, 0.8}) {
        auto local = TMixed{}.estimate(design, point, 0.1);
        BOOST_TEST_REQUIRE(local.has_value());
        for (std::size_t group = 0; group < 2; ++group) {
            BOOST_REQUIRE_CLOSE_ABSOLUTE(rotation(0.2), local->s_GroupMeans[group], 1e-8);
        }
        for (std::size_t i = 0; i < 4; ++i) {
            BOOST_REQUIRE_CLOSE_ABSOLUTE(TDenseMatrix::TBase::Zero(2, 2),
                                         local->s_SubjectDeviations[i], 1e-8);
        }
    }
}

BOOST_AUTO_TEST_CASE(testAnyFailedSubjectFailsThePoint) {

    // The second series has no reference values near zero so the point
    // can't be estimated.

    test::CFarSimulator simulator{
        1, test::CFarSimulator::EXOGENOUS_REFERENCE,
        [](double, const TDoubleVec&) { return TDenseMatrixVec{rotation(0.2)}; },
        TDoubleVec{0.1, 0.1}};
    test::CFarSimulator::TGenerator rng{13};
    auto series = simulator.simulateStacked(rng, 2, 300, TDoubleVec{});
    series.s_U.tail(300).array() += 100.0;
    auto design = TDesign::buildStacked(TSizeVec{2}, 300, series.s_Y, series.s_U, 1, 1);

    BOOST_TEST_REQUIRE(TMixed{}.estimate(design, 0.0, 0.05).has_value() == false);

    // Whereas the pooled fit only needs support somewhere.
    BOOST_TEST_REQUIRE(TLocalLinear{}.estimate(design, 0.0, 0.05).has_value());
}

BOOST_AUTO_TEST_SUITE_END()
