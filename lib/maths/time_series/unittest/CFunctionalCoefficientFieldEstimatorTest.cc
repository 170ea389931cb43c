/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <maths/common/CLinearAlgebraEigen.h>
#include <maths/common/CMathsFuncs.h>

#include <maths/time_series/CAutoregressiveDesign.h>
#include <maths/time_series/CFunctionalCoefficientField.h>
#include <maths/time_series/CFunctionalCoefficientFieldEstimator.h>
#include <maths/time_series/CLocalCoefficientEstimator.h>
#include <maths/time_series/CReferenceSignalGrid.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <limits>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CFunctionalCoefficientFieldEstimatorTest)

using namespace mxfar;

namespace {
using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;
using TDenseMatrix = maths::common::TDenseMatrix;
using TDenseVector = maths::common::TDenseVector;
using TDesign = maths::time_series::CAutoregressiveDesign;
using TField = maths::time_series::CFunctionalCoefficientField;
using TFieldEstimator = maths::time_series::CFunctionalCoefficientFieldEstimator;
using TGrid = maths::time_series::CReferenceSignalGrid;

const double NaN{std::numeric_limits<double>::quiet_NaN()};

//! \brief Returns coefficients equal to the evaluation point times the
//! identity for non-negative points and fails elsewhere.
class CPointTimesIdentity : public maths::time_series::CLocalCoefficientEstimator {
public:
    TOptionalLocalCoefficients estimate(const TDesign& design,
                                        double point,
                                        double /*bandwidthProportion*/) const override {
        if (point < 0.0) {
            return std::nullopt;
        }
        auto k = static_cast<std::ptrdiff_t>(design.dimension());
        auto kp = static_cast<std::ptrdiff_t>(design.dimension() * design.order());
        TDenseMatrix coefficients{TDenseMatrix::TBase::Zero(k, kp)};
        coefficients.leftCols(k) = point * TDenseMatrix::TBase::Identity(k, k);
        TDenseMatrix zero{TDenseMatrix::TBase::Zero(k, kp)};
        maths::time_series::SLocalCoefficients result;
        result.s_GroupMeans.assign(design.numberGroups(), coefficients);
        result.s_GroupDerivatives.assign(design.numberGroups(), zero);
        for (std::size_t i = 0; i < design.numberSeries(); ++i) {
            TDenseMatrix deviation{TDenseMatrix::TBase::Constant(
                k, kp, static_cast<double>(i + 1))};
            result.s_SubjectDeviations.push_back(deviation);
            result.s_SubjectDerivativeDeviations.push_back(zero);
        }
        return result;
    }

    std::string description() const override { return "point times identity"; }
};

void makeSeries(test::CRandomNumbers& rng, std::size_t length, TDenseMatrix& y, TDenseVector& u) {
    TDoubleVec samples;
    rng.generateNormalSamples(0.0, 1.0, 3 * length, samples);
    auto n = static_cast<std::ptrdiff_t>(length);
    y.resize(n, 2);
    u.resize(n);
    for (std::ptrdiff_t t = 0; t < n; ++t) {
        y(t, 0) = samples[static_cast<std::size_t>(3 * t)];
        y(t, 1) = samples[static_cast<std::size_t>(3 * t + 1)];
        u(t) = samples[static_cast<std::size_t>(3 * t + 2)];
    }
}
}

BOOST_AUTO_TEST_CASE(testEstimate) {

    test::CRandomNumbers rng;
    TDenseMatrix y;
    TDenseVector u;
    makeSeries(rng, 200, y, u);

    auto design = TDesign::build(y, u, 1, 1);
    TGrid grid{u, 10};

    CPointTimesIdentity estimator;
    TFieldEstimator fieldEstimator{estimator};

    for (std::size_t threads : {0, 3}) {
        if (threads > 0) {
            core::startDefaultAsyncExecutor(threads);
        }

        auto local = fieldEstimator.estimate(design, grid, 0.1);

        const TDoubleVec& points = grid.evaluationPoints();
        BOOST_REQUIRE_EQUAL(points.size(), local.size());
        for (std::size_t i = 0; i < points.size(); ++i) {
            BOOST_REQUIRE_EQUAL(points[i] >= 0.0, local[i].has_value());
            if (local[i] != std::nullopt) {
                BOOST_REQUIRE_CLOSE_ABSOLUTE(
                    points[i] * TDenseMatrix::TBase::Identity(2, 2),
                    local[i]->s_GroupMeans[0], 1e-15);
            }
        }

        auto field = TFieldEstimator::groupField(local, 2, 0);
        BOOST_REQUIRE_EQUAL(points.size(), field.size());
        BOOST_REQUIRE_EQUAL(std::size_t{2}, field.dimension());
        std::size_t missing{0};
        for (std::size_t i = 0; i < points.size(); ++i) {
            BOOST_REQUIRE_EQUAL(points[i] < 0.0, field.missing(i));
            missing += points[i] < 0.0 ? 1 : 0;
        }
        BOOST_REQUIRE_EQUAL(missing, field.numberMissing());

        core::stopDefaultAsyncExecutor();
    }
}

BOOST_AUTO_TEST_CASE(testGroupAndSubjectFields) {

    test::CRandomNumbers rng;
    TDenseMatrix y;
    TDenseVector u;
    makeSeries(rng, 90, y, u);

    // Three series of length 30 in groups {0} and {1, 2}.
    auto design = TDesign::buildStacked(TSizeVec{1, 2}, 30, y, u, 2, 1);
    TGrid grid{u, 5};

    CPointTimesIdentity estimator;
    auto local = TFieldEstimator{estimator}.estimate(design, grid, 0.1);

    auto group = TFieldEstimator::groupField(local, 2, 1);
    auto subject = TFieldEstimator::subjectField(local, 2, 2, 1);
    BOOST_REQUIRE_EQUAL(group.size(), subject.size());
    BOOST_REQUIRE_EQUAL(group.numberMissing(), subject.numberMissing());

    for (std::size_t i = 0; i < group.size(); ++i) {
        if (group.missing(i)) {
            continue;
        }
        BOOST_REQUIRE_EQUAL(2, group[i]->rows());
        BOOST_REQUIRE_EQUAL(4, group[i]->cols());
        BOOST_REQUIRE_CLOSE_ABSOLUTE(*group[i] + TDenseMatrix::TBase::Constant(2, 4, 3.0),
                                     *subject[i], 1e-15);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(group.lag(i, 1), group[i]->leftCols(2), 1e-15);
        BOOST_REQUIRE_CLOSE_ABSOLUTE(TDenseMatrix::TBase::Zero(2, 2), group.lag(i, 2), 1e-15);
    }
}

BOOST_AUTO_TEST_CASE(testPredict) {

    test::CRandomNumbers rng;
    TDenseMatrix y;
    TDenseVector u;
    makeSeries(rng, 100, y, u);
    u(10) = NaN;

    auto design = TDesign::build(y, u, 1, 2);
    TGrid grid{u, 8};

    // Cell i has coefficients (i + 1) times the identity except the first
    // which is missing.
    TField::TOptionalDenseMatrixVec cells(grid.numberCells());
    for (std::size_t i = 1; i < cells.size(); ++i) {
        cells[i] = static_cast<double>(i + 1) * TDenseMatrix::TBase::Identity(2, 2);
    }
    TField field{2, cells};

    TDenseMatrix predictions{TFieldEstimator::predict(design, 0, design.numberRows(), grid, field)};
    BOOST_REQUIRE_EQUAL(static_cast<std::ptrdiff_t>(design.numberRows()), predictions.rows());
    BOOST_REQUIRE_EQUAL(2, predictions.cols());

    std::size_t missing{0};
    for (std::size_t row = 0; row < design.numberRows(); ++row) {
        auto r = static_cast<std::ptrdiff_t>(row);
        double reference{design.references()(r)};
        if (maths::common::CMathsFuncs::isNan(reference) || grid.cell(reference) == 0) {
            BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(predictions(r, 0)));
            BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(predictions(r, 1)));
            ++missing;
        } else {
            double scale{static_cast<double>(grid.cell(reference) + 1)};
            BOOST_REQUIRE_CLOSE_ABSOLUTE(scale * design.predictors().row(r),
                                         predictions.row(r), 1e-12);
        }
    }
    LOG_DEBUG(<< missing << " missing predictions");
    // Row t = 12 has reference u(10).
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(predictions(10, 0)));
    BOOST_TEST_REQUIRE(missing >= std::size_t{1});

    // A sub-range gives the same rows.
    TDenseMatrix range{TFieldEstimator::predict(design, 20, 40, grid, field)};
    BOOST_REQUIRE_EQUAL(20, range.rows());
    for (std::ptrdiff_t r = 0; r < 20; ++r) {
        for (std::ptrdiff_t j = 0; j < 2; ++j) {
            double expected{predictions(r + 20, j)};
            if (maths::common::CMathsFuncs::isNan(expected)) {
                BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(range(r, j)));
            } else {
                BOOST_REQUIRE_EQUAL(expected, range(r, j));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(testMissingCellPrediction) {

    TField::TOptionalDenseMatrixVec cells(2);
    cells[1] = TDenseMatrix{TDenseMatrix::TBase::Identity(2, 2)};
    TField field{2, cells};

    TDenseVector x(2);
    x << 1.0, 2.0;
    TDenseVector missing{field.predict(0, x)};
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(missing(0)));
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(missing(1)));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(x, field.predict(1, x), 1e-15);
}

BOOST_AUTO_TEST_SUITE_END()
