/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CFarEstimator.h>
#include <maths/time_series/CFarNonlinearityTest.h>
#include <maths/time_series/CFarParameters.h>
#include <maths/time_series/CFunctionalCoefficientField.h>

#include <api/CMxfarJsonOutputWriter.h>

#include <boost/json.hpp>
#include <boost/test/unit_test.hpp>

#include <limits>
#include <sstream>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CMxfarJsonOutputWriterTest)

using namespace mxfar;

namespace json = boost::json;

namespace {
using TDenseMatrix = maths::common::TDenseMatrix;
using TField = maths::time_series::CFunctionalCoefficientField;
using TParameters = maths::time_series::SFarParameters;
using TWriter = api::CMxfarJsonOutputWriter;

const double NaN{std::numeric_limits<double>::quiet_NaN()};

json::object parseLine(const std::string& line) {
    LOG_DEBUG(<< "JSON = " << line);
    return json::parse(line).as_object();
}
}

BOOST_AUTO_TEST_CASE(testToJson) {

    BOOST_TEST_REQUIRE(TWriter::toJson(NaN).is_null());
    BOOST_TEST_REQUIRE(TWriter::toJson(std::numeric_limits<double>::infinity()).is_null());
    BOOST_REQUIRE_EQUAL(0.5, TWriter::toJson(0.5).as_double());

    TDenseMatrix matrix(2, 3);
    matrix << 1.0, 2.0, 3.0, 4.0, NaN, 6.0;
    auto rows = TWriter::toJson(matrix);
    BOOST_REQUIRE_EQUAL(std::size_t{2}, rows.size());
    BOOST_REQUIRE_EQUAL(std::size_t{3}, rows[1].as_array().size());
    BOOST_REQUIRE_EQUAL(3.0, rows[0].as_array()[2].as_double());
    BOOST_TEST_REQUIRE(rows[1].as_array()[1].is_null());

    TField::TOptionalDenseMatrixVec cells(3);
    cells[0] = TDenseMatrix{TDenseMatrix::TBase::Identity(2, 2)};
    cells[2] = TDenseMatrix{TDenseMatrix::TBase::Zero(2, 2)};
    TField field{2, cells};
    auto fieldJson = TWriter::toJson(field);
    BOOST_REQUIRE_EQUAL(std::size_t{3}, fieldJson.size());
    BOOST_REQUIRE_EQUAL(1.0, fieldJson[0].as_array()[1].as_array()[1].as_double());
    BOOST_TEST_REQUIRE(fieldJson[1].is_null());
    BOOST_REQUIRE_EQUAL(0.0, fieldJson[2].as_array()[0].as_array()[0].as_double());
}

BOOST_AUTO_TEST_CASE(testWriteFarEstimate) {

    maths::time_series::CFarEstimator::SEstimate estimate;
    estimate.s_CutPoints = {0.0};
    estimate.s_EvaluationPoints = {-0.5, 0.5};
    TField::TOptionalDenseMatrixVec cells(2);
    cells[1] = TDenseMatrix{TDenseMatrix::TBase::Identity(2, 2)};
    estimate.s_Coefficients = TField{2, cells};
    estimate.s_Predictions = TDenseMatrix{TDenseMatrix::TBase::Ones(3, 2)};
    estimate.s_Residuals = TDenseMatrix{TDenseMatrix::TBase::Zero(3, 2)};
    estimate.s_Residuals(0, 0) = NaN;

    std::ostringstream output;
    TWriter writer{output};
    writer.writeFarEstimate(TParameters{2, 1, 0.2, 1},
                            TWriter::TStrVec{"a", "b"}, estimate);

    auto doc = parseLine(output.str());
    BOOST_REQUIRE_EQUAL(std::string("far"), std::string(doc.at("analysis").as_string()));
    const auto& parameters = doc.at("parameters").as_object();
    BOOST_REQUIRE_EQUAL(2, parameters.at("order").to_number<int>());
    BOOST_REQUIRE_EQUAL(1, parameters.at("reference_lag").to_number<int>());
    BOOST_REQUIRE_EQUAL(0.2, parameters.at("bandwidth_proportion").as_double());
    BOOST_REQUIRE_EQUAL(1, parameters.at("number_points").to_number<int>());

    BOOST_REQUIRE_EQUAL(std::string("b"),
                        std::string(doc.at("dimensions").as_array()[1].as_string()));
    BOOST_REQUIRE_EQUAL(std::size_t{1}, doc.at("cut_points").as_array().size());
    BOOST_REQUIRE_EQUAL(std::size_t{2}, doc.at("evaluation_points").as_array().size());
    BOOST_TEST_REQUIRE(doc.at("coefficients").as_array()[0].is_null());
    BOOST_REQUIRE_EQUAL(std::size_t{3}, doc.at("predictions").as_array().size());
    BOOST_TEST_REQUIRE(doc.at("residuals").as_array()[0].as_array()[0].is_null());
    BOOST_TEST_REQUIRE(doc.contains("coherence") == false);
}

BOOST_AUTO_TEST_CASE(testWriteDiagnostics) {

    std::ostringstream output;
    TWriter writer{output};
    TParameters params{1, 2};

    writer.writePredictionError(params, 50, 4, 123.5);

    maths::time_series::CFarNonlinearityTest::SResult result;
    result.s_Statistic = 0.75;
    result.s_BootstrapStatistics = {0.1, std::nullopt, 0.9};
    result.s_PValue = 0.5;
    writer.writeNonlinearityTest(params, result);

    result.s_PValue = std::nullopt;
    writer.writeNonlinearityTest(params, result);

    std::istringstream lines{output.str()};
    std::string line;

    BOOST_TEST_REQUIRE(static_cast<bool>(std::getline(lines, line)));
    auto ape = parseLine(line);
    BOOST_REQUIRE_EQUAL(std::string("ape"), std::string(ape.at("analysis").as_string()));
    BOOST_REQUIRE_EQUAL(50, ape.at("horizon").to_number<int>());
    BOOST_REQUIRE_EQUAL(4, ape.at("folds").to_number<int>());
    BOOST_REQUIRE_EQUAL(123.5, ape.at("prediction_error").as_double());

    BOOST_TEST_REQUIRE(static_cast<bool>(std::getline(lines, line)));
    auto test = parseLine(line);
    BOOST_REQUIRE_EQUAL(std::string("nltest"), std::string(test.at("analysis").as_string()));
    BOOST_REQUIRE_EQUAL(0.75, test.at("statistic").as_double());
    const auto& bootstrap = test.at("bootstrap_statistics").as_array();
    BOOST_REQUIRE_EQUAL(std::size_t{3}, bootstrap.size());
    BOOST_TEST_REQUIRE(bootstrap[1].is_null());
    BOOST_REQUIRE_EQUAL(0.9, bootstrap[2].as_double());
    BOOST_REQUIRE_EQUAL(0.5, test.at("p_value").as_double());

    BOOST_TEST_REQUIRE(static_cast<bool>(std::getline(lines, line)));
    BOOST_TEST_REQUIRE(parseLine(line).at("p_value").is_null());

    BOOST_TEST_REQUIRE(static_cast<bool>(std::getline(lines, line)) == false);
}

BOOST_AUTO_TEST_SUITE_END()
