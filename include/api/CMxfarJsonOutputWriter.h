/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_api_CMxfarJsonOutputWriter_h
#define INCLUDED_mxfar_api_CMxfarJsonOutputWriter_h

#include <core/CNonCopyable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <maths/time_series/CFarEstimator.h>
#include <maths/time_series/CFarNonlinearityTest.h>
#include <maths/time_series/CFarParameters.h>
#include <maths/time_series/CFunctionalCoefficientField.h>
#include <maths/time_series/CMxfarEstimator.h>

#include <boost/json.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace mxfar {
namespace api {

//! \brief
//! Writes analysis results as JSON.
//!
//! DESCRIPTION:\n
//! Each result is written as a single JSON document on its own line.
//! Every document has an "analysis" field naming the analysis and a
//! "parameters" object with the model parameters. Missing values, for
//! example coefficients in a grid cell for which no local fit was
//! possible, are written as null.
class CMxfarJsonOutputWriter : private core::CNonCopyable {
public:
    using TDoubleVec = std::vector<double>;
    using TStrVec = std::vector<std::string>;

public:
    //! Field names.
    static const std::string ANALYSIS;
    static const std::string PARAMETERS;
    static const std::string ORDER;
    static const std::string REFERENCE_LAG;
    static const std::string BANDWIDTH_PROPORTION;
    static const std::string NUMBER_POINTS;
    static const std::string DIMENSIONS;
    static const std::string CUT_POINTS;
    static const std::string EVALUATION_POINTS;
    static const std::string COEFFICIENTS;
    static const std::string GROUP_COEFFICIENTS;
    static const std::string SUBJECT_COEFFICIENTS;
    static const std::string PREDICTIONS;
    static const std::string RESIDUALS;
    static const std::string COHERENCE;
    static const std::string GROUP_COHERENCE;
    static const std::string SUBJECT_COHERENCE;
    static const std::string FREQUENCIES;
    static const std::string CELLS;
    static const std::string HORIZON;
    static const std::string FOLDS;
    static const std::string PREDICTION_ERROR;
    static const std::string STATISTIC;
    static const std::string BOOTSTRAP_STATISTICS;
    static const std::string P_VALUE;

public:
    explicit CMxfarJsonOutputWriter(std::ostream& strmOut);

    //! Write the estimate of a single FAR model.
    void writeFarEstimate(const maths::time_series::SFarParameters& params,
                          const TStrVec& dimensionNames,
                          const maths::time_series::CFarEstimator::SEstimate& estimate);

    //! Write the estimate of a MXFAR model.
    void writeMxfarEstimate(const maths::time_series::SFarParameters& params,
                            const TStrVec& dimensionNames,
                            const maths::time_series::CMxfarEstimator::SEstimate& estimate);

    //! Write the accumulated prediction error.
    void writePredictionError(const maths::time_series::SFarParameters& params,
                              std::size_t horizon,
                              std::size_t folds,
                              double error);

    //! Write the result of the nonlinearity test.
    void writeNonlinearityTest(const maths::time_series::SFarParameters& params,
                               const maths::time_series::CFarNonlinearityTest::SResult& result);

    //! Convert a value to JSON writing non-finite values as null.
    static boost::json::value toJson(double value);

    //! Convert a matrix to an array of its rows.
    static boost::json::array toJson(const maths::common::TDenseMatrix::TBase& matrix);

    //! Convert a field to an array of its cells' coefficient matrices.
    static boost::json::array
    toJson(const maths::time_series::CFunctionalCoefficientField& field);

    //! Convert the coherence of a field to an object.
    static boost::json::object
    toJson(const maths::time_series::CFarEstimator::SCoherence& coherence);

private:
    //! Create a document for \p analysis with the model parameters.
    static boost::json::object document(const std::string& analysis,
                                        const maths::time_series::SFarParameters& params);

    //! Write \p doc on its own line.
    void write(const boost::json::object& doc);

private:
    //! The stream to which to write.
    std::ostream& m_StrmOut;
};
}
}

#endif // INCLUDED_mxfar_api_CMxfarJsonOutputWriter_h
