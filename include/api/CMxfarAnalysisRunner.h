/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_api_CMxfarAnalysisRunner_h
#define INCLUDED_mxfar_api_CMxfarAnalysisRunner_h

#include <api/CStackedSeriesCsvParser.h>

#include <maths/time_series/CFarNonlinearityTest.h>
#include <maths/time_series/CFarParameters.h>

#include <string>
#include <vector>

namespace mxfar {
namespace api {
class CMxfarJsonOutputWriter;

//! \brief
//! Runs one of the analyses on stacked series and writes its result.
//!
//! DESCRIPTION:\n
//! The analyses are:
//!   -# estimate: a FAR model fitted to a single series,
//!   -# mxfar: a MXFAR model fitted to groups of series,
//!   -# ape: the accumulated prediction error of the FAR model,
//!   -# nltest: the bootstrap test of the FAR model against a VAR.
//!
//! If no series length is supplied it is the number of rows divided by
//! the number of series. If no group sizes are supplied all the series
//! belong to one group.
class CMxfarAnalysisRunner {
public:
    using TSizeVec = std::vector<std::size_t>;
    using TNonlinearityTestParameters = maths::time_series::CFarNonlinearityTest::SParameters;

    enum EAnalysis {
        E_Estimate,
        E_Mxfar,
        E_PredictionError,
        E_NonlinearityTest
    };

    static constexpr std::size_t DEFAULT_HORIZON{50};
    static constexpr std::size_t DEFAULT_FOLDS{4};

    //! \brief The analysis configuration.
    struct SConfig {
        SConfig();

        EAnalysis s_Analysis{E_Estimate};
        TSizeVec s_GroupSizes;
        std::size_t s_SeriesLength{0};
        maths::time_series::SFarParameters s_Parameters;
        std::size_t s_Horizon{DEFAULT_HORIZON};
        std::size_t s_Folds{DEFAULT_FOLDS};
        TNonlinearityTestParameters s_TestParameters;
        bool s_ComputeCoherence{false};
    };

public:
    CMxfarAnalysisRunner(SConfig config, CMxfarJsonOutputWriter& writer);

    //! Run the configured analysis on \p series.
    //!
    //! \throws std::invalid_argument if the configuration doesn't match
    //! the series.
    void run(const CStackedSeriesCsvParser::SStackedSeries& series) const;

    //! Parse the name of an analysis.
    static bool analysisFromString(const std::string& name, EAnalysis& analysis);

    //! Get the name of \p analysis.
    static const std::string& analysisToString(EAnalysis analysis);

    //! Resolve the group sizes and series length of \p numberRows stacked
    //! rows, filling in the defaults.
    static void resolveLayout(std::size_t numberRows, TSizeVec& groupSizes, std::size_t& seriesLength);

private:
    SConfig m_Config;
    CMxfarJsonOutputWriter& m_Writer;
};
}
}

#endif // INCLUDED_mxfar_api_CMxfarAnalysisRunner_h
