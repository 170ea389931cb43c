/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
//! \brief
//! Fit functional coefficient autoregressive models to stacked series.
//!
//! DESCRIPTION:\n
//! Expects the stacked series as CSV on STDIN or in the input file and
//! writes its JSON results to STDOUT or the output file.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Standalone program.
//!
#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <ver/CBuildInfo.h>

#include <api/CMxfarAnalysisRunner.h>
#include <api/CMxfarJsonOutputWriter.h>
#include <api/CStackedSeriesCsvParser.h>

#include "CCmdLineParser.h"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    // Read command line options
    mxfar::mxfar::CCmdLineParser::SOptions options;
    if (mxfar::mxfar::CCmdLineParser::parse(argc, argv, options) == false) {
        return EXIT_FAILURE;
    }

    if (mxfar::core::CLogger::instance().reconfigure(options.s_LogProperties) == false) {
        LOG_FATAL(<< "Could not reconfigure logging");
        return EXIT_FAILURE;
    }

    // Log the program version immediately after reconfiguring the logger.
    LOG_DEBUG(<< mxfar::ver::CBuildInfo::fullInfo());

    std::unique_ptr<std::ifstream> inputFile;
    if (options.s_InputFileName.empty() == false) {
        inputFile = std::make_unique<std::ifstream>(options.s_InputFileName);
        if (inputFile->is_open() == false) {
            LOG_FATAL(<< "Could not open input file '" << options.s_InputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::unique_ptr<std::ofstream> outputFile;
    if (options.s_OutputFileName.empty() == false) {
        outputFile = std::make_unique<std::ofstream>(options.s_OutputFileName);
        if (outputFile->is_open() == false) {
            LOG_FATAL(<< "Could not open output file '" << options.s_OutputFileName << "'");
            return EXIT_FAILURE;
        }
    }
    std::istream& input{inputFile != nullptr ? *inputFile : std::cin};
    std::ostream& output{outputFile != nullptr ? *outputFile : std::cout};

    mxfar::api::CStackedSeriesCsvParser::SStackedSeries series;
    if (mxfar::api::CStackedSeriesCsvParser{input}.parse(series) == false) {
        LOG_FATAL(<< "Failed to read the input series");
        return EXIT_FAILURE;
    }

    if (options.s_Threads > 0) {
        mxfar::core::startDefaultAsyncExecutor(options.s_Threads);
    }

    mxfar::api::CMxfarJsonOutputWriter writer{output};
    mxfar::api::CMxfarAnalysisRunner runner{options.s_Config, writer};
    try {
        runner.run(series);
    } catch (const std::exception& e) {
        LOG_FATAL(<< "Analysis failed: " << e.what());
        mxfar::core::stopDefaultAsyncExecutor();
        return EXIT_FAILURE;
    }

    mxfar::core::stopDefaultAsyncExecutor();

    if (output.fail()) {
        LOG_FATAL(<< "Failed to write results");
        return EXIT_FAILURE;
    }

    // This message makes it easier to spot process crashes in a log file - if
    // this isn't present in the log for a given PID and there's no other log
    // message indicating early exit then the process has probably core dumped
    LOG_DEBUG(<< "mxfar exiting");

    return EXIT_SUCCESS;
}
