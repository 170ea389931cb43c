/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include "CCmdLineParser.h"

#include <core/CStringUtils.h>

#include <ver/CBuildInfo.h>

#include <maths/time_series/CFarParameters.h>

#include <boost/program_options.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>

namespace mxfar {
namespace mxfar {

const std::string CCmdLineParser::DESCRIPTION = "Usage: mxfar [options]\n"
                                                "Options";

bool CCmdLineParser::parse(int argc, const char* const* argv, SOptions& options) {
    using TParameters = maths::time_series::SFarParameters;
    try {
        std::string configFile;
        std::string groupSizes;
        std::string analysis;
        std::uint64_t seed{0};
        auto& config = options.s_Config;

        boost::program_options::options_description desc(DESCRIPTION);
        // clang-format off
        desc.add_options()
            ("help", "Display this information and exit")
            ("version", "Display version information and exit")
            ("config", boost::program_options::value<std::string>(&configFile),
                        "Optional INI file with values for any of the long options")
            ("logProperties", boost::program_options::value<std::string>(),
                        "Optional logger properties file")
            ("input", boost::program_options::value<std::string>(),
                        "Optional CSV file to read the stacked series from - not present means read from STDIN")
            ("output", boost::program_options::value<std::string>(),
                        "Optional file to write JSON results to - not present means write to STDOUT")
            ("analysis", boost::program_options::value<std::string>(&analysis)->default_value("estimate"),
                        "The analysis to run: estimate, mxfar, ape or nltest")
            ("groupSizes", boost::program_options::value<std::string>(&groupSizes),
                        "Comma separated number of series in each group - default is one group")
            ("seriesLength", boost::program_options::value<std::size_t>(&config.s_SeriesLength),
                        "The length of each series - default is the number of rows divided by the number of series")
            ("order", boost::program_options::value<std::size_t>(&config.s_Parameters.s_Order)->default_value(1),
                        "The autoregressive order")
            ("referenceLag", boost::program_options::value<std::size_t>(&config.s_Parameters.s_ReferenceLag)->default_value(1),
                        "The lag of the reference signal")
            ("bandwidth", boost::program_options::value<double>(&config.s_Parameters.s_BandwidthProportion)
                              ->default_value(TParameters::DEFAULT_BANDWIDTH_PROPORTION),
                        "The kernel bandwidth as a proportion of the reference signal range")
            ("numberPoints", boost::program_options::value<std::size_t>(&config.s_Parameters.s_NumberPoints)
                                 ->default_value(TParameters::DEFAULT_NUMBER_POINTS),
                        "The number of grid cut points")
            ("horizon", boost::program_options::value<std::size_t>(&config.s_Horizon)
                            ->default_value(api::CMxfarAnalysisRunner::DEFAULT_HORIZON),
                        "The number of values predicted in each cross-validation fold")
            ("folds", boost::program_options::value<std::size_t>(&config.s_Folds)
                          ->default_value(api::CMxfarAnalysisRunner::DEFAULT_FOLDS),
                        "The number of cross-validation folds")
            ("bootstrapReps", boost::program_options::value<std::size_t>(&config.s_TestParameters.s_BootstrapReplicates)
                                  ->default_value(maths::time_series::CFarNonlinearityTest::DEFAULT_BOOTSTRAP_REPLICATES),
                        "The number of bootstrap replicates of the nonlinearity test")
            ("seed", boost::program_options::value<std::uint64_t>(&seed)->default_value(0),
                        "The bootstrap random number generator seed")
            ("fpdc", boost::program_options::bool_switch(&config.s_ComputeCoherence),
                        "Compute the functional partial directed coherence of the estimates")
            ("threads", boost::program_options::value<std::size_t>(&options.s_Threads)->default_value(0),
                        "The number of worker threads - 0 means run on the calling thread")
        ;
        // clang-format on

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc),
                                      vm);
        if (vm.count("config") > 0) {
            const std::string& fileName{vm["config"].as<std::string>()};
            std::ifstream configStrm{fileName};
            if (configStrm.is_open() == false) {
                std::cerr << "Could not open config file '" << fileName << "'" << std::endl;
                return false;
            }
            boost::program_options::store(
                boost::program_options::parse_config_file(configStrm, desc), vm);
        }
        boost::program_options::notify(vm);

        if (vm.count("help") > 0) {
            std::cerr << desc << std::endl;
            return false;
        }
        if (vm.count("version") > 0) {
            std::cerr << ver::CBuildInfo::fullInfo() << std::endl;
            return false;
        }
        if (vm.count("logProperties") > 0) {
            options.s_LogProperties = vm["logProperties"].as<std::string>();
        }
        if (vm.count("input") > 0) {
            options.s_InputFileName = vm["input"].as<std::string>();
        }
        if (vm.count("output") > 0) {
            options.s_OutputFileName = vm["output"].as<std::string>();
        }
        if (api::CMxfarAnalysisRunner::analysisFromString(analysis, config.s_Analysis) == false) {
            std::cerr << "Unknown analysis '" << analysis << "'" << std::endl;
            return false;
        }
        if (vm.count("groupSizes") > 0 &&
            parseGroupSizes(groupSizes, config.s_GroupSizes) == false) {
            std::cerr << "Invalid group sizes '" << groupSizes << "'" << std::endl;
            return false;
        }
        config.s_TestParameters.s_Seed = seed;
    } catch (std::exception& e) {
        std::cerr << "Error processing command line: " << e.what() << std::endl;
        return false;
    }

    return true;
}

bool CCmdLineParser::parseGroupSizes(const std::string& value,
                                     api::CMxfarAnalysisRunner::TSizeVec& groupSizes) {
    TStrVec tokens;
    std::string remainder;
    core::CStringUtils::tokenise(",", value, tokens, remainder);
    tokens.push_back(remainder);

    groupSizes.clear();
    for (auto& token : tokens) {
        core::CStringUtils::trimWhitespace(token);
        std::size_t size{0};
        if (core::CStringUtils::stringToType(token, size) == false || size == 0) {
            return false;
        }
        groupSizes.push_back(size);
    }
    return true;
}
}
}
