/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_mxfar_CCmdLineParser_h
#define INCLUDED_mxfar_mxfar_CCmdLineParser_h

#include <api/CMxfarAnalysisRunner.h>

#include <string>
#include <vector>

namespace mxfar {
namespace mxfar {

//! \brief
//! Very simple command line parser.
//!
//! DESCRIPTION:\n
//! Any long option can also be given in an INI style file passed with
//! --config. Values on the command line take precedence.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Put in a class rather than main to allow testing.
class CCmdLineParser {
public:
    using TStrVec = std::vector<std::string>;

    //! \brief The program options.
    struct SOptions {
        std::string s_InputFileName;
        std::string s_OutputFileName;
        std::string s_LogProperties;
        std::size_t s_Threads{0};
        api::CMxfarAnalysisRunner::SConfig s_Config;
    };

public:
    //! Parse the arguments and return options if appropriate.
    static bool parse(int argc, const char* const* argv, SOptions& options);

private:
    //! Parse a comma separated list of group sizes.
    static bool parseGroupSizes(const std::string& value,
                                api::CMxfarAnalysisRunner::TSizeVec& groupSizes);

private:
    static const std::string DESCRIPTION;
};
}
}

#endif // INCLUDED_mxfar_mxfar_CCmdLineParser_h
