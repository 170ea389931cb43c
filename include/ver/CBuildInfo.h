/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_ver_CBuildInfo_h
#define INCLUDED_mxfar_ver_CBuildInfo_h

#include <string>

namespace mxfar {
namespace ver {

//! \brief
//! Wrapper for version/build numbers.
//!
//! DESCRIPTION:\n
//! Only use this class from within a program's own code, NEVER from within
//! a library.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The version library is a static library that is linked to each program.
//! The version and build numbers are supplied by the build system.
class CBuildInfo {
public:
    //! Get the version number to be printed out
    static const std::string& versionNumber();

    //! Get the build number to be printed out
    static const std::string& buildNumber();

    //! Get the copyright message to be printed out
    static const std::string& copyright();

    //! Get the full information to be printed out (this includes the name
    //! of the program, plus the version number, build number and copyright)
    static std::string fullInfo();

private:
    //! Disallow instantiation
    CBuildInfo() = delete;
    CBuildInfo(const CBuildInfo&) = delete;

private:
    static const std::string VERSION_NUMBER;
    static const std::string BUILD_NUMBER;
    static const std::string COPYRIGHT;
};
}
}

#endif // INCLUDED_mxfar_ver_CBuildInfo_h
