/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <ver/CBuildInfo.h>

#include <sstream>

#ifndef MXFAR_VERSION_NUMBER
#define MXFAR_VERSION_NUMBER "0.0.0"
#endif
#ifndef MXFAR_BUILD_NUMBER
#define MXFAR_BUILD_NUMBER "development"
#endif

namespace mxfar {
namespace ver {

const std::string CBuildInfo::VERSION_NUMBER{MXFAR_VERSION_NUMBER};
const std::string CBuildInfo::BUILD_NUMBER{MXFAR_BUILD_NUMBER};
const std::string CBuildInfo::COPYRIGHT{"Copyright (c) Elasticsearch BV"};

const std::string& CBuildInfo::versionNumber() {
    return VERSION_NUMBER;
}

const std::string& CBuildInfo::buildNumber() {
    return BUILD_NUMBER;
}

const std::string& CBuildInfo::copyright() {
    return COPYRIGHT;
}

std::string CBuildInfo::fullInfo() {
    std::ostringstream strm;
    strm << "mxfar (" << sizeof(void*) * 8 << " bit): Version " << VERSION_NUMBER
         << " (Build " << BUILD_NUMBER << ") " << COPYRIGHT;
    return strm.str();
}
}
}
