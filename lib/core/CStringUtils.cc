/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace mxfar {
namespace core {
namespace {
//! Check the outcome of a strto* call.
bool checkConversion(bool silent,
                     const std::string& str,
                     const char* type,
                     bool overflowed,
                     const char* endPtr) {
    if (overflowed) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << type
                      << ": " << ::strerror(errno));
        }
        return false;
    }
    if (endPtr == str.c_str() || (endPtr != nullptr && *endPtr != '\0')) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to " << type
                      << ": first invalid character " << endPtr);
        }
        return false;
    }
    return true;
}

bool isNegative(const std::string& str) {
    auto pos = str.find_first_not_of(CStringUtils::WHITESPACE_CHARS);
    return pos != std::string::npos && str[pos] == '-';
}
}

const std::string CStringUtils::WHITESPACE_CHARS{" \t\r\n\v\f"};

void CStringUtils::trimWhitespace(std::string& str) {
    CStringUtils::trim(WHITESPACE_CHARS, str);
}

void CStringUtils::trim(const std::string& toTrim, std::string& str) {
    if (toTrim.empty() || str.empty()) {
        return;
    }

    std::string::size_type pos{str.find_last_not_of(toTrim)};
    if (pos == std::string::npos) {
        // Special case - entire string is being trimmed
        str.clear();
        return;
    }

    str.erase(pos + 1);

    pos = str.find_first_not_of(toTrim);
    if (pos != std::string::npos && pos > 0) {
        str.erase(0, pos);
    }
}

void CStringUtils::tokenise(const std::string& delim,
                            const std::string& str,
                            TStrVec& tokens,
                            std::string& remainder) {
    std::string::size_type pos{0};
    for (;;) {
        std::string::size_type next{str.find(delim, pos)};
        if (next == std::string::npos) {
            remainder.assign(str, pos, str.size() - pos);
            break;
        }
        tokens.push_back(str.substr(pos, next - pos));
        pos = next + delim.size();
    }
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long& i) {
    if (str.empty()) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert empty string to unsigned long");
        }
        return false;
    }
    // strtoul silently negates negative input
    if (isNegative(str)) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert negative string '" << str << "' to unsigned long");
        }
        return false;
    }

    char* endPtr{nullptr};
    errno = 0;
    unsigned long ret{::strtoul(str.c_str(), &endPtr, 10)};
    if (checkConversion(silent, str, "unsigned long",
                        ret == ULONG_MAX && errno == ERANGE, endPtr) == false) {
        return false;
    }

    i = ret;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long long& i) {
    if (str.empty()) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert empty string to unsigned long long");
        }
        return false;
    }
    if (isNegative(str)) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert negative string '" << str
                      << "' to unsigned long long");
        }
        return false;
    }

    char* endPtr{nullptr};
    errno = 0;
    unsigned long long ret{::strtoull(str.c_str(), &endPtr, 10)};
    if (checkConversion(silent, str, "unsigned long long",
                        ret == ULLONG_MAX && errno == ERANGE, endPtr) == false) {
        return false;
    }

    i = ret;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& d) {
    if (str.empty()) {
        if (silent == false) {
            LOG_ERROR(<< "Unable to convert empty string to double");
        }
        return false;
    }

    char* endPtr{nullptr};
    errno = 0;
    double ret{::strtod(str.c_str(), &endPtr)};
    if (checkConversion(silent, str, "double",
                        (ret == HUGE_VAL || ret == -HUGE_VAL) && errno == ERANGE,
                        endPtr) == false) {
        return false;
    }

    d = ret;
    return true;
}
}
}
