/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CStringUtils_h
#define INCLUDED_mxfar_core_CStringUtils_h

#include <core/CNonInstantiatable.h>

#include <string>
#include <vector>

namespace mxfar {
namespace core {

//! \brief
//! A holder of string utility methods.
class CStringUtils : private CNonInstantiatable {
public:
    //! We should only have one definition of whitespace across the whole
    //! product - this definition matches what ::isspace() considers as
    //! whitespace in the "C" locale
    static const std::string WHITESPACE_CHARS;

public:
    using TStrVec = std::vector<std::string>;

public:
    //! Convert a string to a type, logging an error on failure.
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert a string to a type without logging on failure.
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Trim whitespace from the beginning and end of a string.
    static void trimWhitespace(std::string& str);

    //! Trim any of the characters in \p toTrim from the beginning and end
    //! of \p str.
    static void trim(const std::string& toTrim, std::string& str);

    //! Split \p str at each occurrence of \p delim. Text after the last
    //! delimiter goes in \p remainder.
    static void tokenise(const std::string& delim,
                         const std::string& str,
                         TStrVec& tokens,
                         std::string& remainder);

private:
    static bool _stringToType(bool silent, const std::string& str, unsigned long& i);
    static bool _stringToType(bool silent, const std::string& str, unsigned long long& i);
    static bool _stringToType(bool silent, const std::string& str, double& d);
};
}
}

#endif // INCLUDED_mxfar_core_CStringUtils_h
