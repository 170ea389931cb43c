/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CNonCopyable_h
#define INCLUDED_mxfar_core_CNonCopyable_h

namespace mxfar {
namespace core {

//! \brief
//! Mixin which deletes copy construction and assignment.
//!
//! DESCRIPTION:\n
//! Classes which own a unique resource, for example the logger singleton
//! or a pool of threads, should inherit privately from this class.
class CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_mxfar_core_CNonCopyable_h
