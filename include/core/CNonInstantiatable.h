/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_core_CNonInstantiatable_h
#define INCLUDED_mxfar_core_CNonInstantiatable_h

namespace mxfar {
namespace core {

//! \brief
//! Mixin for classes which only collect static functions.
//!
//! DESCRIPTION:\n
//! The estimators and statistical tests are stateless collections of
//! static functions and inherit privately from this class so they
//! can't be created by accident.
class CNonInstantiatable {
public:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_mxfar_core_CNonInstantiatable_h
