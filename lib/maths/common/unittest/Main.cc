/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#define BOOST_TEST_MODULE lib.maths.common
// Defining BOOST_TEST_MODULE usually auto-generates main(), but we don't want
// this as we need custom initialisation to register the test observer
#define BOOST_TEST_NO_MAIN

#include <test/CTestObserver.h>

#include <boost/test/unit_test.hpp>

namespace {
bool init() {
    static mxfar::test::CTestObserver observer;
    boost::unit_test::framework::register_observer(observer);
    return ::init_unit_test();
}
}

int main(int argc, char** argv) {
    return boost::unit_test::unit_test_main(&init, argc, argv);
}
