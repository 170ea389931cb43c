/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/common/CMathsFuncs.h>

#include <api/CStackedSeriesCsvParser.h>

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(CStackedSeriesCsvParserTest)

using namespace mxfar;

namespace {
using TParser = api::CStackedSeriesCsvParser;
}

BOOST_AUTO_TEST_CASE(testParse) {

    std::istringstream input{"y1,\"y 2\",u\r\n"
                             "1.0,2.0,0.5\r\n"
                             "-1.5, 3e-1 ,-0.25\n"
                             "\n"
                             "4,,nan\n"};

    TParser::SStackedSeries series;
    BOOST_TEST_REQUIRE(TParser{input}.parse(series));

    BOOST_REQUIRE_EQUAL(std::size_t{2}, series.s_DimensionNames.size());
    BOOST_REQUIRE_EQUAL(std::string("y1"), series.s_DimensionNames[0]);
    BOOST_REQUIRE_EQUAL(std::string("y 2"), series.s_DimensionNames[1]);
    BOOST_REQUIRE_EQUAL(std::string("u"), series.s_ReferenceName);

    BOOST_REQUIRE_EQUAL(3, series.s_Y.rows());
    BOOST_REQUIRE_EQUAL(2, series.s_Y.cols());
    BOOST_REQUIRE_EQUAL(3, series.s_U.size());

    BOOST_REQUIRE_EQUAL(1.0, series.s_Y(0, 0));
    BOOST_REQUIRE_EQUAL(2.0, series.s_Y(0, 1));
    BOOST_REQUIRE_EQUAL(0.5, series.s_U(0));
    BOOST_REQUIRE_EQUAL(-1.5, series.s_Y(1, 0));
    BOOST_REQUIRE_EQUAL(0.3, series.s_Y(1, 1));
    BOOST_REQUIRE_EQUAL(-0.25, series.s_U(1));
    BOOST_REQUIRE_EQUAL(4.0, series.s_Y(2, 0));
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(series.s_Y(2, 1)));
    BOOST_TEST_REQUIRE(maths::common::CMathsFuncs::isNan(series.s_U(2)));
}

BOOST_AUTO_TEST_CASE(testSeparator) {

    std::istringstream input{"a\tb\tref\n1\t2\t3\n4\t5\t6\n"};

    TParser::SStackedSeries series;
    BOOST_TEST_REQUIRE(TParser(input, '\t').parse(series));
    BOOST_REQUIRE_EQUAL(2, series.s_Y.rows());
    BOOST_REQUIRE_EQUAL(5.0, series.s_Y(1, 1));
    BOOST_REQUIRE_EQUAL(6.0, series.s_U(1));
}

BOOST_AUTO_TEST_CASE(testMalformedInput) {

    TParser::SStackedSeries series;
    {
        std::istringstream input{""};
        BOOST_TEST_REQUIRE(TParser{input}.parse(series) == false);
    }
    {
        std::istringstream input{"y1,u\n"};
        BOOST_TEST_REQUIRE(TParser{input}.parse(series) == false);
    }
    {
        // Need a reference column.
        std::istringstream input{"y1\n1.0\n"};
        BOOST_TEST_REQUIRE(TParser{input}.parse(series) == false);
    }
    {
        std::istringstream input{"y1,y2,u\n1,2,3\n1,2\n"};
        BOOST_TEST_REQUIRE(TParser{input}.parse(series) == false);
    }
    {
        std::istringstream input{"y1,y2,u\n1,2,3\n1,two,3\n"};
        BOOST_TEST_REQUIRE(TParser{input}.parse(series) == false);
    }
    {
        std::istringstream input{"y1,y2,u\n1,\"2,3\n"};
        BOOST_TEST_REQUIRE(TParser{input}.parse(series) == false);
    }
}

BOOST_AUTO_TEST_SUITE_END()
