/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_test_BoostTestCloseAbsolute_h
#define INCLUDED_mxfar_test_BoostTestCloseAbsolute_h

#include <boost/test/test_tools.hpp>

#include <Eigen/Core>

#include <cmath>

namespace mxfar {
namespace test {

//! Check if \p lhs and \p rhs differ by at most \p tolerance.
//!
//! The failure message contains the difference.
inline boost::test_tools::assertion_result
closeAbsolute(double lhs, double rhs, double tolerance) {
    double difference{std::fabs(lhs - rhs)};
    boost::test_tools::assertion_result result{difference <= tolerance};
    if (!result) {
        result.message() << "|" << lhs << " - " << rhs << "| = " << difference
                         << " > " << tolerance;
    }
    return result;
}

//! Check if every element of \p lhs and \p rhs differ by at most \p tolerance.
template<typename LHS, typename RHS>
boost::test_tools::assertion_result closeAbsolute(const Eigen::MatrixBase<LHS>& lhs,
                                                  const Eigen::MatrixBase<RHS>& rhs,
                                                  double tolerance) {
    if (lhs.rows() != rhs.rows() || lhs.cols() != rhs.cols()) {
        boost::test_tools::assertion_result result{false};
        result.message() << "shapes differ " << lhs.rows() << "x" << lhs.cols()
                         << " vs " << rhs.rows() << "x" << rhs.cols();
        return result;
    }
    double difference{(lhs - rhs).cwiseAbs().maxCoeff()};
    boost::test_tools::assertion_result result{difference <= tolerance};
    if (!result) {
        result.message() << "maximum difference " << difference << " > " << tolerance;
    }
    return result;
}
}
}

//! \brief
//! Extra Boost.Test macros for close absolute value.
//!
//! DESCRIPTION:\n
//! Boost.Test provides BOOST_CHECK_CLOSE_FRACTION which looks at the
//! relative difference between two values. Many of the quantities we
//! check, such as residuals, should be close to zero where a relative
//! difference is meaningless. These check the absolute difference of
//! two values or the maximum absolute difference of two matrices.
#define BOOST_WARN_CLOSE_ABSOLUTE(L, R, T) \
    BOOST_WARN((mxfar::test::closeAbsolute((L), (R), (T))))
#define BOOST_CHECK_CLOSE_ABSOLUTE(L, R, T) \
    BOOST_CHECK((mxfar::test::closeAbsolute((L), (R), (T))))
#define BOOST_REQUIRE_CLOSE_ABSOLUTE(L, R, T) \
    BOOST_REQUIRE((mxfar::test::closeAbsolute((L), (R), (T))))

#endif // INCLUDED_mxfar_test_BoostTestCloseAbsolute_h
