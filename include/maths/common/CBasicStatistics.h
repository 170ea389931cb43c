/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_common_CBasicStatistics_h
#define INCLUDED_mxfar_maths_common_CBasicStatistics_h

#include <core/CNonInstantiatable.h>

#include <maths/common/CLinearAlgebraEigen.h>

#include <cstddef>
#include <vector>

namespace mxfar {
namespace maths {
namespace common {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Utility functions for computing basic sample statistics.
//!
//! Missing values are represented by NaN and every reduction over a
//! matrix ignores them, i.e. it is computed over the finite entries only.
class CBasicStatistics : private core::CNonInstantiatable {
public:
    using TDoubleVec = std::vector<double>;

    //! \brief An accumulator for the count and mean of a sample.
    template<typename T>
    struct SSampleCentralMoment1 {
        SSampleCentralMoment1() : s_Count{0.0}, s_Mean{} {}

        //! Add \p x with weight \p n.
        void add(const T& x, double n = 1.0) {
            if (n <= 0.0) {
                return;
            }
            s_Count += n;
            s_Mean += (n / s_Count) * (x - s_Mean);
        }

        //! Combine two moments.
        SSampleCentralMoment1& operator+=(const SSampleCentralMoment1& rhs) {
            if (rhs.s_Count > 0.0) {
                s_Count += rhs.s_Count;
                s_Mean += (rhs.s_Count / s_Count) * (rhs.s_Mean - s_Mean);
            }
            return *this;
        }

        double s_Count;
        T s_Mean;
    };

    //! Accumulator object to compute the sample mean.
    template<typename T>
    struct SSampleMean {
        using TAccumulator = SSampleCentralMoment1<T>;
    };

    //! Extract the count from an accumulator object.
    template<typename T>
    static double count(const SSampleCentralMoment1<T>& accumulator) {
        return accumulator.s_Count;
    }

    //! Extract the mean from an accumulator object.
    template<typename T>
    static const T& mean(const SSampleCentralMoment1<T>& accumulator) {
        return accumulator.s_Mean;
    }

    //! Compute the \p p quantile of \p values.
    //!
    //! This interpolates linearly between the order statistics, i.e. for
    //! n values it returns x(k) + (h - k) (x(k+1) - x(k)) where h = (n-1) p
    //! and k = floor(h). Non-finite values are ignored.
    //!
    //! \throws std::invalid_argument if \p p is not in [0, 1] or there are
    //! no finite values.
    static double quantile(TDoubleVec values, double p);

    //! Get the sum of the squares of the non-missing elements of \p values.
    static double sumOfSquares(const TDenseMatrix::TBase& values);

    //! Get the number of non-missing elements of \p values.
    static std::size_t countNonMissing(const TDenseMatrix::TBase& values);

    //! Get the mean of the non-missing elements of each column of \p values.
    //!
    //! \note A column without any non-missing element has a NaN mean.
    static TDenseVector columnMeans(const TDenseMatrix::TBase& values);
};
}
}
}

#endif // INCLUDED_mxfar_maths_common_CBasicStatistics_h
