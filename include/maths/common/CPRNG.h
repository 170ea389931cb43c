/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_mxfar_maths_common_CPRNG_h
#define INCLUDED_mxfar_maths_common_CPRNG_h

#include <core/CNonInstantiatable.h>

#include <array>
#include <cstdint>
#include <limits>

namespace mxfar {
namespace maths {
namespace common {

//! \brief Fast pseudo random number generators.
//!
//! DESCRIPTION:\n
//! These satisfy the uniform random number generator concept so can be
//! used with the Boost.Random distributions. They are cheap to copy and
//! seed, which lets every bootstrap replicate own an independent stream.
//!
//! \see http://xoroshiro.di.unimi.it/ for the reference implementations.
class CPRNG : private core::CNonInstantiatable {
public:
    //! \brief The split mix generator.
    //!
    //! DESCRIPTION:\n
    //! Passes BigCrush but has only 64 bits of state. Its main use here
    //! is to expand a single seed into the state of CXorOShiro128Plus.
    class CSplitMix64 {
    public:
        using result_type = std::uint64_t;

    public:
        CSplitMix64();
        explicit CSplitMix64(std::uint64_t seed);

        bool operator==(CSplitMix64 other) const;
        bool operator!=(CSplitMix64 other) const { return !(*this == other); }

        //! Set to the default seed.
        void seed();
        //! Set to a specified \p seed.
        void seed(std::uint64_t seed);

        static constexpr std::uint64_t min() { return 0; }
        static constexpr std::uint64_t max() {
            return std::numeric_limits<std::uint64_t>::max();
        }

        //! Generate the next random number.
        std::uint64_t operator()();

        //! Fill the sequence [\p begin, \p end) with the next random numbers.
        template<typename ITR>
        void generate(ITR begin, ITR end) {
            for (/**/; begin != end; ++begin) {
                *begin = this->operator()();
            }
        }

        //! Discard the next \p n random numbers.
        void discard(std::uint64_t n);

    private:
        static const std::uint64_t A;
        static const std::uint64_t B;
        static const std::uint64_t C;

    private:
        std::uint64_t m_X;
    };

    //! \brief The xoroshiro128+ generator.
    //!
    //! DESCRIPTION:\n
    //! The fastest generator we have which passes BigCrush with 128 bits
    //! of state, i.e. a period of 2^128 - 1.
    class CXorOShiro128Plus {
    public:
        using result_type = std::uint64_t;

    public:
        CXorOShiro128Plus();
        explicit CXorOShiro128Plus(std::uint64_t seed);

        bool operator==(const CXorOShiro128Plus& other) const;
        bool operator!=(const CXorOShiro128Plus& other) const {
            return !(*this == other);
        }

        //! Set to the default seed.
        void seed();
        //! Set to a specified \p seed.
        void seed(std::uint64_t seed);

        static constexpr std::uint64_t min() { return 0; }
        static constexpr std::uint64_t max() {
            return std::numeric_limits<std::uint64_t>::max();
        }

        //! Generate the next random number.
        std::uint64_t operator()();

        //! Discard the next \p n random numbers.
        void discard(std::uint64_t n);

        //! Equivalent to 2^64 calls to operator(). This can be used to
        //! generate 2^64 non-overlapping subsequences.
        void jump();

    private:
        static const std::uint64_t JUMP[2];

    private:
        std::array<std::uint64_t, 2> m_X;
    };
};
}
}
}

#endif // INCLUDED_mxfar_maths_common_CPRNG_h
