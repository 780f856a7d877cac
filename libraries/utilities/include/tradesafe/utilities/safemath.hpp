/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#pragma once
#include <stdint.h>

#if defined __GNUC__
#if __GNUC__ >= 5
#define _GCC_BUILDIN_OVERFLOW
#endif
#endif

#ifndef _GCC_BUILDIN_OVERFLOW
#include <boost/safe_numerics/checked_default.hpp>
#include <boost/safe_numerics/checked_integer.hpp>
#endif

namespace tradesafe { namespace safemath {

#ifdef _GCC_BUILDIN_OVERFLOW

template<typename T1, typename T2, typename TR>
inline bool
add(T1 a, T2 b, TR& r) {
    return !__builtin_add_overflow(a, b, &r);
}

template<typename T1, typename T2, typename TR>
inline bool
sub(T1 a, T2 b, TR& r) {
    return !__builtin_sub_overflow(a, b, &r);
}

template<typename T1, typename T2, typename TR>
inline bool
mul(T1 a, T2 b, TR& r) {
    return !__builtin_mul_overflow(a, b, &r);
}

#else

template<typename T1, typename T2, typename TR>
inline bool
add(T1 a, T2 b, TR& r) {
    auto v = boost::safe_numerics::checked::add<TR>(a, b);
    if(v.exception()) {
        return false;
    }
    r = v;
    return true;
}

template<typename T1, typename T2, typename TR>
inline bool
sub(T1 a, T2 b, TR& r) {
    auto v = boost::safe_numerics::checked::subtract<TR>(a, b);
    if(v.exception()) {
        return false;
    }
    r = v;
    return true;
}

template<typename T1, typename T2, typename TR>
inline bool
mul(T1 a, T2 b, TR& r) {
    auto v = boost::safe_numerics::checked::multiply<TR>(a, b);
    if(v.exception()) {
        return false;
    }
    r = v;
    return true;
}

#endif

/**
 * Computes `value * bps / 10000` without loss and without overflow
 * Returns false when the intermediate product does not fit into TR
 */
template<typename T, typename TR>
inline bool
bps_of(T value, uint32_t bps, TR& r) {
    TR product = 0;
    if(!mul(value, bps, product)) {
        return false;
    }
    r = product / 10000;
    return true;
}

}} // namespace tradesafe::safemath
