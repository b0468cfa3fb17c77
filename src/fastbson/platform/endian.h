/**
 *    Copyright (C) 2018-present MongoDB, Inc.
 *
 *    This program is free software: you can redistribute it and/or modify
 *    it under the terms of the Server Side Public License, version 1,
 *    as published by MongoDB, Inc.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    Server Side Public License for more details.
 *
 *    You should have received a copy of the Server Side Public License
 *    along with this program. If not, see
 *    <http://www.mongodb.com/licensing/server-side-public-license>.
 *
 *    As a special exception, the copyright holders give permission to link the
 *    code of portions of this program with the OpenSSL library under certain
 *    conditions as described in each individual source file and distribute
 *    linked combinations including the program with the OpenSSL library. You
 *    must comply with the Server Side Public License in all respects for
 *    all of the code used other than as permitted herein. If you modify file(s)
 *    with this exception, you may extend this exception to your version of the
 *    file(s), but you are not obligated to do so. If you do not wish to do so,
 *    delete this exception statement from your version. If you delete this
 *    exception statement from all source files in the program, then also delete
 *    it in the license file.
 */

#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include <boost/endian/conversion.hpp>

namespace fastbson {
namespace endian {

constexpr bool kIsLittleEndian = std::endian::native == std::endian::little;

namespace detail {

/**
 * Byte swaps integral and floating point values. Floating point values go through an unsigned
 * integer of the same width so no signaling NaN is ever materialized in a register.
 */
template <typename T>
T byteSwap(T t) {
    static_assert(std::is_arithmetic_v<T>, "endian conversion requires an arithmetic type");
    if constexpr (sizeof(T) == 1) {
        return t;
    } else if constexpr (std::is_floating_point_v<T>) {
        using U = std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>;
        U u;
        std::memcpy(&u, &t, sizeof(T));
        u = boost::endian::endian_reverse(u);
        std::memcpy(&t, &u, sizeof(T));
        return t;
    } else {
        return boost::endian::endian_reverse(t);
    }
}

}  // namespace detail

template <typename T>
T nativeToBig(T t) {
    return kIsLittleEndian ? detail::byteSwap(t) : t;
}

template <typename T>
T bigToNative(T t) {
    return kIsLittleEndian ? detail::byteSwap(t) : t;
}

template <typename T>
T nativeToLittle(T t) {
    return kIsLittleEndian ? t : detail::byteSwap(t);
}

template <typename T>
T littleToNative(T t) {
    return kIsLittleEndian ? t : detail::byteSwap(t);
}

}  // namespace endian
}  // namespace fastbson
