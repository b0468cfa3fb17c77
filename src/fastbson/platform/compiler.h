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

/**
 * Compiler-specific macros. Only gcc and clang are supported.
 *
 * FASTBSON_COMPILER_COLD_FUNCTION marks functions on error paths so the compiler can move them
 * out of the hot path.
 *
 * FASTBSON_COMPILER_NORETURN marks functions that never return.
 *
 * FASTBSON_likely / FASTBSON_unlikely give branch prediction hints.
 *
 * FASTBSON_COMPILER_UNREACHABLE: reaching this macro is undefined behavior; prefer
 * FASTBSON_UNREACHABLE from assert_util.h, which terminates.
 */

#ifdef __clang__
#define FASTBSON_COMPILER_COLD_FUNCTION
#define FASTBSON_COMPILER_NORETURN __attribute__((__noreturn__))
#else
#define FASTBSON_COMPILER_COLD_FUNCTION __attribute__((__cold__))
#define FASTBSON_COMPILER_NORETURN __attribute__((__noreturn__, __cold__))
#endif

#define FASTBSON_COMPILER_ALWAYS_INLINE [[gnu::always_inline]]

#define FASTBSON_likely(x) static_cast<bool>(__builtin_expect(static_cast<bool>(x), 1))
#define FASTBSON_unlikely(x) static_cast<bool>(__builtin_expect(static_cast<bool>(x), 0))

#define FASTBSON_COMPILER_UNREACHABLE __builtin_unreachable()
