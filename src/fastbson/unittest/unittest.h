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

#include <cstddef>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>
#include <gtest/gtest.h>

#include "fastbson/base/status.h"
#include "fastbson/base/status_with.h"
#include "fastbson/base/string_data.h"
#include "fastbson/util/assert_util.h"

/**
 * Assertion macros layered over GoogleTest. Test files include this header rather than gtest
 * directly.
 */

namespace fastbson {
namespace unittest {

inline const Status& toStatus(const Status& status) {
    return status;
}

template <typename T>
const Status& toStatus(const StatusWith<T>& statusWith) {
    return statusWith.getStatus();
}

/**
 * Base fixture for tests that assert on log output. Capturing is stopped automatically when the
 * test ends.
 */
class Test : public ::testing::Test {
public:
    ~Test() override;

protected:
    void startCapturingLogMessages();
    void stopCapturingLogMessages();

    const std::vector<std::string>& getCapturedTextFormatLogMessages() const {
        return _captured;
    }

    /** Number of captured lines containing 'needle'. */
    std::size_t countTextFormatLogLinesContaining(StringData needle) const;

private:
    bool _isCapturingLogMessages = false;
    std::vector<std::string> _captured;
};

}  // namespace unittest
}  // namespace fastbson

#define ASSERT_OK(EXPR) ASSERT_EQ(::fastbson::Status::OK(), ::fastbson::unittest::toStatus(EXPR))

#define EXPECT_OK(EXPR) EXPECT_EQ(::fastbson::Status::OK(), ::fastbson::unittest::toStatus(EXPR))

#define ASSERT_NOT_OK(EXPR) ASSERT_FALSE(::fastbson::unittest::toStatus(EXPR).isOK())

/** Asserts that a Status or StatusWith failed with the given code. */
#define ASSERT_STATUS_CODE(CODE, EXPR) \
    ASSERT_EQ(CODE, ::fastbson::unittest::toStatus(EXPR).code())

#define ASSERT_EQUALS(A, B) ASSERT_EQ(A, B)
#define ASSERT_NOT_EQUALS(A, B) ASSERT_NE(A, B)
#define ASSERT_LESS_THAN(A, B) ASSERT_LT(A, B)
#define ASSERT_GREATER_THAN(A, B) ASSERT_GT(A, B)
#define ASSERT(EXPR) ASSERT_TRUE(EXPR)

#define ASSERT_THROWS(STATEMENT, EXCEPTION_TYPE) ASSERT_THROW(STATEMENT, EXCEPTION_TYPE)

/**
 * Behaves like ASSERT_THROWS, above, but also fails if PREDICATE(ex) for the thrown exception,
 * ex, is false.
 */
#define ASSERT_THROWS_PRED(STATEMENT, EXCEPTION_TYPE, PREDICATE)                         \
    do {                                                                                 \
        bool threw_ = false;                                                             \
        try {                                                                            \
            STATEMENT;                                                                   \
        } catch (const EXCEPTION_TYPE& ex_) {                                            \
            threw_ = true;                                                               \
            ASSERT_TRUE(PREDICATE(ex_)) << "Unexpected exception: " << ex_.what();        \
        }                                                                                \
        ASSERT_TRUE(threw_) << "Statement " #STATEMENT " did not throw " #EXCEPTION_TYPE; \
    } while (false)

/**
 * Behaves like ASSERT_THROWS, above, but also fails if the exception's code() is not
 * EXPECTED_CODE.
 */
#define ASSERT_THROWS_CODE(STATEMENT, EXCEPTION_TYPE, EXPECTED_CODE) \
    ASSERT_THROWS_PRED(                                              \
        STATEMENT, EXCEPTION_TYPE, ([&](const EXCEPTION_TYPE& ex) {  \
            return (EXPECTED_CODE) == ex.code();                     \
        }))

#define ASSERT_STRING_CONTAINS(BIG_STRING, CONTAINS)                                     \
    do {                                                                                 \
        const std::string big_(BIG_STRING);                                              \
        const std::string small_(CONTAINS);                                              \
        ASSERT_NE(big_.find(small_), std::string::npos)                                  \
            << "'" << big_ << "' does not contain '" << small_ << "'";                   \
    } while (false)
