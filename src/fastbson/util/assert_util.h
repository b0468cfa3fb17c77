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

#include <exception>
#include <string>
#include <utility>

#include "fastbson/base/error_codes.h"
#include "fastbson/base/status.h"
#include "fastbson/base/status_with.h"
#include "fastbson/base/string_data.h"
#include "fastbson/platform/compiler.h"

namespace fastbson {

/**
 * Most fastbson exceptions inherit from this. Every DBException carries a non-OK Status; the code
 * is what callers branch on, the reason is for humans.
 */
class DBException : public std::exception {
public:
    const char* what() const noexcept final {
        return reason().c_str();
    }

    virtual void addContext(StringData context) {
        _status.addContext(context);
    }

    Status toStatus(StringData context) const {
        return _status.withContext(context);
    }
    Status toStatus() const {
        return _status;
    }

    ErrorCodes::Error code() const {
        return _status.code();
    }

    const std::string& reason() const {
        return _status.reason();
    }

    std::string codeString() const {
        return _status.codeString();
    }

    std::string toString() const {
        return _status.toString();
    }

protected:
    explicit DBException(Status status) : _status(std::move(status)) {}

private:
    Status _status;
};

/**
 * The exception thrown by the uassert family. Reaching one means the input or the caller did
 * something wrong, not that this library is broken.
 */
class AssertionException : public DBException {
public:
    explicit AssertionException(Status status) : DBException(std::move(status)) {}
};

FASTBSON_COMPILER_NORETURN void invariantFailed(const char* expr,
                                                const char* file,
                                                unsigned line) noexcept;

FASTBSON_COMPILER_NORETURN void invariantFailedWithMsg(const char* expr,
                                                       const std::string& msg,
                                                       const char* file,
                                                       unsigned line) noexcept;

FASTBSON_COMPILER_NORETURN void invariantOKFailed(const char* expr,
                                                  const Status& status,
                                                  const char* file,
                                                  unsigned line) noexcept;

/**
 * A "user assertion". Throws AssertionException carrying the given code and message.
 */
FASTBSON_COMPILER_NORETURN void uassertedWithLocation(const Status& status,
                                                      const char* file,
                                                      unsigned line);

inline void uassertedWithLocation(int msgid,
                                  const std::string& msg,
                                  const char* file,
                                  unsigned line) {
    uassertedWithLocation(Status(ErrorCodes::Error(msgid), msg), file, line);
}

#define uasserted(...) ::fastbson::uassertedWithLocation(__VA_ARGS__, __FILE__, __LINE__)

/**
 * "user assert". If asserts, user did something wrong, not our code.
 *
 * Using an immediately invoked lambda to give the compiler an easy way to inline the check (expr)
 * and out-of-line the error path. The call to the lambda is followed by
 * FASTBSON_COMPILER_UNREACHABLE as it is impossible to mark a lambda noreturn.
 */
#define uassert(msgid, msg, expr)                                                  \
    do {                                                                           \
        if (FASTBSON_unlikely(!(expr))) {                                          \
            [&]() FASTBSON_COMPILER_COLD_FUNCTION {                                \
                ::fastbson::uassertedWithLocation(msgid, msg, __FILE__, __LINE__); \
            }();                                                                   \
            FASTBSON_COMPILER_UNREACHABLE;                                         \
        }                                                                          \
    } while (false)

#define uassertStatusOK(...) \
    ::fastbson::uassertStatusOKWithLocation(__VA_ARGS__, __FILE__, __LINE__)

inline void uassertStatusOKWithLocation(const Status& status, const char* file, unsigned line) {
    if (FASTBSON_unlikely(!status.isOK())) {
        uassertedWithLocation(status, file, line);
    }
}

template <typename T>
inline T uassertStatusOKWithLocation(StatusWith<T> sw, const char* file, unsigned line) {
    uassertStatusOKWithLocation(sw.getStatus(), file, line);
    return std::move(sw.getValue());
}

/**
 * invariant() terminates the process. It is reserved for broken internal logic; bad input is
 * always reported through a Status or a uassert.
 */
#define FASTBSON_invariant_1(expr)                                  \
    do {                                                            \
        if (FASTBSON_unlikely(!(expr))) {                           \
            ::fastbson::invariantFailed(#expr, __FILE__, __LINE__); \
        }                                                           \
    } while (false)

#define FASTBSON_invariant_2(expr, msg)                                         \
    do {                                                                        \
        if (FASTBSON_unlikely(!(expr))) {                                       \
            ::fastbson::invariantFailedWithMsg(#expr, msg, __FILE__, __LINE__); \
        }                                                                       \
    } while (false)

#define FASTBSON_invariant_SELECT(_1, _2, NAME, ...) NAME
#define invariant(...) \
    FASTBSON_invariant_SELECT(__VA_ARGS__, FASTBSON_invariant_2, FASTBSON_invariant_1)(__VA_ARGS__)

#define invariantStatusOK(expr)                                                         \
    do {                                                                                \
        const ::fastbson::Status& _invariantStatus = (expr);                            \
        if (FASTBSON_unlikely(!_invariantStatus.isOK())) {                              \
            ::fastbson::invariantOKFailed(#expr, _invariantStatus, __FILE__, __LINE__); \
        }                                                                               \
    } while (false)

#define FASTBSON_UNREACHABLE \
    ::fastbson::invariantFailed("Hit a FASTBSON_UNREACHABLE!", __FILE__, __LINE__)

/** Formats the " :: caused by :: " suffix used when wrapping errors. */
std::string causedBy(StringData e);
std::string causedBy(const DBException& e);
std::string causedBy(const Status& e);

}  // namespace fastbson
