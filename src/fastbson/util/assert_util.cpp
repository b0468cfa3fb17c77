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

#define FASTBSON_LOGV2_DEFAULT_COMPONENT ::fastbson::logv2::LogComponent::kDefault

#include "fastbson/util/assert_util.h"

#include <cstdlib>

#include "fastbson/logv2/log.h"

namespace fastbson {

void uassertedWithLocation(const Status& status, const char* file, unsigned line) {
    LOGV2_DEBUG(23100,
                1,
                "User assertion",
                "error"_attr = status,
                "file"_attr = file,
                "line"_attr = line);
    throw AssertionException(status);
}

void invariantFailed(const char* expr, const char* file, unsigned line) noexcept {
    LOGV2_FATAL_CONTINUE(23101,
                         "Invariant failure",
                         "expr"_attr = expr,
                         "file"_attr = file,
                         "line"_attr = line);
    LOGV2_FATAL_CONTINUE(23102, "\n\n***aborting after invariant() failure\n\n");
    std::abort();
}

void invariantFailedWithMsg(const char* expr,
                            const std::string& msg,
                            const char* file,
                            unsigned line) noexcept {
    LOGV2_FATAL_CONTINUE(23103,
                         "Invariant failure",
                         "expr"_attr = expr,
                         "msg"_attr = msg,
                         "file"_attr = file,
                         "line"_attr = line);
    LOGV2_FATAL_CONTINUE(23104, "\n\n***aborting after invariant() failure\n\n");
    std::abort();
}

void invariantOKFailed(const char* expr,
                       const Status& status,
                       const char* file,
                       unsigned line) noexcept {
    LOGV2_FATAL_CONTINUE(23105,
                         "Invariant failure",
                         "expr"_attr = expr,
                         "error"_attr = status,
                         "file"_attr = file,
                         "line"_attr = line);
    LOGV2_FATAL_CONTINUE(23106, "\n\n***aborting after invariant() failure\n\n");
    std::abort();
}

std::string causedBy(StringData e) {
    return " :: caused by :: " + e;
}

std::string causedBy(const DBException& e) {
    return causedBy(e.toString());
}

std::string causedBy(const Status& e) {
    return causedBy(e.toString());
}

}  // namespace fastbson
