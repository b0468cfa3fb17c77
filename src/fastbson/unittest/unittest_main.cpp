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

#define FASTBSON_LOGV2_DEFAULT_COMPONENT ::fastbson::logv2::LogComponent::kTest

#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "fastbson/logv2/log.h"

namespace {

/**
 * FASTBSON_TEST_VERBOSE=<n> raises every component to debug level n.
 */
void initializeLogging() {
    using namespace fastbson::logv2;
    using namespace fastbson::literals;

    const char* verbose = std::getenv("FASTBSON_TEST_VERBOSE");
    if (!verbose)
        return;

    const int level = std::atoi(verbose);
    if (level <= 0)
        return;

    for (int i = 0; i < LogComponent::kNumLogComponents; ++i) {
        setMinimumLoggedSeverity(LogComponent(static_cast<LogComponent::Value>(i)),
                                 LogSeverity::Debug(level));
    }
    LOGV2(7310401, "Verbose test logging enabled", "level"_attr = level);
}

}  // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    initializeLogging();
    return RUN_ALL_TESTS();
}
