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

#include "fastbson/unittest/unittest.h"

#include <algorithm>

#include "fastbson/logv2/log_manager.h"

namespace fastbson {
namespace unittest {

Test::~Test() {
    if (_isCapturingLogMessages)
        stopCapturingLogMessages();
}

void Test::startCapturingLogMessages() {
    invariant(!_isCapturingLogMessages);
    _captured.clear();
    logv2::LogManager::global().startCapturing();
    _isCapturingLogMessages = true;
}

void Test::stopCapturingLogMessages() {
    invariant(_isCapturingLogMessages);
    _captured = logv2::LogManager::global().getCapturedLines();
    logv2::LogManager::global().stopCapturing();
    _isCapturingLogMessages = false;
}

std::size_t Test::countTextFormatLogLinesContaining(StringData needle) const {
    const std::string str = needle.toString();
    return std::count_if(_captured.begin(), _captured.end(), [&](const std::string& line) {
        return line.find(str) != std::string::npos;
    });
}

}  // namespace unittest
}  // namespace fastbson
