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

#include <array>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/shared_ptr.hpp>

#include "fastbson/base/string_data.h"
#include "fastbson/logv2/log_attr.h"
#include "fastbson/logv2/log_component.h"
#include "fastbson/logv2/log_severity.h"

namespace fastbson::logv2 {

/**
 * Owns the Boost.Log sink and the per-component severity thresholds.
 *
 * Records are rendered as one JSON line each:
 *     {"t":...,"s":"I","c":"BSON","id":123,"msg":"...","attr":{...}}
 */
class LogManager {
public:
    static LogManager& global();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    /**
     * Sets the least severe level that is still emitted for 'component'. Defaults to Info.
     */
    void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity);
    LogSeverity getMinimumLogSeverity(LogComponent component) const;

    bool shouldLog(LogComponent component, LogSeverity severity) const {
        return severity.toInt() >= _minimumSeverity[component].load(std::memory_order_relaxed);
    }

    /**
     * While capturing, every emitted line is also kept in memory. Used by tests that assert on
     * log output.
     */
    void startCapturing();
    void stopCapturing();
    std::vector<std::string> getCapturedLines() const;

    void write(std::int32_t id,
               LogSeverity severity,
               LogComponent component,
               StringData message,
               const std::vector<detail::NamedAttribute>& attrs);

private:
    using Sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

    LogManager();

    std::array<std::atomic<int>, LogComponent::kNumLogComponents> _minimumSeverity;
    boost::shared_ptr<Sink> _sink;

    mutable std::mutex _captureMutex;
    bool _capturing = false;
    std::vector<std::string> _captured;
};

inline bool shouldLog(LogComponent component, LogSeverity severity) {
    return LogManager::global().shouldLog(component, severity);
}

inline void setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    LogManager::global().setMinimumLoggedSeverity(component, severity);
}

}  // namespace fastbson::logv2
