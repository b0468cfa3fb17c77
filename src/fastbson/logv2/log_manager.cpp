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

#include "fastbson/logv2/log_manager.h"

#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/make_shared.hpp>
#include <fmt/format.h>

#include "fastbson/util/str.h"

namespace fastbson::logv2 {

StringData LogSeverity::toStringDataCompact() const {
    switch (_severity) {
        case 4:
            return "F"_sd;
        case 3:
            return "E"_sd;
        case 2:
            return "W"_sd;
        case 0:
            return "I"_sd;
        case -1:
            return "D1"_sd;
        case -2:
            return "D2"_sd;
        case -3:
            return "D3"_sd;
        case -4:
            return "D4"_sd;
        case -5:
            return "D5"_sd;
    }
    return "I"_sd;
}

StringData LogComponent::getNameForLog() const {
    switch (_value) {
        case kDefault:
            return "-"_sd;
        case kBson:
            return "BSON"_sd;
        case kTest:
            return "TEST"_sd;
        case kNumLogComponents:
            break;
    }
    return "-"_sd;
}

LogManager& LogManager::global() {
    static LogManager* manager = new LogManager();
    return *manager;
}

LogManager::LogManager() {
    for (auto& severity : _minimumSeverity)
        severity.store(LogSeverity::Info().toInt(), std::memory_order_relaxed);

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    _sink = boost::make_shared<Sink>(backend);
    _sink->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
    boost::log::core::get()->add_sink(_sink);
}

void LogManager::setMinimumLoggedSeverity(LogComponent component, LogSeverity severity) {
    _minimumSeverity[component].store(severity.toInt(), std::memory_order_relaxed);
}

LogSeverity LogManager::getMinimumLogSeverity(LogComponent component) const {
    int value = _minimumSeverity[component].load(std::memory_order_relaxed);
    switch (value) {
        case 4:
            return LogSeverity::Severe();
        case 3:
            return LogSeverity::Error();
        case 2:
            return LogSeverity::Warning();
        case 0:
            return LogSeverity::Info();
        default:
            return LogSeverity::Debug(-value);
    }
}

void LogManager::startCapturing() {
    std::lock_guard<std::mutex> lk(_captureMutex);
    _captured.clear();
    _capturing = true;
}

void LogManager::stopCapturing() {
    std::lock_guard<std::mutex> lk(_captureMutex);
    _capturing = false;
}

std::vector<std::string> LogManager::getCapturedLines() const {
    std::lock_guard<std::mutex> lk(_captureMutex);
    return _captured;
}

void LogManager::write(std::int32_t id,
                       LogSeverity severity,
                       LogComponent component,
                       StringData message,
                       const std::vector<detail::NamedAttribute>& attrs) {
    fmt::memory_buffer buffer;
    auto out = std::back_inserter(buffer);
    fmt::format_to(out,
                   R"({{"t":{{"$date":"{}Z"}},"s":"{}","c":"{}","id":{},"msg":"{}")",
                   boost::posix_time::to_iso_extended_string(
                       boost::posix_time::microsec_clock::universal_time()),
                   severity.toStringDataCompact(),
                   component.getNameForLog(),
                   id,
                   str::escapeForJSON(message));
    if (!attrs.empty()) {
        fmt::format_to(out, R"(,"attr":{{)");
        bool first = true;
        for (const auto& attr : attrs) {
            if (!first)
                fmt::format_to(out, ",");
            first = false;
            if (attr.quoted) {
                fmt::format_to(
                    out, R"("{}":"{}")", attr.name, str::escapeForJSON(attr.value));
            } else {
                fmt::format_to(out, R"("{}":{})", attr.name, attr.value);
            }
        }
        fmt::format_to(out, "}}");
    }
    fmt::format_to(out, "}}");
    std::string line = fmt::to_string(buffer);

    {
        std::lock_guard<std::mutex> lk(_captureMutex);
        if (_capturing)
            _captured.push_back(line);
    }

    auto core = boost::log::core::get();
    boost::log::record rec = core->open_record(boost::log::attribute_set());
    if (rec) {
        boost::log::record_ostream strm(rec);
        strm << line;
        strm.flush();
        core->push_record(std::move(rec));
    }
}

}  // namespace fastbson::logv2
