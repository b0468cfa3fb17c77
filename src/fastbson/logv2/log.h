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

#include <cstdint>
#include <utility>
#include <vector>

#include "fastbson/base/string_data.h"
#include "fastbson/logv2/log_attr.h"
#include "fastbson/logv2/log_component.h"
#include "fastbson/logv2/log_manager.h"
#include "fastbson/logv2/log_severity.h"

/**
 * Structured logging. Usage:
 *
 *     #define FASTBSON_LOGV2_DEFAULT_COMPONENT ::fastbson::logv2::LogComponent::kBson
 *     #include "fastbson/logv2/log.h"
 *
 *     LOGV2(4100, "Learned field order", "schema"_attr = schemaId, "fields"_attr = n);
 *
 * The id must be unique across the code base. The message is a constant string; variable data
 * goes in named attributes.
 */

namespace fastbson::logv2::detail {

template <typename... Attrs>
void doLog(std::int32_t id,
           LogSeverity severity,
           LogComponent component,
           StringData message,
           Attrs&&... attrs) {
    std::vector<NamedAttribute> named;
    named.reserve(sizeof...(Attrs));
    (named.push_back(std::forward<Attrs>(attrs)), ...);
    LogManager::global().write(id, severity, component, message, named);
}

}  // namespace fastbson::logv2::detail

#define FASTBSON_LOGV2_IMPL(ID, SEVERITY, COMPONENT, MESSAGE, ...)                             \
    do {                                                                                      \
        if (::fastbson::logv2::shouldLog(COMPONENT, SEVERITY)) {                              \
            ::fastbson::logv2::detail::doLog(                                                 \
                ID, SEVERITY, COMPONENT, MESSAGE __VA_OPT__(, ) __VA_ARGS__);                 \
        }                                                                                     \
    } while (false)

#define LOGV2(ID, MESSAGE, ...)                                  \
    FASTBSON_LOGV2_IMPL(ID,                                      \
                        ::fastbson::logv2::LogSeverity::Info(),  \
                        FASTBSON_LOGV2_DEFAULT_COMPONENT,        \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_WARNING(ID, MESSAGE, ...)                            \
    FASTBSON_LOGV2_IMPL(ID,                                        \
                        ::fastbson::logv2::LogSeverity::Warning(), \
                        FASTBSON_LOGV2_DEFAULT_COMPONENT,          \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_ERROR(ID, MESSAGE, ...)                            \
    FASTBSON_LOGV2_IMPL(ID,                                      \
                        ::fastbson::logv2::LogSeverity::Error(), \
                        FASTBSON_LOGV2_DEFAULT_COMPONENT,        \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_FATAL_CONTINUE(ID, MESSAGE, ...)                    \
    FASTBSON_LOGV2_IMPL(ID,                                       \
                        ::fastbson::logv2::LogSeverity::Severe(), \
                        FASTBSON_LOGV2_DEFAULT_COMPONENT,         \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)

#define LOGV2_DEBUG(ID, DLEVEL, MESSAGE, ...)                            \
    FASTBSON_LOGV2_IMPL(ID,                                              \
                        ::fastbson::logv2::LogSeverity::Debug(DLEVEL),   \
                        FASTBSON_LOGV2_DEFAULT_COMPONENT,                \
                        MESSAGE __VA_OPT__(, ) __VA_ARGS__)
