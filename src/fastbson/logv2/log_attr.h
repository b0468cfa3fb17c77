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

#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "fastbson/base/string_data.h"

namespace fastbson::logv2::detail {

/**
 * A formatted attribute value with its name. Values are rendered with {fmt} when the attribute is
 * created, so only statements that pass the severity check pay for formatting.
 */
struct NamedAttribute {
    StringData name;
    std::string value;
    bool quoted;
};

struct AttributeName {
    StringData name;

    template <typename T>
    NamedAttribute operator=(const T& value) const {
        using Decayed = std::decay_t<T>;
        constexpr bool isNumber = std::is_arithmetic_v<Decayed> && !std::is_same_v<Decayed, char>;
        return {name, fmt::format("{}", value), !isNumber};
    }
};

}  // namespace fastbson::logv2::detail

namespace fastbson {
inline namespace literals {

/**
 * Attributes are named with the _attr literal: "fieldCount"_attr = n.
 */
constexpr logv2::detail::AttributeName operator""_attr(const char* name, std::size_t len) {
    return {{name, len}};
}

}  // namespace literals
}  // namespace fastbson
