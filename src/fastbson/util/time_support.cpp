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

#include "fastbson/util/time_support.h"

#include <ostream>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <fmt/format.h>

namespace fastbson {

std::string Date_t::toString() const {
    using boost::posix_time::ptime;
    static const ptime kEpoch(boost::gregorian::date(1970, 1, 1));
    const ptime t = kEpoch + boost::posix_time::milliseconds(millis);
    const auto date = t.date();
    const auto tod = t.time_of_day();
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(date.year()),
                       static_cast<int>(date.month()),
                       static_cast<int>(date.day()),
                       tod.hours(),
                       tod.minutes(),
                       tod.seconds(),
                       tod.total_milliseconds() % 1000);
}

std::ostream& operator<<(std::ostream& os, Date_t date) {
    return os << date.toString();
}

}  // namespace fastbson
