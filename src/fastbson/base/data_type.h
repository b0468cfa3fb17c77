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
#include <cstring>
#include <type_traits>

#include "fastbson/base/error_codes.h"
#include "fastbson/base/status.h"
#include "fastbson/base/status_with.h"
#include "fastbson/base/string_data.h"

namespace fastbson {

/**
 * The load protocol shared by every typed read from a byte range.
 *
 * Handler<T>::load(T* t, ptr, length, advanced, debug_offset) decodes a T from [ptr, ptr+length).
 * 't' may be null, in which case the bytes are only validated and measured (a skip). On success
 * '*advanced' (when non-null) receives the number of bytes consumed; on failure it is left
 * untouched. 'debug_offset' is the absolute position of 'ptr' in the outermost buffer and is used
 * only for error messages.
 */
struct DataType {
    // Second template parameter allows templatized SFINAE specialization.
    template <typename T, typename = void>
    struct Handler {
        static void unsafeLoad(T* t, const char* ptr, size_t* advanced) {
            static_assert(std::is_trivially_copyable<T>::value,
                          "The generic DataType implementation requires values "
                          "to be trivially copyable. You may specialize the "
                          "template to use it with other types.");

            if (t) {
                std::memcpy(t, ptr, sizeof(T));
            }

            if (advanced) {
                *advanced = sizeof(T);
            }
        }

        static Status load(
            T* t, const char* ptr, size_t length, size_t* advanced, std::ptrdiff_t debug_offset) {
            if (sizeof(T) > length) {
                return DataType::makeTrivialLoadStatus(sizeof(T), length, debug_offset);
            }

            unsafeLoad(t, ptr, advanced);

            return Status::OK();
        }

        // Guarantees value initialization so no uninitialized memory leaks out of a failed load.
        static T defaultConstruct() {
            return T{};
        }
    };

    template <typename T>
    static Status load(
        T* t, const char* ptr, size_t length, size_t* advanced, std::ptrdiff_t debug_offset) {
        return Handler<T>::load(t, ptr, length, advanced, debug_offset);
    }

    template <typename T>
    static void unsafeLoad(T* t, const char* ptr, size_t* advanced) {
        Handler<T>::unsafeLoad(t, ptr, advanced);
    }

    template <typename T>
    static T defaultConstruct() {
        return Handler<T>::defaultConstruct();
    }

    static Status makeTrivialLoadStatus(size_t sizeOfT, size_t length, std::ptrdiff_t debug_offset);
};

/**
 * StringData consumes every available byte, producing StringData(ptr, length). It is mostly used
 * wrapped in Terminated<'\0', StringData> to read C strings.
 */
template <>
struct DataType::Handler<StringData> {
    static Status load(StringData* sdata,
                       const char* ptr,
                       size_t length,
                       size_t* advanced,
                       std::ptrdiff_t debug_offset);

    static StringData defaultConstruct() {
        return StringData();
    }
};

}  // namespace fastbson
