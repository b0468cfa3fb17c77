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
#include <tuple>
#include <type_traits>
#include <utility>

#include "fastbson/base/data_type.h"
#include "fastbson/base/error_codes.h"
#include "fastbson/base/status_with.h"
#include "fastbson/util/assert_util.h"

namespace fastbson {

/**
 * A read-only, non-owning window over a contiguous run of bytes. Every BSON document, array and
 * value the library hands out refers back into the caller's buffer through one of these.
 */
class ConstDataRange {
protected:
    // These are helper types to make ConstDataRange constructable either from a range of
    // byte-like pointers or from a container of byte-like values.
    template <typename T>
    constexpr static auto isByteV = ((std::is_integral_v<T> && sizeof(T) == 1) ||
                                     std::is_same_v<T, std::byte>);

    template <typename T, typename = void>
    struct HasDataSize : std::false_type {};

    template <typename T>
    struct HasDataSize<
        T,
        std::enable_if_t<std::is_void_v<
            std::void_t<decltype(std::declval<T>().data()), decltype(std::declval<T>().size())>>>>
        : std::true_type {};

    template <typename T, typename = void>
    struct ContiguousContainerOfByteLike : std::false_type {};

    template <typename T>
    struct ContiguousContainerOfByteLike<
        T,
        std::void_t<decltype(std::declval<T>().data()),
                    std::enable_if_t<isByteV<typename T::value_type> && HasDataSize<T>::value>>>
        : std::true_type {};

public:
    using byte_type = char;

    // begin and end should point to the first and one past last bytes in the range you wish to
    // view.
    //
    // debug_offset indicates that the ConstDataRange is located at an offset into some larger
    // logical buffer. Status messages returned on failure report positions relative to that
    // larger buffer.
    template <typename ByteLike, typename std::enable_if_t<isByteV<ByteLike>, int> = 0>
    ConstDataRange(const ByteLike* begin, const ByteLike* end, std::ptrdiff_t debug_offset = 0)
        : _begin(reinterpret_cast<const byte_type*>(begin)),
          _end(reinterpret_cast<const byte_type*>(end)),
          _debug_offset(debug_offset) {
        invariant(end >= begin);
    }

    // Constructing from nullptr, nullptr initializes an empty ConstDataRange.
    ConstDataRange(std::nullptr_t, std::nullptr_t, std::ptrdiff_t debug_offset = 0)
        : _begin(nullptr), _end(nullptr), _debug_offset(debug_offset) {}

    template <typename ByteLike, typename std::enable_if_t<isByteV<ByteLike>, int> = 0>
    ConstDataRange(const ByteLike* begin, std::size_t length, std::ptrdiff_t debug_offset = 0)
        : _begin(reinterpret_cast<const byte_type*>(begin)),
          _end(reinterpret_cast<const byte_type*>(_begin + length)),
          _debug_offset(debug_offset) {}

    // A view of a container of byte-like values, such as a std::vector<uint8_t> or a
    // std::string. The container must outlive the range.
    template <typename Container,
              typename std::enable_if_t<ContiguousContainerOfByteLike<Container>::value, int> = 0>
    ConstDataRange(const Container& container, std::ptrdiff_t debug_offset = 0)
        : ConstDataRange(container.data(), container.size(), debug_offset) {}

    const byte_type* data() const noexcept {
        return _begin;
    }

    const byte_type* end() const noexcept {
        return _end;
    }

    size_t length() const noexcept {
        return _end - _begin;
    }

    bool empty() const noexcept {
        return length() == 0;
    }

    std::ptrdiff_t debug_offset() const noexcept {
        return _debug_offset;
    }

    template <typename T>
    Status readIntoNoThrow(T* t, size_t offset = 0) const noexcept {
        if (offset > length()) {
            return makeOffsetStatus(offset);
        }

        return DataType::load(
            t, _begin + offset, length() - offset, nullptr, offset + _debug_offset);
    }

    template <typename T>
    StatusWith<T> readNoThrow(std::size_t offset = 0) const noexcept {
        T t(DataType::defaultConstruct<T>());
        Status s = readIntoNoThrow(&t, offset);

        if (s.isOK()) {
            return StatusWith<T>(std::move(t));
        } else {
            return StatusWith<T>(std::move(s));
        }
    }

    template <typename T>
    T read(std::size_t offset = 0) const {
        return uassertStatusOK(readNoThrow<T>(offset));
    }

    /**
     * Returns the sub-range [offset, offset + len) with its debug offset adjusted, or
     * UnexpectedEndOfBuffer when it would extend past the end of this range.
     */
    StatusWith<ConstDataRange> sliceNoThrow(size_t offset, size_t len) const noexcept {
        if (offset > length() || len > length() - offset) {
            return makeSliceStatus(offset, len);
        }
        return ConstDataRange(_begin + offset, len, _debug_offset + offset);
    }

    ConstDataRange slice(size_t offset, size_t len) const {
        return uassertStatusOK(sliceNoThrow(offset, len));
    }

    /** The first 'len' bytes. */
    ConstDataRange slice(size_t len) const {
        return slice(0, len);
    }

    friend bool operator==(const ConstDataRange& lhs, const ConstDataRange& rhs) {
        return std::tie(lhs._begin, lhs._end) == std::tie(rhs._begin, rhs._end);
    }

    friend bool operator!=(const ConstDataRange& lhs, const ConstDataRange& rhs) {
        return !(lhs == rhs);
    }

protected:
    const byte_type* _begin;
    const byte_type* _end;
    std::ptrdiff_t _debug_offset;

    Status makeOffsetStatus(size_t offset) const;
    Status makeSliceStatus(size_t offset, size_t len) const;
};

}  // namespace fastbson
