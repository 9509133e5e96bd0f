// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <bankwatch/core/assert.h>
#include <bankwatch/core/config.hpp>
#include <bankwatch/storage/copy_binary.hpp>

#include <bit>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

BANKWATCH_NAMESPACE_BEGIN

namespace
{
    constexpr std::string_view COPY_SIGNATURE{"PGCOPY\n\377\r\n\0", 11};
}

template <class T>
void CopyBinaryWriter::put(T const v)
{
    static_assert(std::is_integral_v<T>);
    auto be = static_cast<std::make_unsigned_t<T>>(v);
    if constexpr (std::endian::native != std::endian::big && sizeof(T) > 1) {
        be = std::byteswap(be);
    }
    buf_.append(reinterpret_cast<char const *>(&be), sizeof(be));
}

CopyBinaryWriter::CopyBinaryWriter()
{
    buf_.append(COPY_SIGNATURE);
    put(int32_t{0}); // flags
    put(int32_t{0}); // header extension length
}

void CopyBinaryWriter::begin_row(int16_t const nfields)
{
    BANKWATCH_ASSERT(!finished_);
    BANKWATCH_ASSERT(pending_fields_ == 0, "previous row is incomplete");
    BANKWATCH_ASSERT(nfields > 0);
    put(nfields);
    pending_fields_ = nfields;
}

void CopyBinaryWriter::add_null()
{
    BANKWATCH_ASSERT(pending_fields_ > 0);
    put(int32_t{-1});
    --pending_fields_;
}

void CopyBinaryWriter::add_int8(int64_t const v)
{
    BANKWATCH_ASSERT(pending_fields_ > 0);
    put(int32_t{sizeof(v)});
    put(v);
    --pending_fields_;
}

void CopyBinaryWriter::add_bool(bool const v)
{
    BANKWATCH_ASSERT(pending_fields_ > 0);
    put(int32_t{1});
    put(static_cast<uint8_t>(v));
    --pending_fields_;
}

void CopyBinaryWriter::add_text(std::string_view const v)
{
    BANKWATCH_ASSERT(pending_fields_ > 0);
    put(static_cast<int32_t>(v.size()));
    buf_.append(v);
    --pending_fields_;
}

void CopyBinaryWriter::add_timestamptz(
    std::chrono::system_clock::time_point const tp)
{
    using namespace std::chrono;
    BANKWATCH_ASSERT(pending_fields_ > 0);
    auto const micros = duration_cast<microseconds>(tp.time_since_epoch()) -
                        seconds{POSTGRES_EPOCH_OFFSET};
    put(int32_t{sizeof(int64_t)});
    put(static_cast<int64_t>(micros.count()));
    --pending_fields_;
}

std::string CopyBinaryWriter::finish()
{
    BANKWATCH_ASSERT(!finished_);
    BANKWATCH_ASSERT(pending_fields_ == 0, "last row is incomplete");
    put(int16_t{-1});
    finished_ = true;
    return std::exchange(buf_, {});
}

BANKWATCH_NAMESPACE_END
