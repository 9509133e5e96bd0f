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

#pragma once

#include <bankwatch/core/config.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

BANKWATCH_NAMESPACE_BEGIN

/// Seconds between the unix epoch and the postgres epoch (2000-01-01)
inline constexpr int64_t POSTGRES_EPOCH_OFFSET = 946'684'800;

/// Builds a `COPY ... FROM STDIN BINARY` payload. Integers are written
/// big-endian; every row must add exactly the number of fields passed to
/// begin_row.
class CopyBinaryWriter
{
    std::string buf_;
    int16_t pending_fields_{0};
    bool finished_{false};

    template <class T>
    void put(T);

public:
    CopyBinaryWriter();

    void begin_row(int16_t nfields);

    void add_null();
    void add_int8(int64_t);
    void add_bool(bool);
    void add_text(std::string_view);
    void add_timestamptz(std::chrono::system_clock::time_point);

    void add_int8(std::optional<int64_t> const &v)
    {
        v.has_value() ? add_int8(*v) : add_null();
    }

    /// Appends the trailer and returns the payload; the writer is left empty
    std::string finish();
};

BANKWATCH_NAMESPACE_END
