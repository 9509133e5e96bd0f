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
#include <bankwatch/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BANKWATCH_NAMESPACE_BEGIN

enum class StorageError
{
    Success = 0,
    EncodeFailed,
    CopyFailed,
    WriteFailed,
    ConnectionLost,
};

BANKWATCH_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<bankwatch::StorageError>
    : quick_status_code_from_enum_defaults<bankwatch::StorageError>
{
    static constexpr auto const domain_name = "Storage Error";
    static constexpr auto const domain_uuid =
        "4f1c2b7e-9a3d-4e58-b6a1-0d2c7e9f3a14";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

BANKWATCH_NAMESPACE_BEGIN

/// Connection-level failures cannot be recovered in process
inline bool is_fatal(Result<void>::error_type const &error)
{
    return error == StorageError::ConnectionLost;
}

BANKWATCH_NAMESPACE_END
