#pragma once

#include <bankwatch/core/config.hpp>

#include <boost/outcome/experimental/status_result.hpp>

BANKWATCH_NAMESPACE_BEGIN

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;
namespace outcome_e = outcome::experimental;

template <typename T>
using Result = outcome_e::status_result<T>;

BANKWATCH_NAMESPACE_END
