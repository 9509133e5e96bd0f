#pragma once

#include <bankwatch/core/config.hpp>

#define BANKWATCH_FIBER_NAMESPACE_BEGIN                                        \
    BANKWATCH_NAMESPACE_BEGIN namespace fiber                                  \
    {

#define BANKWATCH_FIBER_NAMESPACE_END                                          \
    }                                                                          \
    BANKWATCH_NAMESPACE_END

#define BANKWATCH_FIBER_NAMESPACE ::bankwatch::fiber
