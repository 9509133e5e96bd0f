#pragma once

#include <bit>
#include <climits>

#define BANKWATCH_NAMESPACE_BEGIN                                              \
    namespace bankwatch                                                        \
    {

#define BANKWATCH_NAMESPACE_END }

#define BANKWATCH_NAMESPACE ::bankwatch

#define BANKWATCH_ANONYMOUS_NAMESPACE_BEGIN                                    \
    BANKWATCH_NAMESPACE_BEGIN                                                  \
    namespace                                                                  \
    {

#define BANKWATCH_ANONYMOUS_NAMESPACE_END                                      \
    }                                                                          \
    BANKWATCH_NAMESPACE_END

static_assert(CHAR_BIT == 8);

static_assert(
    std::endian::native == std::endian::big ||
    std::endian::native == std::endian::little);
