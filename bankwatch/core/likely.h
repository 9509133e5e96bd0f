#pragma once

#define BANKWATCH_LIKELY(x) __builtin_expect(!!(x), 1)
#define BANKWATCH_UNLIKELY(x) __builtin_expect(!!(x), 0)
