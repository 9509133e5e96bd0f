#pragma once

#include <bankwatch/core/config.hpp>

#include <quill/Fmt.h>

namespace fmt = fmtquill::v10;

BANKWATCH_NAMESPACE_BEGIN

struct BasicFormatter
{
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx)
    {
        return ctx.begin();
    }
};

BANKWATCH_NAMESPACE_END
