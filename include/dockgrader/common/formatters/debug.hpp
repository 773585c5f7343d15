#pragma once

#include <fmt/format.h>

namespace dockgrader {

/// Parses an optional '?' format spec, as in `{:?}`
struct DebugFormatter
{
    bool is_debug_format = false;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        auto it = ctx.begin();
        auto end = ctx.end();

        if (it != end && *it == '?') {
            is_debug_format = true;
            ++it;
        }

        return it;
    }
};

} // namespace dockgrader
