#pragma once

#include <dockgrader/common/formatters/debug.hpp>
#include <dockgrader/common/static_string.hpp>

#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <utility>

namespace dockgrader::detail {

/// \tparam Enumerators - std::pair<StaticString, Enum>
///                                 enumerator name   enumerator value
///                  Very annoying to declare manually, so use the macro instead!
template <typename Enum, StaticString EnumName, auto... Enumerators>
struct EnumFormatter
{
    DebugFormatter debug_parser;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        // parse a potential '?' spec
        return debug_parser.parse(ctx);
    }

    static constexpr std::optional<std::string_view> get_name(const Enum& from) {
        std::optional<std::string_view> res;
        ((Enumerators.second == from ? res = Enumerators.first.view() : res), ...);
        return res;
    }

    auto format(const Enum& from, fmt::format_context& ctx) const {
        auto name = get_name(from);

        if (!name.has_value()) {
            return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
        }

        if (debug_parser.is_debug_format) {
            return fmt::format_to(ctx.out(), "{}{{{}}}", EnumName.view(), *name);
        }

        return fmt::format_to(ctx.out(), "{}", *name);
    }
};

} // namespace dockgrader::detail
