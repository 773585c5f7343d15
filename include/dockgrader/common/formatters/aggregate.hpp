#pragma once

#include <dockgrader/common/formatters/debug.hpp>
#include <dockgrader/common/static_string.hpp>

#include <fmt/format.h>

#include <iterator>
#include <string_view>

namespace dockgrader::detail {

/// \tparam Fields - std::pair<StaticString, Aggregate::*>
///                            field name    field ptr
///                  Very annoying to declare manually, so use the macro below!
template <typename Aggregate, StaticString AggregateName, auto... Fields>
struct AggregateFormatter
{
    DebugFormatter debug_parser;

    constexpr auto parse(fmt::format_parse_context& ctx) {
        // parse a potential '?' spec
        return debug_parser.parse(ctx);
    }

    auto format(const Aggregate& from, fmt::format_context& ctx) const {
        // Seperator between elements
        constexpr std::string_view sep = ", ";

        auto out = ctx.out();
        bool first = true;

        auto field_writer = [&](const auto& pair) {
            if (!first) {
                out = fmt::format_to(out, "{}", sep);
            }
            first = false;

            if (debug_parser.is_debug_format) {
                out = fmt::format_to(out, ".{} = {}", pair.first.view(), (&from)->*(pair.second));
            } else {
                out = fmt::format_to(out, "{}", (&from)->*(pair.second));
            }
        };

        if (debug_parser.is_debug_format) {
            out = fmt::format_to(out, "{} {{", AggregateName.view());
        }

        (field_writer(Fields), ...);

        if (debug_parser.is_debug_format) {
            out = fmt::format_to(out, "}}");
        }

        return out;
    }
};

} // namespace dockgrader::detail
