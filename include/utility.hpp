#ifndef UTILITY_H
#define UTILITY_H

#include <string>
#include <string_view>
#include <numeric> 
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace utility
{
    namespace ranges = std::ranges;
    namespace views = std::views;

    auto join_non_empty_strings(auto&& container, std::string_view delim) -> std::string
    {
        return fmt::format("{}", fmt::join(
                container | views::filter([](std::string_view s){ return !s.empty(); }), //filter the length zero elements
                delim
            )
        );
    }

    // replaces the handful of HTML entities draw.io leaves inside labels
    [[nodiscard]]
    auto decode_html(std::string_view html) -> std::string;

    // decode_html, then strip tags, then collapse runs of whitespace and trim
    [[nodiscard]]
    auto resolve_text(std::string_view html) -> std::string;

    // cuts to at most max_bytes without splitting a UTF-8 sequence
    [[nodiscard]]
    auto truncate(std::string_view text, std::size_t max_bytes) -> std::string;

    [[nodiscard]]
    auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]]
    auto trim(std::string_view str) -> std::string_view;
}

#endif
