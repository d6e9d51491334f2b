#include "../include/utility.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <utility>

namespace utility
{
    namespace helpers
    {
        static auto replace_all(std::string& str, std::string_view from, std::string_view to) -> void
        {
            std::size_t pos = 0;
            while ((pos = str.find(from, pos)) != std::string::npos)
            {
                str.replace(pos, from.size(), to);
                pos += to.size();
            }
        }
    }

    auto decode_html(std::string_view html) -> std::string
    {
        // order matters: "&amp;lt;" must come out as "&lt;", not "<"
        static const std::array<std::pair<std::string_view, std::string_view>, 7> entities{{
            {"&lt;", "<"},
            {"&gt;", ">"},
            {"&amp;", "&"},
            {"&quot;", "\""},
            {"&#xa;", "\n"},
            {"&#x9;", "\t"},
            {"&nbsp;", " "},
        }};

        std::string out{html};
        for (const auto& [from, to] : entities)
        {
            helpers::replace_all(out, from, to);
        }
        return out;
    }

    auto resolve_text(std::string_view html) -> std::string
    {
        if (html.empty())
        {
            return std::string{};
        }

        static const std::regex tags("<[^>]*>");
        static const std::regex spaces("\\s+");

        auto stripped = std::regex_replace(decode_html(html), tags, "");
        auto collapsed = std::regex_replace(stripped, spaces, " ");
        return std::string{trim(collapsed)};
    }

    auto truncate(std::string_view text, std::size_t max_bytes) -> std::string
    {
        if (text.size() <= max_bytes)
        {
            return std::string{text};
        }
        // back up over continuation bytes (10xxxxxx)
        auto cut = max_bytes;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        {
            --cut;
        }
        return std::string{text.substr(0, cut)};
    }

    auto to_lower(std::string_view str) -> std::string
    {
        std::string out{str};
        ranges::transform(out, out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return out;
    }

    auto trim(std::string_view str) -> std::string_view
    {
        auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
        while (!str.empty() && is_space(str.front()))
        {
            str.remove_prefix(1);
        }
        while (!str.empty() && is_space(str.back()))
        {
            str.remove_suffix(1);
        }
        return str;
    }
}
