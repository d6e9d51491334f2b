#include "../include/classifier.hpp"
#include "../include/utility.hpp"

#include <algorithm>
#include <array>
#include <ranges>

namespace classify
{
    namespace views  = std::views;
    namespace ranges = std::ranges;

    StyleTokens::StyleTokens(std::string_view style)
    {
        auto toks = style 
            | views::split(';') 
            | views::transform([](auto r){ return std::string_view(r.begin(), r.end()); });

        for (std::string_view tok : toks)
        {
            tok = utility::trim(tok);
            if (tok.empty())
            {
                continue;
            }

            if (auto eq = tok.find('='); eq != std::string_view::npos)
            {
                auto key = utility::to_lower(utility::trim(tok.substr(0, eq)));
                auto val = utility::to_lower(utility::trim(tok.substr(eq + 1)));
                m_values.insert_or_assign(std::move(key), std::move(val));
            }
            else
            {
                m_flags.insert(utility::to_lower(tok));
            }
        }
    }

    auto StyleTokens::has_flag(std::string_view flag) const -> bool
    {
        return m_flags.contains(std::string{flag});
    }

    auto StyleTokens::value(std::string_view key) const -> std::optional<std::string_view>
    {
        if (auto it = m_values.find(std::string{key}); it != m_values.end())
        {
            return std::string_view{it->second};
        }
        return std::nullopt;
    }

    auto StyleTokens::shape_is(std::string_view name) const -> bool
    {
        return value("shape") == name || has_flag(name);
    }

    auto StyleTokens::shape_starts_with(std::string_view prefix) const -> bool
    {
        auto shape = value("shape");
        return shape.has_value() && shape->starts_with(prefix);
    }

    auto StyleTokens::mentions(std::string_view word) const -> bool
    {
        auto contains = [word](std::string_view s){ return s.find(word) != std::string_view::npos; };

        return ranges::any_of(m_flags, contains) 
            || ranges::any_of(m_values, [&](const auto& kv){ return contains(kv.first) || contains(kv.second); });
    }

    auto StyleTokens::empty() const -> bool
    {
        return m_values.empty() && m_flags.empty();
    }

    namespace rules
    {
        template <typename T>
        struct Rule
        {
            T type;
            bool (*matches)(const StyleTokens&);
        };

        // first match wins, so the order here is part of the behaviour
        static const std::array<Rule<ShapeType>, 17> shape_rules{{
            {ShapeType::Swimlane,      [](const StyleTokens& s){ return s.mentions("swimlane"); }},
            {ShapeType::Decision,      [](const StyleTokens& s){ return s.mentions("rhombus"); }},
            {ShapeType::StartEnd,      [](const StyleTokens& s){ return s.mentions("doubleellipse"); }},
            {ShapeType::Ellipse,       [](const StyleTokens& s){ return s.mentions("ellipse"); }},
            {ShapeType::Database,      [](const StyleTokens& s){ return s.mentions("cylinder"); }},
            {ShapeType::Cloud,         [](const StyleTokens& s){ return s.mentions("cloud"); }},
            {ShapeType::Process,       [](const StyleTokens& s){ return s.shape_starts_with("process"); }},
            {ShapeType::Bpmn,          [](const StyleTokens& s){ return s.shape_starts_with("mxgraph.bpmn"); }},
            {ShapeType::Icon,          [](const StyleTokens& s){ return s.shape_is("image"); }},
            {ShapeType::Hexagon,       [](const StyleTokens& s){ return s.mentions("hexagon"); }},
            {ShapeType::Parallelogram, [](const StyleTokens& s){ return s.mentions("parallelogram"); }},
            {ShapeType::Document,      [](const StyleTokens& s){ return s.shape_is("document"); }},
            {ShapeType::Callout,       [](const StyleTokens& s){ return s.mentions("callout"); }},
            {ShapeType::Note,          [](const StyleTokens& s){ return s.shape_is("note"); }},
            {ShapeType::Text,          [](const StyleTokens& s){ return s.has_flag("text"); }},
            {ShapeType::Group,         [](const StyleTokens& s){ return s.shape_is("group"); }},
            {ShapeType::RoundedRect,   [](const StyleTokens& s){ return s.mentions("rounded"); }},
        }};

        static auto end_arrow_is(const StyleTokens& s, std::string_view head) -> bool
        {
            return s.value("endarrow") == head;
        }

        static const std::array<Rule<RelationType>, 6> relation_rules{{
            {RelationType::Dependency,  [](const StyleTokens& s){ return s.mentions("dashed"); }},
            {RelationType::Inheritance, [](const StyleTokens& s){ return end_arrow_is(s, "block") && s.value("endfill") == "0"; }},
            {RelationType::Flow,        [](const StyleTokens& s){ return end_arrow_is(s, "block"); }},
            {RelationType::Composition, [](const StyleTokens& s){ return end_arrow_is(s, "diamond") || end_arrow_is(s, "diamondthin"); }},
            // a dash pattern without the dashed key still reads as dashed here
            {RelationType::Message,     [](const StyleTokens& s){ 
                return end_arrow_is(s, "open") && (s.mentions("dashed") || s.value("dashpattern").has_value()); }},
            {RelationType::Aggregation, [](const StyleTokens& s){ return end_arrow_is(s, "open"); }},
        }};
    }

    auto classify_shape(const StyleTokens& style) -> ShapeType
    {
        if (style.empty())
        {
            return ShapeType::Shape;
        }
        auto it = ranges::find_if(rules::shape_rules, [&](const auto& rule){ return rule.matches(style); });
        return it != rules::shape_rules.end() ? it->type : ShapeType::Shape;
    }

    auto classify_shape(const std::optional<std::string>& style) -> ShapeType
    {
        if (!style)
        {
            return ShapeType::Shape;
        }
        return classify_shape(StyleTokens{*style});
    }

    auto classify_relation(const StyleTokens& style) -> RelationType
    {
        if (style.empty())
        {
            return RelationType::Association;
        }
        auto it = ranges::find_if(rules::relation_rules, [&](const auto& rule){ return rule.matches(style); });
        if (it != rules::relation_rules.end())
        {
            return it->type;
        }

        // a plain connector (routed, or with some other arrowhead) is a flow;
        // with no connector signal at all it is a bare association
        if (style.value("edgestyle").has_value() || style.value("endarrow").has_value())
        {
            return RelationType::Flow;
        }
        return RelationType::Association;
    }

    auto classify_relation(const std::optional<std::string>& style) -> RelationType
    {
        if (!style)
        {
            return RelationType::Association;
        }
        return classify_relation(StyleTokens{*style});
    }

    auto to_string(ShapeType type) -> std::string_view
    {
        switch (type)
        {
        case ShapeType::Swimlane:      return "swimlane";
        case ShapeType::Decision:      return "decision";
        case ShapeType::StartEnd:      return "start-end";
        case ShapeType::Ellipse:       return "ellipse";
        case ShapeType::Database:      return "database";
        case ShapeType::Cloud:         return "cloud";
        case ShapeType::Process:       return "process";
        case ShapeType::Bpmn:          return "bpmn";
        case ShapeType::Icon:          return "icon";
        case ShapeType::Hexagon:       return "hexagon";
        case ShapeType::Parallelogram: return "parallelogram";
        case ShapeType::Document:      return "document";
        case ShapeType::Callout:       return "callout";
        case ShapeType::Note:          return "note";
        case ShapeType::Text:          return "text";
        case ShapeType::Group:         return "group";
        case ShapeType::RoundedRect:   return "rounded-rect";
        case ShapeType::Shape:         return "shape";
        }
        return "shape";
    }

    auto to_string(RelationType type) -> std::string_view
    {
        switch (type)
        {
        case RelationType::Dependency:  return "dependency";
        case RelationType::Inheritance: return "inheritance";
        case RelationType::Flow:        return "flow";
        case RelationType::Composition: return "composition";
        case RelationType::Message:     return "message";
        case RelationType::Aggregation: return "aggregation";
        case RelationType::Association: return "association";
        }
        return "association";
    }
}
