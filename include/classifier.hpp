#ifndef CLASSIFIER_H
#define CLASSIFIER_H

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace classify
{
    enum class ShapeType
    {
        Swimlane,
        Decision,
        StartEnd,
        Ellipse,
        Database,
        Cloud,
        Process,
        Bpmn,
        Icon,
        Hexagon,
        Parallelogram,
        Document,
        Callout,
        Note,
        Text,
        Group,
        RoundedRect,
        Shape
    };

    enum class RelationType
    {
        Dependency,
        Inheritance,
        Flow,
        Composition,
        Message,
        Aggregation,
        Association
    };

    [[nodiscard]]
    auto to_string(ShapeType type) -> std::string_view;

    [[nodiscard]]
    auto to_string(RelationType type) -> std::string_view;

    // a draw.io style ("rounded=1;whiteSpace=wrap;ellipse;") split once into
    // key=value pairs and bare flags, all lower-cased
    class StyleTokens
    {
    public:
        explicit StyleTokens(std::string_view style);

        auto has_flag(std::string_view flag) const -> bool;
        auto value(std::string_view key) const -> std::optional<std::string_view>;

        // shape=<name> or a bare <name> flag
        auto shape_is(std::string_view name) const -> bool;
        auto shape_starts_with(std::string_view prefix) const -> bool;

        // any key, value or flag containing the word
        auto mentions(std::string_view word) const -> bool;

        auto empty() const -> bool;

    private:
        std::unordered_map<std::string, std::string> m_values;
        std::unordered_set<std::string> m_flags;
    };

    [[nodiscard]]
    auto classify_shape(const StyleTokens& style) -> ShapeType;

    [[nodiscard]]
    auto classify_shape(const std::optional<std::string>& style) -> ShapeType;

    [[nodiscard]]
    auto classify_relation(const StyleTokens& style) -> RelationType;

    [[nodiscard]]
    auto classify_relation(const std::optional<std::string>& style) -> RelationType;
}

#endif
