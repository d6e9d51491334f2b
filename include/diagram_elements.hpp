#ifndef DIAGRAM_ELEMENTS_H
#define DIAGRAM_ELEMENTS_H

#include <vector>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <utility>

namespace parser
{
    using Properties = std::vector<std::pair<std::string, std::string>>;

    // an <mxCell> exactly as it appears in the document
    struct DirectCell
    {
        DirectCell() = default;

        auto operator<=>(const DirectCell &) const = default;

        std::optional<std::string> m_id;
        std::optional<std::string> m_value;
        std::optional<std::string> m_style;
        std::optional<std::string> m_parent;
        std::optional<std::string> m_edge;
        std::optional<std::string> m_source;
        std::optional<std::string> m_target;
    };

    // a <UserObject> / <object> wrapper: label and custom attributes on the
    // outside, the geometry-bearing <mxCell> nested inside
    struct WrappedCell
    {
        WrappedCell() = default;

        auto operator<=>(const WrappedCell &) const = default;

        std::optional<std::string> m_id;
        std::optional<std::string> m_label;
        std::optional<std::string> m_value;
        std::optional<std::string> m_link;
        Properties m_properties;
        std::optional<DirectCell> m_inner;
    };

    using CellRecord = std::variant<DirectCell, WrappedCell>;

    // the one cell shape everything downstream works with
    struct Cell
    {
        Cell() = default;
        Cell(
            std::string_view id,
            std::string_view value,
            std::optional<std::string> style,
            std::optional<std::string> parent
        )
            : m_id{id},
              m_value{value},
              m_style{std::move(style)},
              m_parent{std::move(parent)},
              m_is_edge{false} {}

        auto operator<=>(const Cell &) const = default;

        std::string m_id;
        std::string m_value;
        std::optional<std::string> m_style;
        std::optional<std::string> m_parent;
        bool m_is_edge = false;
        std::optional<std::string> m_source;
        std::optional<std::string> m_target;
        std::optional<std::string> m_hyperlink;
        Properties m_properties;
    };
}

#endif
