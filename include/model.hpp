#ifndef MODEL_H
#define MODEL_H

#include "diagram_elements.hpp"
#include "classifier.hpp"
#include "parser.hpp"

#include <string_view>
#include <optional>
#include <memory>
#include <vector>
#include <unordered_map>

namespace model
{
    // "0" is the invisible root, "1" the default layer
    [[nodiscard]]
    auto is_root_sentinel(std::string_view id) -> bool;

    struct Node
    {
        explicit Node(const parser::Cell& cell);

        auto has_text() const -> bool { return !m_text.empty(); }
        auto is_edge() const -> bool { return m_cell.m_is_edge; }

        // classified on demand from the style
        auto shape() const -> classify::ShapeType;
        auto relation() const -> classify::RelationType;

        parser::Cell m_cell;
        std::string m_text;
        std::vector<const Node*> m_children;
    };

    class PageModel
    {
    public:
        PageModel(std::string_view name, const std::vector<parser::Cell>& cells);

        PageModel(PageModel&&) = default;
        PageModel& operator=(PageModel&&) = default;

        auto name() const -> const std::string&;

        // every cell of the page in document order, including id-less ones
        auto nodes() const -> const std::vector<std::unique_ptr<Node>>&;
        auto top_level() const -> const std::vector<const Node*>&;

        auto find(std::string_view id) const -> const Node*;

        // nullptr for a missing, unknown or sentinel parent
        auto parent_of(const Node& node) const -> const Node*;

        // text of the referenced node, else the raw id, else "?"
        auto resolve_endpoint(const std::optional<std::string>& id) const -> std::string;

        auto decode_error() const -> std::optional<parser::ParseError>;

    private:
        std::string m_name;
        std::vector<std::unique_ptr<Node>> m_nodes;
        std::vector<const Node*> m_top_level;
        std::unordered_map<std::string, Node*> m_index;
        std::optional<parser::ParseError> m_decode_error;

        friend auto build_page(const parser::Page& page) -> PageModel;
    };

    [[nodiscard]]
    auto build_page(const parser::Page& page) -> PageModel;

    [[nodiscard]]
    auto build_diagram(const parser::Document& document) -> std::vector<PageModel>;
}

#endif
