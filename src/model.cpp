#include "../include/model.hpp"
#include "../include/utility.hpp"
#include "../include/logging.hpp"

#include <algorithm>
#include <ranges>

namespace model 
{
    // namespaces aliases
    namespace views  = std::views;
    namespace ranges = std::ranges;

    auto is_root_sentinel(std::string_view id) -> bool
    {
        return id == "0" || id == "1";
    }

    Node::Node(const parser::Cell& cell)
        : m_cell{cell},
          m_text{utility::resolve_text(cell.m_value)}
    {}

    auto Node::shape() const -> classify::ShapeType
    {
        return classify::classify_shape(m_cell.m_style);
    }

    auto Node::relation() const -> classify::RelationType
    {
        return classify::classify_relation(m_cell.m_style);
    }

    PageModel::PageModel(std::string_view name, const std::vector<parser::Cell>& cells)
        : m_name{name}
    {
        m_nodes.reserve(cells.size());
        for (const auto& cell : cells)
        {
            auto node = std::make_unique<Node>(cell);
            // a repeated id within a page: the later cell takes the slot
            if (!cell.m_id.empty())
            {
                m_index[cell.m_id] = node.get();
            }
            m_nodes.push_back(std::move(node));
        }

        // only parent -> child links are inserted here, nothing is walked,
        // so a cyclic parent chain cannot hang the build
        for (const auto& node : m_nodes)
        {
            if (node->m_cell.m_id.empty())
            {
                continue;
            }

            Node* parent = nullptr;
            const auto& parent_id = node->m_cell.m_parent;
            if (parent_id && !is_root_sentinel(*parent_id))
            {
                if (auto it = m_index.find(*parent_id); it != m_index.end())
                {
                    parent = it->second;
                }
            }

            if (parent != nullptr)
            {
                parent->m_children.push_back(node.get());
            }
            else
            {
                m_top_level.push_back(node.get());
            }
        }
    }

    auto PageModel::name() const -> const std::string&
    {
        return m_name;
    }

    auto PageModel::nodes() const -> const std::vector<std::unique_ptr<Node>>&
    {
        return m_nodes;
    }

    auto PageModel::top_level() const -> const std::vector<const Node*>&
    {
        return m_top_level;
    }

    auto PageModel::find(std::string_view id) const -> const Node*
    {
        if (auto it = m_index.find(std::string{id}); it != m_index.end())
        {
            return it->second;
        }
        return nullptr;
    }

    auto PageModel::parent_of(const Node& node) const -> const Node*
    {
        const auto& parent = node.m_cell.m_parent;
        if (!parent || parent->empty() || is_root_sentinel(*parent))
        {
            return nullptr;
        }
        return find(*parent);
    }

    auto PageModel::resolve_endpoint(const std::optional<std::string>& id) const -> std::string
    {
        if (!id || id->empty())
        {
            return "?";
        }
        if (auto node = find(*id); node != nullptr && node->has_text())
        {
            return node->m_text;
        }
        return *id;
    }

    auto PageModel::decode_error() const -> std::optional<parser::ParseError>
    {
        return m_decode_error;
    }

    auto build_page(const parser::Page& page) -> PageModel
    {
        PageModel model(page.m_name, page.m_cells);
        model.m_decode_error = page.m_decode_error;
        utility::logger()->debug("page '{}': {} top-level of {} nodes", 
            model.name(), model.top_level().size(), model.nodes().size());
        return model;
    }

    auto build_diagram(const parser::Document& document) -> std::vector<PageModel>
    {
        std::vector<PageModel> pages;
        pages.reserve(document.m_pages.size());
        for (const auto& page : document.m_pages)
        {
            pages.push_back(build_page(page));
        }
        return pages;
    }
}
