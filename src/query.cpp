#include "../include/query.hpp"
#include "../include/parser.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"
#include "../include/logging.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace query
{
    // namespaces aliases
    namespace views  = std::views;
    namespace ranges = std::ranges;

    namespace helpers
    {
        constexpr std::size_t max_depth = 64;
        constexpr std::size_t link_text_length = 60;

        static const std::array<std::pair<Operation, std::string_view>, 6> operation_names{{
            {Operation::Overview,      "get_diagram_overview"},
            {Operation::Components,    "parse_drawio"},
            {Operation::TextContent,   "extract_text_content"},
            {Operation::Classes,       "extract_classes"},
            {Operation::Relationships, "extract_relationships"},
            {Operation::Hierarchy,     "render_hierarchy"},
        }};

        static auto on_page(const std::optional<std::string>& page)
        {
            return [&page](const model::PageModel& p){ return !page || p.name() == *page; };
        }

        static auto filters_by_page(Operation operation) -> bool
        {
            return operation != Operation::Overview && operation != Operation::Classes;
        }

        static auto from_parse_error(const Request& request, parser::ParseError err) -> QueryError
        {
            auto kind = (err == parser::ParseError::EmptyPath || err == parser::ParseError::SourceUnavailable)
                ? QueryError::Kind::SourceUnavailable
                : QueryError::Kind::DocumentMalformed;

            return QueryError{
                kind,
                std::string{to_string(request.m_operation)},
                request.m_source.string(),
                std::string{parser::describe(err)}
            };
        }

        // walks the containment tree of one page; every node is emitted at most once
        class Walker
        {
        public:
            explicit Walker(const model::PageModel& page)
                : m_page{page} {}

            // iterative depth-first walk; every nesting level counts against max_depth,
            // untitled containers included, so the stack stays bounded on hostile input
            auto walk(const model::Node& node, std::size_t depth, std::vector<RenderLine>& out, bool start) -> void
            {
                std::vector<Frame> pending{{&node, depth, 0}};
                while (!pending.empty())
                {
                    auto frame = pending.back();
                    pending.pop_back();
                    const auto& current = *frame.node;

                    // orphans are only ever rendered from their own block
                    if (!(start && frame.node == &node) && is_orphan(current))
                    {
                        continue;
                    }
                    if (frame.level > max_depth || !m_visited.insert(frame.node).second)
                    {
                        continue;
                    }

                    if (current.is_edge())
                    {
                        auto text = current.has_text() ? current.m_text : m_page.resolve_endpoint(current.m_cell.m_target);
                        out.push_back({frame.depth, current.m_cell.m_id, text, std::string{classify::to_string(current.relation())}, true});
                        continue;
                    }

                    // an untitled container does not add a rendered level of its own
                    auto child_depth = frame.depth;
                    if (current.has_text())
                    {
                        out.push_back({frame.depth, current.m_cell.m_id, current.m_text, std::string{classify::to_string(current.shape())}, false});
                        child_depth = frame.depth + 1;
                    }

                    // pushed in reverse so shapes pop before edges, each in encounter order
                    for (const auto *child : current.m_children | views::filter([](auto *c){ return c->is_edge(); }) | views::reverse)
                    {
                        pending.push_back({child, child_depth, frame.level + 1});
                    }
                    for (const auto *child : current.m_children | views::filter([](auto *c){ return !c->is_edge(); }) | views::reverse)
                    {
                        pending.push_back({child, child_depth, frame.level + 1});
                    }
                }
            }

            auto is_orphan(const model::Node& node) const -> bool
            {
                if (node.is_edge() || !node.has_text())
                {
                    return false;
                }

                const auto *parent = m_page.parent_of(node);
                if (parent == nullptr || parent->has_text())
                {
                    return false;
                }
                return ranges::count_if(parent->m_children, [](auto *c){ return c->has_text(); }) == 1;
            }

        private:
            struct Frame
            {
                const model::Node *node;
                std::size_t depth;
                std::size_t level;
            };

            const model::PageModel& m_page;
            std::unordered_set<const model::Node*> m_visited;
        };

        static auto to_relationship(const model::PageModel& page, const model::Node& node) -> Relationship
        {
            return Relationship{
                node.m_cell.m_id,
                node.m_cell.m_source.value_or(""),
                node.m_cell.m_target.value_or(""),
                page.resolve_endpoint(node.m_cell.m_source),
                page.resolve_endpoint(node.m_cell.m_target),
                node.m_text,
                node.relation(),
                page.name()
            };
        }

        // applies select to every node of the matching pages, in document order;
        // entries past the limit are counted but not kept
        template <typename T, typename Select>
        static auto collect(
            const Diagram& diagram,
            const std::optional<std::string>& page,
            std::optional<std::size_t> limit,
            Select select
        ) -> Listing<T>
        {
            Listing<T> listing;
            for (const auto& p : diagram | views::filter(on_page(page)))
            {
                PageGroup<T> group{p.name(), {}};
                for (const auto& node : p.nodes())
                {
                    std::optional<T> entry = select(p, *node);
                    if (!entry)
                    {
                        continue;
                    }

                    ++listing.m_total;
                    if (limit && listing.m_total > *limit)
                    {
                        listing.m_truncated = true;
                        continue;
                    }
                    group.m_entries.push_back(std::move(*entry));
                }

                if (!group.m_entries.empty())
                {
                    listing.m_groups.push_back(std::move(group));
                }
            }
            return listing;
        }
    }

    auto to_string(Operation operation) -> std::string_view
    {
        auto it = ranges::find(helpers::operation_names, operation, &std::pair<Operation, std::string_view>::first);
        return it != helpers::operation_names.end() ? it->second : "unknown";
    }

    auto parse_operation(std::string_view name) -> tl::expected<Operation, QueryError>
    {
        auto it = ranges::find(helpers::operation_names, name, &std::pair<Operation, std::string_view>::second);
        if (it == helpers::operation_names.end())
        {
            return tl::unexpected<QueryError>(QueryError{
                QueryError::Kind::UnknownOperation,
                std::string{name},
                std::string{},
                fmt::format("no operation named '{}'", name)
            });
        }
        return it->first;
    }

    auto overview(const Diagram& diagram) -> Overview
    {
        Overview result;
        for (const auto& page : diagram)
        {
            result.m_pages.push_back(page.name());
            if (page.decode_error())
            {
                result.m_undecodable_pages.push_back(page.name());
            }

            for (const auto& node : page.nodes())
            {
                ++result.m_total_cells;
                if (node->has_text())
                {
                    ++result.m_text_cells;
                }

                if (node->is_edge())
                {
                    ++result.m_connections;
                }
                else if (node->m_cell.m_style)
                {
                    auto shape = node->shape();
                    result.m_swimlanes += shape == classify::ShapeType::Swimlane;
                    result.m_decisions += shape == classify::ShapeType::Decision;
                }

                if (node->m_cell.m_hyperlink)
                {
                    result.m_links.push_back({
                        node->m_cell.m_id, 
                        utility::truncate(node->m_text, helpers::link_text_length), 
                        *node->m_cell.m_hyperlink
                    });
                }
            }
        }
        return result;
    }

    auto components(
        const Diagram& diagram, 
        const std::optional<std::string>& page, 
        std::optional<std::size_t> limit
    ) -> ComponentListing
    {
        return helpers::collect<Component>(diagram, page, limit, 
            [](const model::PageModel&, const model::Node& node) -> std::optional<Component>
            {
                if (node.is_edge() || !node.has_text())
                {
                    return std::nullopt;
                }
                return Component{node.m_cell.m_id, node.m_text, node.shape(), node.m_cell.m_hyperlink.has_value()};
            });
    }

    auto text_content(
        const Diagram& diagram, 
        const std::optional<std::string>& page, 
        std::optional<std::size_t> limit
    ) -> TextListing
    {
        return helpers::collect<TextEntry>(diagram, page, limit, 
            [](const model::PageModel&, const model::Node& node) -> std::optional<TextEntry>
            {
                if (!node.has_text())
                {
                    return std::nullopt;
                }
                return TextEntry{node.m_cell.m_id, node.m_text, node.is_edge()};
            });
    }

    auto classes(const Diagram& diagram) -> ClassListing
    {
        ClassListing result;
        for (const auto& page : diagram)
        {
            for (const auto& node : page.nodes())
            {
                const auto& cell = node->m_cell;
                if (node->is_edge() || cell.m_value.empty() || !cell.m_style)
                {
                    continue;
                }

                classify::StyleTokens style{*cell.m_style};
                if (!style.mentions("swimlane") && !style.shape_starts_with("process"))
                {
                    continue;
                }

                auto members = node->m_children 
                    | views::filter([](auto *c){ return !c->is_edge() && c->has_text(); })
                    | views::transform([](auto *c){ return c->m_text; })
                    | utility::to<std::vector<std::string>>();

                result.m_classes.push_back({
                    node->has_text() ? node->m_text : "Unnamed",
                    std::move(members),
                    page.name()
                });
            }
        }
        return result;
    }

    auto relationships(
        const Diagram& diagram, 
        const std::optional<std::string>& page, 
        std::optional<std::size_t> limit
    ) -> RelationshipListing
    {
        return helpers::collect<Relationship>(diagram, page, limit, 
            [](const model::PageModel& p, const model::Node& node) -> std::optional<Relationship>
            {
                if (!node.is_edge())
                {
                    return std::nullopt;
                }
                return helpers::to_relationship(p, node);
            });
    }

    auto orphans(const model::PageModel& page) -> std::vector<const model::Node*>
    {
        helpers::Walker walker(page);
        return page.nodes() 
            | views::filter([&walker](const auto& n){ return walker.is_orphan(*n); })
            | views::transform([](const auto& n){ return static_cast<const model::Node*>(n.get()); })
            | utility::to<std::vector<const model::Node*>>();
    }

    auto render_hierarchy(const Diagram& diagram, const std::optional<std::string>& page) -> HierarchyRender
    {
        HierarchyRender result;
        for (const auto& p : diagram | views::filter(helpers::on_page(page)))
        {
            PageRender render;
            render.m_page = p.name();

            helpers::Walker walker(p);
            for (const auto *node : p.top_level() | views::filter([](auto *n){ return !n->is_edge(); }))
            {
                walker.walk(*node, 0, render.m_structure, false);
            }

            for (const auto& node : p.nodes() | views::filter([](const auto& n){ return n->is_edge(); }))
            {
                render.m_connections.push_back(helpers::to_relationship(p, *node));
            }

            for (const auto *orphan : orphans(p))
            {
                std::vector<RenderLine> block;
                walker.walk(*orphan, 0, block, true);
                if (!block.empty())
                {
                    render.m_orphans.push_back(std::move(block));
                }
            }

            result.m_pages.push_back(std::move(render));
        }
        return result;
    }

    auto project(const Diagram& diagram, const Request& request) -> tl::expected<Result, QueryError>
    {
        const auto& page = request.m_page;
        if (page && helpers::filters_by_page(request.m_operation) && ranges::none_of(diagram, helpers::on_page(page)))
        {
            return tl::unexpected<QueryError>(QueryError{
                QueryError::Kind::PageNotFound,
                std::string{to_string(request.m_operation)},
                request.m_source.string(),
                fmt::format("no page named '{}'", *page)
            });
        }

        switch (request.m_operation)
        {
        case Operation::Overview:
            return overview(diagram);
        case Operation::Components:
            return components(diagram, page, request.m_limit);
        case Operation::TextContent:
            return text_content(diagram, page, request.m_limit);
        case Operation::Classes:
            return classes(diagram);
        case Operation::Relationships:
            return relationships(diagram, page, request.m_limit);
        case Operation::Hierarchy:
            return render_hierarchy(diagram, page);
        }

        return tl::unexpected<QueryError>(QueryError{
            QueryError::Kind::UnknownOperation,
            std::string{to_string(request.m_operation)},
            request.m_source.string(),
            "operation is not implemented"
        });
    }

    auto run(const Request& request) -> tl::expected<Result, QueryError>
    {
        utility::logger()->info("{} on '{}'", to_string(request.m_operation), request.m_source.string());

        return parser::load_document(request.m_source)
            .map_error([&request](parser::ParseError err){ return helpers::from_parse_error(request, err); })
            .map(model::build_diagram)
            .and_then([&request](const Diagram& diagram){ return project(diagram, request); });
    }

    // handle errors raised while answering a request
    void HandleQueryError(const QueryError& err)
    {
        switch (err.m_kind)
        {
        case QueryError::Kind::SourceUnavailable:
            throw std::runtime_error(fmt::format(
                "<SOURCE UNAVAILABLE> : {} could not read '{}' - {}", err.m_operation, err.m_source, err.m_detail));
        case QueryError::Kind::DocumentMalformed:
            throw std::runtime_error(fmt::format(
                "<MALFORMED DOCUMENT> : {} could not parse '{}' - {}", err.m_operation, err.m_source, err.m_detail));
        case QueryError::Kind::PageNotFound:
            throw std::runtime_error(fmt::format(
                "<PAGE NOT FOUND> : {} on '{}' - {}", err.m_operation, err.m_source, err.m_detail));
        case QueryError::Kind::UnknownOperation:
            throw std::runtime_error(fmt::format(
                "<UNKNOWN OPERATION> : '{}' - {}", err.m_operation, err.m_detail));
        }
        throw std::runtime_error("Something unexpected went wrong ... try again.");
    }
}
