#ifndef QUERY_H
#define QUERY_H

#include "model.hpp"
#include "classifier.hpp"
#include "type_aliases.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

namespace query
{
    enum class Operation
    {
        Overview,
        Components,
        TextContent,
        Classes,
        Relationships,
        Hierarchy
    };

    // the names the operations are requested by
    [[nodiscard]]
    auto to_string(Operation operation) -> std::string_view;

    struct QueryError
    {
        enum class Kind
        {
            SourceUnavailable,
            DocumentMalformed,
            PageNotFound,
            UnknownOperation
        };

        Kind m_kind;
        std::string m_operation;
        std::string m_source;
        std::string m_detail;
    };

    [[nodiscard]]
    auto parse_operation(std::string_view name) -> tl::expected<Operation, QueryError>;

    // throws a std::runtime_error describing the failure
    void HandleQueryError(const QueryError& err);

    struct Request
    {
        Operation m_operation = Operation::Overview;
        std::filesystem::path m_source;
        std::optional<std::string> m_page;
        std::optional<std::size_t> m_limit;
    };

    struct LinkEntry
    {
        std::string m_id;
        std::string m_text;
        std::string m_target;
    };

    struct Overview
    {
        std::vector<std::string> m_pages;
        std::size_t m_total_cells = 0;
        std::size_t m_text_cells = 0;
        std::size_t m_connections = 0;
        std::size_t m_swimlanes = 0;
        std::size_t m_decisions = 0;
        std::vector<LinkEntry> m_links;
        // pages whose compressed payload could not be recovered
        std::vector<std::string> m_undecodable_pages;
    };

    template <typename T>
    struct PageGroup
    {
        std::string m_page;
        std::vector<T> m_entries;
    };

    template <typename T>
    struct Listing
    {
        std::vector<PageGroup<T>> m_groups;
        // matches before the cap was applied
        std::size_t m_total = 0;
        bool m_truncated = false;
    };

    struct Component
    {
        std::string m_id;
        std::string m_text;
        classify::ShapeType m_shape;
        bool m_has_link;
    };

    struct TextEntry
    {
        std::string m_id;
        std::string m_text;
        bool m_is_edge;
    };

    struct ClassEntry
    {
        std::string m_name;
        std::vector<std::string> m_members;
        std::string m_page;
    };

    struct Relationship
    {
        std::string m_id;
        std::string m_source_id;
        std::string m_target_id;
        std::string m_source_name;
        std::string m_target_name;
        std::string m_label;
        classify::RelationType m_type;
        std::string m_page;
    };

    struct RenderLine
    {
        std::size_t m_depth;
        std::string m_id;
        std::string m_text;
        std::string m_type;
        bool m_is_connection;
    };

    struct PageRender
    {
        std::string m_page;
        std::vector<RenderLine> m_structure;
        std::vector<Relationship> m_connections;
        // one block per orphan: the orphan itself at depth 0, then its subtree
        std::vector<std::vector<RenderLine>> m_orphans;
    };

    using ComponentListing    = Listing<Component>;
    using TextListing         = Listing<TextEntry>;
    using RelationshipListing = Listing<Relationship>;

    struct ClassListing
    {
        std::vector<ClassEntry> m_classes;
    };

    struct HierarchyRender
    {
        std::vector<PageRender> m_pages;
    };

    using Result = std::variant<Overview, ComponentListing, TextListing, ClassListing, RelationshipListing, HierarchyRender>;

    [[nodiscard]]
    auto overview(const Diagram& diagram) -> Overview;

    [[nodiscard]]
    auto components(
        const Diagram& diagram, 
        const std::optional<std::string>& page, 
        std::optional<std::size_t> limit
    ) -> ComponentListing;

    [[nodiscard]]
    auto text_content(
        const Diagram& diagram, 
        const std::optional<std::string>& page, 
        std::optional<std::size_t> limit
    ) -> TextListing;

    [[nodiscard]]
    auto classes(const Diagram& diagram) -> ClassListing;

    [[nodiscard]]
    auto relationships(
        const Diagram& diagram, 
        const std::optional<std::string>& page, 
        std::optional<std::size_t> limit
    ) -> RelationshipListing;

    [[nodiscard]]
    auto render_hierarchy(const Diagram& diagram, const std::optional<std::string>& page) -> HierarchyRender;

    // textual nodes whose container has no text and no other textual child
    [[nodiscard]]
    auto orphans(const model::PageModel& page) -> std::vector<const model::Node*>;

    // runs the requested projection over an already built diagram
    [[nodiscard]]
    auto project(const Diagram& diagram, const Request& request) -> tl::expected<Result, QueryError>;

    // load, build and project in one go
    [[nodiscard]]
    auto run(const Request& request) -> tl::expected<Result, QueryError>;
}

#endif
