#include "../include/report.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"

#include <ranges>
#include <variant>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace report 
{
    using namespace ::utility;

    static
    auto indent(std::string_view multi_line_str, unsigned indent_level) -> std::string
    {        
        std::string indent(indent_level * 2, ' ');
        return fmt::format(
            "{}{}",
            indent,
            fmt::join(
                multi_line_str 
                    | views::split('\n')
                    | views::transform([](auto r) { 
                        return std::string_view(r.begin(), r.end()); 
                    }),
                "\n"+indent
            )
        );
    }

    static
    auto write_line(const query::RenderLine& line) -> std::string
    {
        std::string pad(line.m_depth * 2, ' ');
        if (line.m_is_connection)
        {
            return fmt::format("{}-> {} ({})", pad, line.m_text, line.m_type);
        }
        return fmt::format("{}[{}] {}", pad, line.m_type, line.m_text);
    }

    static
    auto write_relationship(const query::Relationship& rel) -> std::string
    {
        return fmt::format(
            "{} -> {}{} ({})",
            rel.m_source_name,
            rel.m_target_name,
            rel.m_label.empty() ? std::string{} : fmt::format(" [{}]", rel.m_label),
            classify::to_string(rel.m_type)
        );
    }

    // header, then one block per page group, then the truncation marker
    template <typename T, typename WriteEntry>
    static
    auto write_listing(std::string_view title, const query::Listing<T>& listing, WriteEntry write_entry) -> std::string
    {
        auto groups = listing.m_groups
            | views::transform([&](const query::PageGroup<T>& group){
                auto entries = group.m_entries | views::transform(write_entry);
                return fmt::format(
                    "{} ({}):\n"
                    "{}",
                    group.m_page,
                    group.m_entries.size(),
                    indent(join_non_empty_strings(entries, "\n"), 1)
                );
            });

        return fmt::format(
            "{}\n"
            "Total: {}\n"
            "{}{}",
            title,
            listing.m_total,
            join_non_empty_strings(groups, "\n"),
            listing.m_truncated ? fmt::format("\n... truncated, {} in total", listing.m_total) : std::string{}
        );
    }

    auto write(const query::Overview& overview) -> std::string
    {
        std::vector<std::string> pages;
        for (std::size_t i = 0; i < overview.m_pages.size(); ++i)
        {
            pages.push_back(fmt::format("{}. {}", i + 1, overview.m_pages[i]));
        }

        auto links = overview.m_links
            | views::transform([](const query::LinkEntry& link){
                return fmt::format("{} {} -> {}", link.m_id, link.m_text, link.m_target);
            });

        auto out = fmt::format(
            "Diagram overview\n"
            "Pages: {}\n"
            "Cells: {}\n"
            "With text: {}\n"
            "Connections: {}\n"
            "Swimlanes: {}\n"
            "Decisions: {}\n"
            "\n"
            "Pages:\n"
            "{}",
            overview.m_pages.size(),
            overview.m_total_cells,
            overview.m_text_cells,
            overview.m_connections,
            overview.m_swimlanes,
            overview.m_decisions,
            indent(join_non_empty_strings(pages, "\n"), 1)
        );

        if (!overview.m_links.empty())
        {
            out += fmt::format("\n\nLinks:\n{}", indent(join_non_empty_strings(links, "\n"), 1));
        }
        if (!overview.m_undecodable_pages.empty())
        {
            out += fmt::format("\n\nUndecodable pages: {}", fmt::join(overview.m_undecodable_pages, ", "));
        }
        return out;
    }

    auto write(const query::ComponentListing& listing) -> std::string
    {
        return write_listing("Components", listing, [](const query::Component& c){
            return fmt::format("[{}] {}{}", classify::to_string(c.m_shape), c.m_text, c.m_has_link ? " (link)" : "");
        });
    }

    auto write(const query::TextListing& listing) -> std::string
    {
        return write_listing("Text content", listing, [](const query::TextEntry& t){
            return fmt::format("{} {}", t.m_is_edge ? "->" : "*", t.m_text);
        });
    }

    auto write(const query::ClassListing& listing) -> std::string
    {
        if (listing.m_classes.empty())
        {
            return "No classes or swimlanes found";
        }

        std::vector<std::string> classes;
        for (std::size_t i = 0; i < listing.m_classes.size(); ++i)
        {
            const auto& cls = listing.m_classes[i];
            auto members = cls.m_members | views::transform([](std::string_view m){ return fmt::format("* {}", m); });
            classes.push_back(fmt::format(
                "{}. {} ({})\n"
                "{}",
                i + 1,
                cls.m_name,
                cls.m_page,
                indent(join_non_empty_strings(members, "\n"), 2)
            ));
        }

        return fmt::format(
            "Classes / swimlanes\n"
            "Total: {}\n"
            "{}",
            listing.m_classes.size(),
            join_non_empty_strings(classes, "\n")
        );
    }

    auto write(const query::RelationshipListing& listing) -> std::string
    {
        return write_listing("Relationships", listing, write_relationship);
    }

    auto write(const query::HierarchyRender& render) -> std::string
    {
        auto pages = render.m_pages
            | views::transform([](const query::PageRender& page){
                auto structure = page.m_structure | views::transform(write_line);
                auto connections = page.m_connections | views::transform(write_relationship);
                auto orphans = page.m_orphans
                    | views::transform([](const std::vector<query::RenderLine>& block){
                        return join_non_empty_strings(block | views::transform(write_line), "\n");
                    });

                return fmt::format(
                    "Page: {}\n"
                    "{}\n"
                    "Connections:\n"
                    "{}\n"
                    "Floating annotations:\n"
                    "{}",
                    page.m_page,
                    indent(join_non_empty_strings(structure, "\n"), 1),
                    indent(join_non_empty_strings(connections, "\n"), 1),
                    indent(join_non_empty_strings(orphans, "\n"), 1)
                );
            });

        return join_non_empty_strings(pages, "\n\n");
    }

    auto write(const query::Result& result) -> std::string
    {
        return std::visit([](const auto& r){ return write(r); }, result);
    }
}
