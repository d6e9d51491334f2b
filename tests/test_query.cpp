/**
 * @file test_query.cpp
 * @brief Read-only projections over built pages, and the request pipeline.
 */

#include <gtest/gtest.h>
#include "../include/query.hpp"
#include "../include/report.hpp"
#include "fixtures.hpp"

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

using namespace query;

namespace
{
    auto texts_of(const std::vector<RenderLine>& lines) -> std::vector<std::string>
    {
        std::vector<std::string> out;
        for (const auto& line : lines)
        {
            out.push_back(line.m_text);
        }
        return out;
    }

    // a page with a titled container, an untitled group holding one note,
    // an untitled group holding two labels, and a hyperlinked user object
    constexpr std::string_view annotated_cells =
        "<mxCell id=\"box\" value=\"Gateway\" style=\"rounded=1;\" vertex=\"1\" parent=\"1\"/>"
        "<mxCell id=\"inner\" value=\"Router\" style=\"shape=process;\" vertex=\"1\" parent=\"box\"/>"
        "<mxCell id=\"g1\" value=\"\" style=\"group\" vertex=\"1\" parent=\"1\"/>"
        "<mxCell id=\"note\" value=\"Remember retries\" style=\"shape=note;\" vertex=\"1\" parent=\"g1\"/>"
        "<mxCell id=\"g2\" value=\"\" style=\"group\" vertex=\"1\" parent=\"1\"/>"
        "<mxCell id=\"l1\" value=\"Left\" style=\"text;\" vertex=\"1\" parent=\"g2\"/>"
        "<mxCell id=\"l2\" value=\"Right\" style=\"text;\" vertex=\"1\" parent=\"g2\"/>"
        "<mxCell id=\"e\" value=\"routes\" style=\"endArrow=open;\" edge=\"1\" parent=\"box\" source=\"inner\" target=\"ghost\"/>"
        "<UserObject id=\"u\" label=\"Docs\" link=\"https://example.com/a-very-long-link\"><mxCell style=\"shape=document;\" vertex=\"1\" parent=\"1\"/></UserObject>";
}

// ============================================================================
// Two page scenario
// ============================================================================

class TwoPageTest : public ::testing::Test {
protected:
    void SetUp() override {
        diagram = fixtures::build(fixtures::two_page_document());
    }

    Diagram diagram;
};

TEST_F(TwoPageTest, Overview) {
    auto result = overview(diagram);
    EXPECT_EQ(result.m_pages, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(result.m_total_cells, 6u);
    EXPECT_EQ(result.m_text_cells, 2u);
    EXPECT_EQ(result.m_connections, 1u);
    EXPECT_EQ(result.m_swimlanes, 1u);
    EXPECT_EQ(result.m_decisions, 0u);
    EXPECT_TRUE(result.m_links.empty());
    EXPECT_TRUE(result.m_undecodable_pages.empty());
}

TEST_F(TwoPageTest, ComponentsOnPageA) {
    auto listing = components(diagram, std::string{"A"}, std::nullopt);
    EXPECT_EQ(listing.m_total, 2u);
    EXPECT_FALSE(listing.m_truncated);
    ASSERT_EQ(listing.m_groups.size(), 1u);
    EXPECT_EQ(listing.m_groups[0].m_page, "A");
    ASSERT_EQ(listing.m_groups[0].m_entries.size(), 2u);
    EXPECT_EQ(listing.m_groups[0].m_entries[0].m_text, "Receive order");
    EXPECT_EQ(listing.m_groups[0].m_entries[0].m_shape, classify::ShapeType::RoundedRect);
    EXPECT_EQ(listing.m_groups[0].m_entries[1].m_text, "Ship");
}

TEST_F(TwoPageTest, RelationshipsOnPageA) {
    auto listing = relationships(diagram, std::string{"A"}, std::nullopt);
    ASSERT_EQ(listing.m_total, 1u);
    const auto& rel = listing.m_groups.at(0).m_entries.at(0);
    EXPECT_EQ(rel.m_source_name, "Receive order");
    EXPECT_EQ(rel.m_target_name, "Ship");
    EXPECT_EQ(rel.m_source_id, "s1");
    EXPECT_EQ(rel.m_target_id, "s2");
    EXPECT_EQ(rel.m_type, classify::RelationType::Flow);
    EXPECT_EQ(rel.m_page, "A");
}

TEST_F(TwoPageTest, EmptyPageIsASuccess) {
    Request request;
    request.m_operation = Operation::Components;
    request.m_page = "B";
    auto result = project(diagram, request);
    ASSERT_TRUE(result.has_value());
    const auto& listing = std::get<ComponentListing>(result.value());
    EXPECT_EQ(listing.m_total, 0u);
    EXPECT_TRUE(listing.m_groups.empty());
}

TEST_F(TwoPageTest, UnknownPageIsAnError) {
    Request request;
    request.m_operation = Operation::Relationships;
    request.m_page = "Z";
    auto result = project(diagram, request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().m_kind, QueryError::Kind::PageNotFound);
    EXPECT_EQ(result.error().m_operation, "extract_relationships");
}

TEST_F(TwoPageTest, OverviewIgnoresPageFilter) {
    Request request;
    request.m_operation = Operation::Overview;
    request.m_page = "Z";
    EXPECT_TRUE(project(diagram, request).has_value());
}

TEST_F(TwoPageTest, TextContentMarksEdges) {
    auto xml = fixtures::single_page(
        "<mxCell id=\"a\" value=\"A\" vertex=\"1\" parent=\"1\"/>"
        "<mxCell id=\"e\" value=\"uses\" edge=\"1\" parent=\"1\" source=\"a\" target=\"a\"/>");
    auto listing = text_content(fixtures::build(xml), std::nullopt, std::nullopt);
    ASSERT_EQ(listing.m_total, 2u);
    const auto& entries = listing.m_groups.at(0).m_entries;
    EXPECT_FALSE(entries[0].m_is_edge);
    EXPECT_TRUE(entries[1].m_is_edge);
    EXPECT_EQ(entries[1].m_text, "uses");
}

TEST_F(TwoPageTest, RepeatedQueriesAgree) {
    auto first = report::write(render_hierarchy(diagram, std::nullopt));
    auto second = report::write(render_hierarchy(diagram, std::nullopt));
    EXPECT_EQ(first, second);
}

// ============================================================================
// Caps
// ============================================================================

TEST(ListingCapTest, TruncatesAcrossPages) {
    auto diagram = fixtures::build(
        "<mxfile>"
        "<diagram name=\"P1\"><mxGraphModel><root>"
        "<mxCell id=\"a\" value=\"A\"/><mxCell id=\"b\" value=\"B\"/>"
        "</root></mxGraphModel></diagram>"
        "<diagram name=\"P2\"><mxGraphModel><root>"
        "<mxCell id=\"c\" value=\"C\"/><mxCell id=\"d\" value=\"D\"/>"
        "</root></mxGraphModel></diagram>"
        "</mxfile>");

    auto listing = components(diagram, std::nullopt, 3);
    EXPECT_EQ(listing.m_total, 4u);
    EXPECT_TRUE(listing.m_truncated);
    ASSERT_EQ(listing.m_groups.size(), 2u);
    EXPECT_EQ(listing.m_groups[0].m_entries.size(), 2u);
    EXPECT_EQ(listing.m_groups[1].m_entries.size(), 1u);

    auto exact = components(diagram, std::nullopt, 4);
    EXPECT_FALSE(exact.m_truncated);
}

// ============================================================================
// Classes, links, orphans
// ============================================================================

TEST(AnnotatedPageTest, ClassesListMembers) {
    auto diagram = fixtures::build(fixtures::single_page(
        "<mxCell id=\"c\" value=\"Order\" style=\"swimlane;fontStyle=1;\" vertex=\"1\" parent=\"1\"/>"
        "<mxCell id=\"f1\" value=\"+ id: int\" style=\"text;\" vertex=\"1\" parent=\"c\"/>"
        "<mxCell id=\"f2\" value=\"+ total(): Money\" style=\"text;\" vertex=\"1\" parent=\"c\"/>"
        "<mxCell id=\"p\" value=\"Billing\" style=\"shape=process;\" vertex=\"1\" parent=\"1\"/>"));

    auto listing = classes(diagram);
    ASSERT_EQ(listing.m_classes.size(), 2u);
    EXPECT_EQ(listing.m_classes[0].m_name, "Order");
    EXPECT_EQ(listing.m_classes[0].m_members, (std::vector<std::string>{"+ id: int", "+ total(): Money"}));
    EXPECT_EQ(listing.m_classes[0].m_page, "Page-1");
    EXPECT_EQ(listing.m_classes[1].m_name, "Billing");
    EXPECT_TRUE(listing.m_classes[1].m_members.empty());
}

TEST(AnnotatedPageTest, OverviewListsLinks) {
    auto result = overview(fixtures::build(fixtures::single_page(annotated_cells)));
    ASSERT_EQ(result.m_links.size(), 1u);
    EXPECT_EQ(result.m_links[0].m_id, "u");
    EXPECT_EQ(result.m_links[0].m_text, "Docs");
    EXPECT_EQ(result.m_links[0].m_target, "https://example.com/a-very-long-link");

    auto listing = components(fixtures::build(fixtures::single_page(annotated_cells)), std::nullopt, std::nullopt);
    auto& entries = listing.m_groups.at(0).m_entries;
    auto docs = std::find_if(entries.begin(), entries.end(), [](const Component& c){ return c.m_id == "u"; });
    ASSERT_NE(docs, entries.end());
    EXPECT_TRUE(docs->m_has_link);
    EXPECT_EQ(docs->m_shape, classify::ShapeType::Document);
}

TEST(AnnotatedPageTest, OrphanDetection) {
    auto diagram = fixtures::build(fixtures::single_page(annotated_cells));
    auto found = orphans(diagram.at(0));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0]->m_cell.m_id, "note");
}

TEST(AnnotatedPageTest, HierarchyRender) {
    auto diagram = fixtures::build(fixtures::single_page(annotated_cells));
    auto render = render_hierarchy(diagram, std::nullopt);
    ASSERT_EQ(render.m_pages.size(), 1u);
    const auto& page = render.m_pages[0];

    // children first, then the edge inside the container, untitled groups flattened
    EXPECT_EQ(texts_of(page.m_structure), (std::vector<std::string>{"Gateway", "Router", "routes", "Left", "Right", "Docs"}));
    EXPECT_EQ(page.m_structure[0].m_depth, 0u);
    EXPECT_EQ(page.m_structure[1].m_depth, 1u);
    EXPECT_TRUE(page.m_structure[2].m_is_connection);
    EXPECT_EQ(page.m_structure[2].m_type, "aggregation");
    EXPECT_EQ(page.m_structure[3].m_depth, 0u);

    ASSERT_EQ(page.m_connections.size(), 1u);
    EXPECT_EQ(page.m_connections[0].m_source_name, "Router");
    EXPECT_EQ(page.m_connections[0].m_target_name, "ghost");

    ASSERT_EQ(page.m_orphans.size(), 1u);
    EXPECT_EQ(texts_of(page.m_orphans[0]), (std::vector<std::string>{"Remember retries"}));
}

TEST(AnnotatedPageTest, CyclesAreRenderedOnce) {
    auto diagram = fixtures::build(fixtures::single_page(
        "<mxCell id=\"top\" value=\"Top\" vertex=\"1\" parent=\"1\"/>"
        "<mxCell id=\"a\" value=\"\" vertex=\"1\" parent=\"b\"/>"
        "<mxCell id=\"b\" value=\"\" vertex=\"1\" parent=\"a\"/>"
        "<mxCell id=\"c\" value=\"Stuck\" vertex=\"1\" parent=\"a\"/>"));

    auto render = render_hierarchy(diagram, std::nullopt);
    const auto& page = render.m_pages.at(0);
    EXPECT_EQ(texts_of(page.m_structure), (std::vector<std::string>{"Top"}));
    ASSERT_EQ(page.m_orphans.size(), 1u);
    EXPECT_EQ(texts_of(page.m_orphans[0]), (std::vector<std::string>{"Stuck"}));
}

TEST(DeepNestingTest, UntitledChainDoesNotExhaustTheStack) {
    constexpr std::size_t count = 300000;
    std::vector<parser::Cell> cells{
        parser::Cell("0", "", std::nullopt, std::nullopt),
        parser::Cell("1", "", std::nullopt, std::string{"0"})
    };
    for (std::size_t i = 0; i < count; ++i)
    {
        auto parent = i == 0 ? std::string{"1"} : fmt::format("c{}", i - 1);
        cells.emplace_back(fmt::format("c{}", i), "", std::nullopt, parent);
    }

    Diagram diagram;
    diagram.emplace_back("deep", cells);

    auto render = render_hierarchy(diagram, std::nullopt);
    ASSERT_EQ(render.m_pages.size(), 1u);
    EXPECT_TRUE(render.m_pages[0].m_structure.empty());
    EXPECT_TRUE(render.m_pages[0].m_orphans.empty());
}

TEST(DeepNestingTest, TitledChainStopsAtDepthCap) {
    std::vector<parser::Cell> cells{parser::Cell("0", "", std::nullopt, std::nullopt)};
    for (std::size_t i = 0; i < 200; ++i)
    {
        auto parent = i == 0 ? std::string{"0"} : fmt::format("t{}", i - 1);
        cells.emplace_back(fmt::format("t{}", i), fmt::format("Level {}", i), std::nullopt, parent);
    }

    Diagram diagram;
    diagram.emplace_back("deep", cells);

    auto render = render_hierarchy(diagram, std::nullopt);
    const auto& structure = render.m_pages.at(0).m_structure;
    ASSERT_EQ(structure.size(), 65u);
    EXPECT_EQ(structure.front().m_text, "Level 0");
    EXPECT_EQ(structure.back().m_text, "Level 64");
    EXPECT_EQ(structure.back().m_depth, 64u);
}

// ============================================================================
// Compressed pages
// ============================================================================

TEST(CompressedRenderTest, MatchesInlineRender) {
    auto inline_xml = fmt::format("<mxfile><diagram id=\"c\" name=\"A\">{}</diagram></mxfile>", fixtures::page_a_model);
    auto packed_xml = fixtures::compressed_document(fixtures::compress(fixtures::page_a_model));

    auto inline_text = report::write(render_hierarchy(fixtures::build(inline_xml), std::nullopt));
    auto packed_text = report::write(render_hierarchy(fixtures::build(packed_xml), std::nullopt));
    EXPECT_EQ(inline_text, packed_text);
}

TEST(CompressedRenderTest, CorruptPageStillAnswers) {
    auto xml = fmt::format(
        "<mxfile>"
        "<diagram name=\"Good\">{}</diagram>"
        "<diagram name=\"Bad\">{}</diagram>"
        "</mxfile>",
        fixtures::page_a_model,
        fixtures::base64_encode("this is not deflate")
    );
    fixtures::TempFile file("corrupt.drawio", xml);

    Request request;
    request.m_operation = Operation::Overview;
    request.m_source = file.path();
    auto result = run(request);
    ASSERT_TRUE(result.has_value());
    const auto& summary = std::get<Overview>(result.value());
    EXPECT_EQ(summary.m_pages.size(), 2u);
    EXPECT_EQ(summary.m_total_cells, 6u);
    EXPECT_EQ(summary.m_undecodable_pages, (std::vector<std::string>{"Bad"}));

    request.m_operation = Operation::Components;
    request.m_page = "Bad";
    auto bad = run(request);
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(std::get<ComponentListing>(bad.value()).m_total, 0u);
}

// ============================================================================
// Request pipeline
// ============================================================================

TEST(RunTest, OperationNames) {
    EXPECT_EQ(parse_operation("get_diagram_overview").value(), Operation::Overview);
    EXPECT_EQ(parse_operation("parse_drawio").value(), Operation::Components);
    EXPECT_EQ(parse_operation("extract_text_content").value(), Operation::TextContent);
    EXPECT_EQ(parse_operation("extract_classes").value(), Operation::Classes);
    EXPECT_EQ(parse_operation("extract_relationships").value(), Operation::Relationships);
    EXPECT_EQ(parse_operation("render_hierarchy").value(), Operation::Hierarchy);
    EXPECT_EQ(to_string(Operation::Hierarchy), "render_hierarchy");
}

TEST(RunTest, UnknownOperation) {
    auto op = parse_operation("delete_everything");
    ASSERT_FALSE(op.has_value());
    EXPECT_EQ(op.error().m_kind, QueryError::Kind::UnknownOperation);
    EXPECT_EQ(op.error().m_operation, "delete_everything");
    EXPECT_THROW(HandleQueryError(op.error()), std::runtime_error);
}

TEST(RunTest, MissingSource) {
    Request request;
    request.m_source = "/nonexistent/file.drawio";
    auto result = run(request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().m_kind, QueryError::Kind::SourceUnavailable);
    EXPECT_EQ(result.error().m_source, "/nonexistent/file.drawio");
    EXPECT_EQ(result.error().m_operation, "get_diagram_overview");
}

TEST(RunTest, MalformedSource) {
    fixtures::TempFile file("broken.drawio", "<mxfile><diagram name=\"A\">");
    Request request;
    request.m_source = file.path();
    auto result = run(request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().m_kind, QueryError::Kind::DocumentMalformed);
}

TEST(RunTest, SameFileSameAnswer) {
    fixtures::TempFile file("stable.drawio", fixtures::two_page_document());
    Request request;
    request.m_operation = Operation::Relationships;
    request.m_source = file.path();

    auto first = run(request);
    auto second = run(request);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(report::write(first.value()), report::write(second.value()));
}
