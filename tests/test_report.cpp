/**
 * @file test_report.cpp
 * @brief Plain-text rendering of query results.
 */

#include <gtest/gtest.h>
#include "../include/report.hpp"
#include "fixtures.hpp"

#include <string>

using namespace query;

TEST(ReportTest, OverviewCounts) {
    auto text = report::write(Result{overview(fixtures::build(fixtures::two_page_document()))});
    EXPECT_NE(text.find("Pages: 2"), std::string::npos);
    EXPECT_NE(text.find("Connections: 1"), std::string::npos);
    EXPECT_NE(text.find("Swimlanes: 1"), std::string::npos);
    EXPECT_NE(text.find("1. A"), std::string::npos);
    EXPECT_NE(text.find("2. B"), std::string::npos);
}

TEST(ReportTest, RelationshipLine) {
    auto listing = relationships(fixtures::build(fixtures::two_page_document()), std::nullopt, std::nullopt);
    auto text = report::write(listing);
    EXPECT_NE(text.find("A (1):"), std::string::npos);
    EXPECT_NE(text.find("Receive order -> Ship (flow)"), std::string::npos);
}

TEST(ReportTest, TruncationMarker) {
    auto listing = components(fixtures::build(fixtures::two_page_document()), std::nullopt, 1);
    auto text = report::write(listing);
    EXPECT_NE(text.find("[rounded-rect] Receive order"), std::string::npos);
    EXPECT_EQ(text.find("Ship"), std::string::npos);
    EXPECT_NE(text.find("... truncated, 2 in total"), std::string::npos);
}

TEST(ReportTest, EmptyClassListing) {
    EXPECT_EQ(report::write(ClassListing{}), "No classes or swimlanes found");
}

TEST(ReportTest, HierarchySections) {
    auto text = report::write(render_hierarchy(fixtures::build(fixtures::two_page_document()), std::string{"A"}));
    EXPECT_NE(text.find("Page: A"), std::string::npos);
    EXPECT_NE(text.find("[rounded-rect] Receive order"), std::string::npos);
    EXPECT_NE(text.find("Connections:"), std::string::npos);
    EXPECT_NE(text.find("Floating annotations:"), std::string::npos);
    EXPECT_EQ(text.find("Page: B"), std::string::npos);
}
