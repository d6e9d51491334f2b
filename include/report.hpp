#ifndef REPORT_H
#define REPORT_H

#include "query.hpp"

#include <string>

namespace report
{
    // renders any query result as plain text
    [[nodiscard]]
    auto write(const query::Result& result) -> std::string;

    [[nodiscard]] auto write(const query::Overview& overview) -> std::string;
    [[nodiscard]] auto write(const query::ComponentListing& listing) -> std::string;
    [[nodiscard]] auto write(const query::TextListing& listing) -> std::string;
    [[nodiscard]] auto write(const query::ClassListing& listing) -> std::string;
    [[nodiscard]] auto write(const query::RelationshipListing& listing) -> std::string;
    [[nodiscard]] auto write(const query::HierarchyRender& render) -> std::string;
}

#endif
