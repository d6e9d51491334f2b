#ifndef PARSER_H
#define PARSER_H

#include "diagram_elements.hpp"

#include <string_view>
#include <optional>
#include <vector>
#include <filesystem>

#include <tl/expected.hpp>
#include <tinyxml2.h>

namespace parser
{

    enum class ParseError
    {
        EmptyPath,
        SourceUnavailable,
        InvalidEncodedDrawioFile,
        UnrecognisedRootElement,
        URLDecodeError,
        Base64DecodeError,
        InflationError,
        InvalidDecodedDrawioFile
    };

    [[nodiscard]]
    auto describe(const ParseError err) -> std::string_view;

    struct Page
    {
        std::string m_name;
        std::vector<Cell> m_cells;
        // set when the page carried a payload that could not be recovered
        std::optional<ParseError> m_decode_error;
    };

    struct Document
    {
        std::vector<Page> m_pages;
    };

    [[nodiscard]] 
    auto load_document(const std::filesystem::path& path) -> tl::expected<Document, ParseError>;

    [[nodiscard]] 
    auto parse_document(std::string_view xml) -> tl::expected<Document, ParseError>;

    // base64 -> raw inflate -> percent-decode, then checks the result is XML
    [[nodiscard]] 
    auto decompress(std::string_view payload) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto inflate(std::string_view str) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto base64_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>;

    [[nodiscard]] 
    auto url_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>;

    // every <mxCell>, <UserObject> and <object> directly under <root>, in order
    [[nodiscard]] 
    auto read_records(const tinyxml2::XMLElement* root) -> std::vector<CellRecord>;

    [[nodiscard]] 
    auto normalize(const CellRecord& record) -> Cell;

    // the cells of an <mxGraphModel>; a model without <root> has none
    [[nodiscard]] 
    auto normalize_cells(const tinyxml2::XMLElement* graph_model) -> std::vector<Cell>;
}

#endif
