#include "../include/parser.hpp"
#include "../include/diagram_elements.hpp"
#include "../include/utility.hpp"
#include "../include/ranges_helpers.hpp"
#include "../include/logging.hpp"

#include <array>
#include <cctype>
#include <cstring>
#include <algorithm>
#include <ranges>
#include <utility>

#include <zlib.h>
#include <curl/curl.h>
#include <tinyxml2.h>
#include <fmt/format.h>

namespace parser
{
    // namespaces aliases
    using namespace tinyxml2;
    namespace views = std::views;
    namespace ranges = std::ranges;

    // helper functions
    namespace helpers
    {
        static auto to_bool(std::string_view str) -> std::optional<bool>
        {
            const static auto true_tokens  = {"1", "yes", "Yes", "True", "true"};
            const static auto false_tokens = {"0", "no", "No", "False", "false"};

            if (ranges::find(true_tokens, str) != true_tokens.end())
            {
                return true;
            }
            else if(ranges::find(false_tokens, str) != false_tokens.end())
            {
                return false;
            }   
            else
            {
                return std::nullopt;
            } 
        }

        static auto attribute(const XMLElement *element, const char *name) -> std::optional<std::string>
        {
            if (auto value = element->Attribute(name); value != nullptr)
            {
                return std::string{value};
            }
            return std::nullopt;
        }

        static auto non_empty(const std::optional<std::string> &str) -> bool
        {
            return str.has_value() && !str->empty();
        }

        static auto is_wrapper(const XMLElement *element) -> bool
        {
            std::string_view name{element->Name()};
            return name == "UserObject" || name == "object";
        }

        static auto read_direct(const XMLElement *element) -> DirectCell
        {
            DirectCell cell;
            cell.m_id     = attribute(element, "id");
            cell.m_value  = attribute(element, "value");
            cell.m_style  = attribute(element, "style");
            cell.m_parent = attribute(element, "parent");
            cell.m_edge   = attribute(element, "edge");
            cell.m_source = attribute(element, "source");
            cell.m_target = attribute(element, "target");
            return cell;
        }

        static auto read_wrapped(const XMLElement *element) -> WrappedCell
        {
            WrappedCell cell;
            for (auto *attr = element->FirstAttribute(); attr != nullptr; attr = attr->Next())
            {
                std::string_view name{attr->Name()};
                if (name == "id")
                {
                    cell.m_id = attr->Value();
                }
                else if (name == "label")
                {
                    cell.m_label = attr->Value();
                }
                else if (name == "value")
                {
                    cell.m_value = attr->Value();
                }
                else if (name == "link")
                {
                    cell.m_link = attr->Value();
                }
                else if (name != "placeholders")
                {
                    cell.m_properties.emplace_back(name, attr->Value());
                }
            }

            if (auto *inner = element->FirstChildElement("mxCell"); inner != nullptr)
            {
                cell.m_inner = read_direct(inner);
            }
            return cell;
        }

        // an explicit edge flag, or a source reference on its own, makes an edge
        static auto is_edge(const DirectCell &cell) -> bool
        {
            bool flagged = false;
            if (cell.m_edge)
            {
                flagged = to_bool(*cell.m_edge).value_or(false);
            }
            return flagged || non_empty(cell.m_source);
        }

        static auto apply_structure(Cell &cell, const DirectCell &structure) -> void
        {
            cell.m_style  = structure.m_style;
            cell.m_parent = structure.m_parent;
            cell.m_is_edge = is_edge(structure);
            if (cell.m_is_edge)
            {
                cell.m_source = structure.m_source;
                cell.m_target = structure.m_target;
            }
        }

        struct Normalizer
        {
            auto operator()(const DirectCell &record) const -> Cell
            {
                Cell cell;
                cell.m_id    = record.m_id.value_or("");
                cell.m_value = record.m_value.value_or("");
                apply_structure(cell, record);
                return cell;
            }

            auto operator()(const WrappedCell &record) const -> Cell
            {
                const DirectCell inner = record.m_inner.value_or(DirectCell{});

                Cell cell;
                cell.m_id = non_empty(inner.m_id) ? *inner.m_id : record.m_id.value_or("");
                if (non_empty(record.m_label))
                {
                    cell.m_value = *record.m_label;
                }
                else if (non_empty(record.m_value))
                {
                    cell.m_value = *record.m_value;
                }
                apply_structure(cell, inner);
                if (non_empty(record.m_link))
                {
                    cell.m_hyperlink = record.m_link;
                }
                cell.m_properties = record.m_properties;
                return cell;
            }
        };

        static auto valid_percent_escapes(std::string_view str) -> bool
        {
            for (std::size_t i = 0; i < str.size(); ++i)
            {
                if (str[i] != '%')
                {
                    continue;
                }
                if (i + 2 >= str.size() 
                    || !std::isxdigit(static_cast<unsigned char>(str[i + 1])) 
                    || !std::isxdigit(static_cast<unsigned char>(str[i + 2])))
                {
                    return false;
                }
                i += 2;
            }
            return true;
        }

        static auto valid_utf8(std::string_view str) -> bool
        {
            std::size_t i = 0;
            while (i < str.size())
            {
                auto c = static_cast<unsigned char>(str[i]);
                std::size_t len = 0;
                if (c < 0x80)                len = 1;
                else if ((c & 0xE0) == 0xC0) len = 2;
                else if ((c & 0xF0) == 0xE0) len = 3;
                else if ((c & 0xF8) == 0xF0) len = 4;
                else return false;

                if (i + len > str.size())
                {
                    return false;
                }
                for (std::size_t k = 1; k < len; ++k)
                {
                    if ((static_cast<unsigned char>(str[i + k]) & 0xC0) != 0x80)
                    {
                        return false;
                    }
                }
                i += len;
            }
            return true;
        }

        static auto ensure_well_formed(std::string xml) -> tl::expected<std::string, ParseError>
        {
            XMLDocument doc;
            if (doc.Parse(xml.data(), xml.size()) != XML_SUCCESS || doc.RootElement() == nullptr)
            {
                return tl::unexpected<ParseError>(ParseError::InvalidDecodedDrawioFile);
            }
            return xml;
        }

        static auto cells_from_xml(std::string xml) -> tl::expected<std::vector<Cell>, ParseError>
        {
            XMLDocument doc;
            if (doc.Parse(xml.data(), xml.size()) != XML_SUCCESS)
            {
                return tl::unexpected<ParseError>(ParseError::InvalidDecodedDrawioFile);
            }

            const XMLElement *model = doc.RootElement();
            if (model == nullptr || std::string_view{model->Name()} != "mxGraphModel")
            {
                return tl::unexpected<ParseError>(ParseError::InvalidDecodedDrawioFile);
            }
            return normalize_cells(model);
        }

        static auto read_page(const XMLElement *diagram) -> Page
        {
            Page page;
            const char *name = diagram->Attribute("name");
            page.m_name = (name != nullptr && *name != '\0') ? name : "Unnamed";

            // an inline model always wins over any stray text
            if (auto *model = diagram->FirstChildElement("mxGraphModel"); model != nullptr)
            {
                page.m_cells = normalize_cells(model);
                return page;
            }

            const char *text = diagram->GetText();
            auto payload = utility::trim(text != nullptr ? text : "");
            if (payload.empty())
            {
                return page;
            }

            auto cells = decompress(payload).and_then(cells_from_xml);
            if (cells)
            {
                page.m_cells = std::move(cells.value());
            }
            else
            {
                page.m_decode_error = cells.error();
                utility::logger()->warn("page '{}' could not be decompressed: {}", page.m_name, describe(cells.error()));
            }
            return page;
        }

        static auto read_document(const XMLDocument &doc) -> tl::expected<Document, ParseError>
        {
            const XMLElement *root = doc.RootElement();
            if (root == nullptr)
            {
                return tl::unexpected<ParseError>(ParseError::InvalidEncodedDrawioFile);
            }

            Document document;
            std::string_view root_name{root->Name()};
            if (root_name == "mxfile")
            {
                for (auto *diagram = root->FirstChildElement("diagram"); diagram != nullptr;
                     diagram = diagram->NextSiblingElement("diagram"))
                {
                    document.m_pages.push_back(read_page(diagram));
                }
            }
            else if (root_name == "mxGraphModel")
            {
                // a bare model exported without the <mxfile> envelope
                Page page;
                page.m_name = "Unnamed";
                page.m_cells = normalize_cells(root);
                document.m_pages.push_back(std::move(page));
            }
            else
            {
                return tl::unexpected<ParseError>(ParseError::UnrecognisedRootElement);
            }

            for (const auto &page : document.m_pages)
            {
                utility::logger()->debug("page '{}': {} cells", page.m_name, page.m_cells.size());
            }
            return document;
        }
    }

    auto load_document(const std::filesystem::path &path) -> tl::expected<Document, ParseError>
    {
        if (path.empty())
        {
            return tl::unexpected<ParseError>(ParseError::EmptyPath);
        }

        utility::logger()->debug("loading '{}'", path.string());

        XMLDocument doc;
        doc.LoadFile(path.string().c_str());

        switch (doc.ErrorID())
        {
        case XML_SUCCESS:
            break;
        case XML_ERROR_FILE_NOT_FOUND:
        case XML_ERROR_FILE_COULD_NOT_BE_OPENED:
        case XML_ERROR_FILE_READ_ERROR:
            return tl::unexpected<ParseError>(ParseError::SourceUnavailable);
        default:
            return tl::unexpected<ParseError>(ParseError::InvalidEncodedDrawioFile);
        }

        return helpers::read_document(doc);
    }

    auto parse_document(std::string_view xml) -> tl::expected<Document, ParseError>
    {
        XMLDocument doc;
        if (doc.Parse(xml.data(), xml.size()) != XML_SUCCESS)
        {
            return tl::unexpected<ParseError>(ParseError::InvalidEncodedDrawioFile);
        }
        return helpers::read_document(doc);
    }

    auto decompress(std::string_view payload) -> tl::expected<std::string, ParseError>
    {
        return base64_decode(payload)
            .and_then(parser::inflate)
            .and_then(parser::url_decode)
            .and_then(helpers::ensure_well_formed);
    }

    auto inflate(std::string_view str) -> tl::expected<std::string, ParseError>
    {
        z_stream zs;
        memset(&zs, 0, sizeof(zs));

        // negative window bits: raw deflate, no zlib or gzip header
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
            return tl::unexpected<ParseError>(ParseError::InflationError);

        zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(str.data()));
        zs.avail_in = static_cast<uInt>(str.size());

        int ret;
        char outbuffer[32768];
        std::string outstring;

        do
        {
            zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
            zs.avail_out = sizeof(outbuffer);
            ret = ::inflate(&zs, Z_NO_FLUSH);
            if (outstring.size() < zs.total_out)
            {
                outstring.append(outbuffer, zs.total_out - outstring.size());
            }

        } while (ret == Z_OK);

        inflateEnd(&zs);
        if (ret != Z_STREAM_END)
        {
            return tl::unexpected<ParseError>(ParseError::InflationError);
        }

        return outstring;
    }

    auto base64_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>
    {
        static const auto T = []()
        {
            std::array<int, 256> table;
            table.fill(-1);
            constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
            for (int i = 0; i < 64; i++)
                table[static_cast<unsigned char>(alphabet[i])] = i;
            return table;
        }();

        std::string out;
        int val = 0, valb = -8;
        bool padding = false;
        for (unsigned char c : encoded_str)
        {
            if (std::isspace(c))
                continue;
            if (c == '=')
            {
                padding = true;
                continue;
            }
            // data after padding, or outside the alphabet
            if (padding || T[c] < 0)
                return tl::unexpected<ParseError>(ParseError::Base64DecodeError);

            val = ((val << 6) + T[c]) & 0xFFFFFF;
            valb += 6;
            if (valb >= 0)
            {
                out.push_back(char((val >> valb) & 0xFF));
                valb -= 8;
            }
        }

        if (out.empty())
            return tl::unexpected<ParseError>(ParseError::Base64DecodeError);

        return out;
    }

    auto url_decode(std::string_view encoded_str) -> tl::expected<std::string, ParseError>
    {
        if (!helpers::valid_percent_escapes(encoded_str))
        {
            return tl::unexpected<ParseError>(ParseError::URLDecodeError);
        }

        // no easy handle: unescaping needs none, and skipping curl_easy_init keeps
        // libcurl's implicit global init off concurrent decode paths
        int outlen = 0;
        char *decoded = curl_easy_unescape(nullptr, encoded_str.data(), static_cast<int>(encoded_str.length()), &outlen);
        if (decoded == nullptr)
        {
            return tl::unexpected<ParseError>(ParseError::URLDecodeError);
        }

        std::string decoded_str(decoded, outlen);
        curl_free(decoded);

        if (!helpers::valid_utf8(decoded_str))
        {
            return tl::unexpected<ParseError>(ParseError::URLDecodeError);
        }
        return decoded_str;
    }

    auto read_records(const XMLElement *root) -> std::vector<CellRecord>
    {
        std::vector<CellRecord> records;
        if (root == nullptr)
        {
            return records;
        }

        for (auto *element = root->FirstChildElement(); element != nullptr; element = element->NextSiblingElement())
        {
            if (std::string_view{element->Name()} == "mxCell")
            {
                records.emplace_back(helpers::read_direct(element));
            }
            else if (helpers::is_wrapper(element))
            {
                records.emplace_back(helpers::read_wrapped(element));
            }
        }
        return records;
    }

    auto normalize(const CellRecord &record) -> Cell
    {
        return std::visit(helpers::Normalizer{}, record);
    }

    auto normalize_cells(const XMLElement *graph_model) -> std::vector<Cell>
    {
        if (graph_model == nullptr)
        {
            return {};
        }

        const auto records = read_records(graph_model->FirstChildElement("root"));
        return records 
            | views::transform([](const CellRecord &r){ return normalize(r); }) 
            | utility::to<std::vector<Cell>>();
    }

    auto describe(const ParseError err) -> std::string_view
    {
        switch (err)
        {
        case ParseError::EmptyPath:
            return "<EMPTY PATH> you provided an empty path to the draw.io diagram";
        case ParseError::SourceUnavailable:
            return "<SOURCE UNAVAILABLE> : the draw.io file could not be read";
        case ParseError::InvalidEncodedDrawioFile:
            return "<INVALID DRAWIO FILE ERROR> : the draw.io file is not well-formed XML";
        case ParseError::UnrecognisedRootElement:
            return "<UNRECOGNISED ROOT ERROR> : expected an <mxfile> or <mxGraphModel> root element";
        case ParseError::URLDecodeError:
            return "<URL DECODE ERROR> : the decompressed page is not valid percent-encoded UTF-8";
        case ParseError::Base64DecodeError:
            return "<BASE64 DECODE ERROR> : the page payload is not valid base64";
        case ParseError::InflationError:
            return "<INFLATION DECODE ERROR> : the page payload is not a valid raw deflate stream";
        case ParseError::InvalidDecodedDrawioFile:
            return "<INVALID DECODED DRAWIO PAGE ERROR> : the decompressed page is not an <mxGraphModel>";
        }
        return "Something unexpected went wrong ... try again.";
    }
}
