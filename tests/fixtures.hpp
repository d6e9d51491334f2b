#ifndef TEST_FIXTURES_H
#define TEST_FIXTURES_H

#include "../include/parser.hpp"
#include "../include/model.hpp"
#include "../include/type_aliases.hpp"

#include <gtest/gtest.h>

#include <zlib.h>
#include <curl/curl.h>
#include <fmt/format.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace fixtures
{
    // the encoding draw.io applies to a page: percent-encode, raw deflate, base64
    inline auto url_encode(std::string_view text) -> std::string
    {
        char *escaped = curl_easy_escape(nullptr, text.data(), static_cast<int>(text.size()));
        std::string out{escaped};
        curl_free(escaped);
        return out;
    }

    inline auto deflate_raw(std::string_view data) -> std::string
    {
        z_stream zs;
        memset(&zs, 0, sizeof(zs));
        deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);

        zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
        zs.avail_in = static_cast<uInt>(data.size());

        std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
        zs.next_out = reinterpret_cast<Bytef *>(out.data());
        zs.avail_out = static_cast<uInt>(out.size());
        deflate(&zs, Z_FINISH);
        out.resize(zs.total_out);
        deflateEnd(&zs);
        return out;
    }

    inline auto base64_encode(std::string_view data) -> std::string
    {
        constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string out;
        unsigned int val = 0;
        int valb = -6;
        for (unsigned char c : data)
        {
            val = ((val << 8) + c) & 0xFFFFFF;
            valb += 8;
            while (valb >= 0)
            {
                out.push_back(alphabet[(val >> valb) & 0x3F]);
                valb -= 6;
            }
        }
        if (valb > -6)
            out.push_back(alphabet[((val << 8) >> (valb + 8)) & 0x3F]);
        while (out.size() % 4)
            out.push_back('=');
        return out;
    }

    inline auto compress(std::string_view xml) -> std::string
    {
        return base64_encode(deflate_raw(url_encode(xml)));
    }

    // two pages: "A" holds an untitled swimlane with two shapes and one edge
    // between them, "B" is empty
    inline constexpr std::string_view page_a_model = R"(<mxGraphModel><root>
  <mxCell id="0"/>
  <mxCell id="1" parent="0"/>
  <mxCell id="lane" value="" style="swimlane;whiteSpace=wrap;html=1;" vertex="1" parent="1"/>
  <mxCell id="s1" value="Receive &lt;b&gt;order&lt;/b&gt;" style="rounded=1;whiteSpace=wrap;html=1;" vertex="1" parent="lane"/>
  <mxCell id="s2" value="Ship" style="whiteSpace=wrap;html=1;" vertex="1" parent="lane"/>
  <mxCell id="e1" value="" style="edgeStyle=orthogonalEdgeStyle;endArrow=block;endFill=1;" edge="1" parent="1" source="s1" target="s2"/>
</root></mxGraphModel>)";

    inline auto two_page_document() -> std::string
    {
        return fmt::format(
            "<mxfile host=\"test\">\n"
            "<diagram id=\"a\" name=\"A\">{}</diagram>\n"
            "<diagram id=\"b\" name=\"B\"><mxGraphModel><root/></mxGraphModel></diagram>\n"
            "</mxfile>",
            page_a_model
        );
    }

    inline auto compressed_document(std::string_view payload) -> std::string
    {
        return fmt::format("<mxfile><diagram id=\"c\" name=\"A\">{}</diagram></mxfile>", payload);
    }

    // a document with exactly one inline page
    inline auto single_page(std::string_view cells) -> std::string
    {
        return fmt::format(
            "<mxfile><diagram name=\"Page-1\"><mxGraphModel><root>"
            "<mxCell id=\"0\"/><mxCell id=\"1\" parent=\"0\"/>{}"
            "</root></mxGraphModel></diagram></mxfile>",
            cells
        );
    }

    inline auto build(std::string_view xml) -> Diagram
    {
        auto document = parser::parse_document(xml);
        EXPECT_TRUE(document.has_value());
        if (!document)
        {
            return {};
        }
        return model::build_diagram(document.value());
    }

    // a file under the temp directory, removed when the object goes away
    class TempFile
    {
    public:
        TempFile(std::string_view name, std::string_view content)
            : m_path{std::filesystem::temp_directory_path() / fmt::format("drawio_extract_{}_{}", ::getpid(), name)}
        {
            std::ofstream out(m_path, std::ios::out | std::ios::trunc);
            out << content;
        }

        ~TempFile()
        {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        TempFile(const TempFile&) = delete;
        TempFile& operator=(const TempFile&) = delete;

        auto path() const -> const std::filesystem::path& { return m_path; }

    private:
        std::filesystem::path m_path;
    };
}

#endif
