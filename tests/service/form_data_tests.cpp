/**
 * @file form_data_tests.cpp
 * @brief Unit tests for FormData and url_decode()
 */
#include <gtest/gtest.h>
#include "dagcheck/service/form_data.hpp"

using namespace dagcheck;

TEST(FormDataTests, Decode_PlusAndPercent)
{
    EXPECT_EQ(url_decode("a+b%20c"), "a b c");
    EXPECT_EQ(url_decode("%5B%7B%22id%22%3A%22A%22%7D%5D"), R"([{"id":"A"}])");
}

TEST(FormDataTests, Decode_InvalidEscapeKeptAsWritten)
{
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
    EXPECT_EQ(url_decode("%4"), "%4");
}

TEST(FormDataTests, Parse_Fields)
{
    auto form = FormData::parse("nodes=%5B%5D&edges=%5B%5D");
    EXPECT_EQ(form.size(), 2u);
    EXPECT_EQ(form.get("nodes"), std::optional<std::string>("[]"));
    EXPECT_EQ(form.get("edges"), std::optional<std::string>("[]"));
    EXPECT_FALSE(form.get("other").has_value());
}

TEST(FormDataTests, Parse_KeyWithoutValueIsEmpty)
{
    auto form = FormData::parse("nodes&edges=");
    EXPECT_EQ(form.get("nodes"), std::optional<std::string>(""));
    EXPECT_EQ(form.get("edges"), std::optional<std::string>(""));
}

TEST(FormDataTests, Parse_LastValueWins)
{
    auto form = FormData::parse("a=1&&a=2");
    EXPECT_EQ(form.size(), 1u);
    EXPECT_EQ(form.get("a"), std::optional<std::string>("2"));
}

TEST(FormDataTests, Parse_EmptyInput)
{
    EXPECT_TRUE(FormData::parse("").empty());
}

// ============================================================================
// Multipart
// ============================================================================

namespace
{

std::string multipart_part(const std::string& boundary, const std::string& disposition,
                           const std::string& content)
{
    return "--" + boundary + "\r\n" + "Content-Disposition: " + disposition + "\r\n\r\n" +
           content + "\r\n";
}

} // namespace

TEST(FormDataTests, Multipart_Fields)
{
    std::string body = multipart_part("XyZ", "form-data; name=\"nodes\"", "[{\"id\": 1}]") +
                       multipart_part("XyZ", "form-data; name=\"edges\"", "[]") + "--XyZ--\r\n";
    auto form = FormData::parse_multipart(body, "XyZ");
    EXPECT_EQ(form.size(), 2u);
    EXPECT_EQ(form.get("nodes"), std::optional<std::string>("[{\"id\": 1}]"));
    EXPECT_EQ(form.get("edges"), std::optional<std::string>("[]"));
}

TEST(FormDataTests, Multipart_ContentKeptVerbatim)
{
    std::string body =
        multipart_part("b", "form-data; name=\"nodes\"", "a+b%20c\r\nline two") + "--b--";
    auto form = FormData::parse_multipart(body, "b");
    EXPECT_EQ(form.get("nodes"), std::optional<std::string>("a+b%20c\r\nline two"));
}

TEST(FormDataTests, Multipart_FilePartReadByName)
{
    std::string body = "preamble\r\n--b\r\n"
                       "Content-Disposition: form-data; filename=\"n.json\"; name=\"nodes\"\r\n"
                       "Content-Type: application/json\r\n\r\n"
                       "[]\r\n--b--\r\n";
    auto form = FormData::parse_multipart(body, "b");
    EXPECT_EQ(form.get("nodes"), std::optional<std::string>("[]"));
    EXPECT_FALSE(form.get("n.json").has_value());
}

TEST(FormDataTests, Multipart_MissingBoundary)
{
    EXPECT_THROW(FormData::parse_multipart("nodes=[]", "b"), FormDataError);
}

TEST(FormDataTests, Multipart_UnterminatedPart)
{
    std::string body = "--b\r\nContent-Disposition: form-data; name=\"nodes\"\r\n\r\n[]";
    EXPECT_THROW(FormData::parse_multipart(body, "b"), FormDataError);
}

TEST(FormDataTests, Multipart_PartWithoutName)
{
    std::string body = multipart_part("b", "form-data", "[]") + "--b--";
    EXPECT_THROW(FormData::parse_multipart(body, "b"), FormDataError);
}

TEST(FormDataTests, Boundary_FromContentType)
{
    EXPECT_EQ(FormData::multipart_boundary("multipart/form-data; boundary=abc123"),
              std::optional<std::string>("abc123"));
    EXPECT_EQ(FormData::multipart_boundary("multipart/form-data; Boundary=\"a b\""),
              std::optional<std::string>("a b"));
    EXPECT_FALSE(FormData::multipart_boundary("multipart/form-data").has_value());
    EXPECT_FALSE(FormData::multipart_boundary("multipart/form-data; boundary=").has_value());
}
