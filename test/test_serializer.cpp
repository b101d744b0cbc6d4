#include <doctest/doctest.h>

#include <string>
#include <vector>

#include <formdata/serializer.hpp>

using namespace formdata;

namespace
{
    NamedPart text_part(std::string name, std::string body)
    {
        return NamedPart{ std::move(name), std::nullopt, std::nullopt, std::move(body) };
    }
}

TEST_SUITE("serializer")
{
    TEST_CASE("single_part_framing")
    {
        std::vector<NamedPart> parts{ text_part("a", "x") };
        auto res = MultipartSerializer().serialize(parts, "123");

        REQUIRE(res.has_value());
        CHECK_EQ(res.value(),
                 "--123\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nx\r\n--123--\r\n");
    }

    TEST_CASE("file_part_headers")
    {
        std::vector<NamedPart> parts{
            NamedPart{ "upload", "hello.txt", "text/plain", "hello" },
            text_part("note", "n"),
        };
        auto res = MultipartSerializer().serialize(parts, "b");

        REQUIRE(res.has_value());
        CHECK_EQ(res.value(),
                 "--b\r\n"
                 "Content-Disposition: form-data; name=\"upload\"; filename=\"hello.txt\"\r\n"
                 "Content-Type: text/plain\r\n"
                 "\r\n"
                 "hello\r\n"
                 "--b\r\n"
                 "Content-Disposition: form-data; name=\"note\"\r\n"
                 "\r\n"
                 "n\r\n"
                 "--b--\r\n");
    }

    TEST_CASE("empty_filename")
    {
        std::vector<NamedPart> parts{ NamedPart{ "upload", "", "application/octet-stream", "" } };
        auto res = MultipartSerializer().serialize(parts, "b");

        REQUIRE(res.has_value());
        CHECK_EQ(res.value(),
                 "--b\r\n"
                 "Content-Disposition: form-data; name=\"upload\"; filename=\"\"\r\n"
                 "Content-Type: application/octet-stream\r\n"
                 "\r\n"
                 "\r\n"
                 "--b--\r\n");
    }

    TEST_CASE("content_type_without_filename")
    {
        std::vector<NamedPart> parts{ NamedPart{ "meta", std::nullopt, "application/json", "{}" } };
        auto res = MultipartSerializer().serialize(parts, "b");

        REQUIRE(res.has_value());
        CHECK_EQ(res.value(),
                 "--b\r\n"
                 "Content-Disposition: form-data; name=\"meta\"\r\n"
                 "Content-Type: application/json\r\n"
                 "\r\n"
                 "{}\r\n"
                 "--b--\r\n");
    }

    TEST_CASE("name_and_filename_escaping")
    {
        std::vector<NamedPart> parts{
            NamedPart{ "say \"hi\"", "C:\\dir\\\"f\".bin", std::nullopt, "" },
        };
        auto res = MultipartSerializer().serialize(parts, "b");

        REQUIRE(res.has_value());
        CHECK(res.value().find("name=\"say \\\"hi\\\"\"") != std::string::npos);
        CHECK(res.value().find("filename=\"C:\\\\dir\\\\\\\"f\\\".bin\"") != std::string::npos);
    }

    TEST_CASE("empty_part_list")
    {
        auto res = MultipartSerializer().serialize({}, "Z");
        REQUIRE(res.has_value());
        CHECK_EQ(res.value(), "--Z--\r\n");
    }

    TEST_CASE("empty_body")
    {
        std::vector<NamedPart> parts{ text_part("a", "") };
        auto res = MultipartSerializer().serialize(parts, "1");
        REQUIRE(res.has_value());
        CHECK_EQ(res.value(), "--1\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\n\r\n--1--\r\n");
    }

    TEST_CASE("binary_body_is_written_verbatim")
    {
        const std::string body("\x00\x01\r\n\xff-", 6);
        std::vector<NamedPart> parts{ NamedPart{ "bin", "f", "application/octet-stream", body } };

        auto text = MultipartSerializer().serialize(parts, "q");
        auto bytes = MultipartSerializer().serialize_to_bytes(parts, "q");
        REQUIRE(text.has_value());
        REQUIRE(bytes.has_value());

        CHECK(contains(text.value(), body));
        CHECK_EQ(std::string(bytes.value().begin(), bytes.value().end()), text.value());
    }

    TEST_CASE("boundary_collision")
    {
        std::vector<NamedPart> parts{ text_part("a", "x"), text_part("b", "abc--123def") };
        auto res = MultipartSerializer().serialize(parts, "123");

        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().code == ErrorCode::kBOUNDARY_COLLISION);
        CHECK_EQ(res.error().path, "b");
    }

    TEST_CASE("boundary_without_dashes_is_not_a_collision")
    {
        std::vector<NamedPart> parts{ text_part("a", "123-123") };
        CHECK(MultipartSerializer().serialize(parts, "123").has_value());
    }

    TEST_CASE("failure_leaves_sink_untouched")
    {
        std::vector<NamedPart> parts{ text_part("a", "x"), text_part("b", "--123") };
        std::string sink = "prefix";

        auto res = MultipartSerializer().serialize_into(parts, "123", sink);
        CHECK_FALSE(res.has_value());
        CHECK_EQ(sink, "prefix");
    }

    TEST_CASE("serialize_into_appends")
    {
        std::vector<NamedPart> parts{ text_part("a", "x") };
        std::vector<unsigned char> sink{ 'P' };

        auto res = MultipartSerializer().serialize_into(parts, "123", sink);
        REQUIRE(res.has_value());

        const std::string expected
            = "P--123\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nx\r\n--123--\r\n";
        CHECK_EQ(std::string(sink.begin(), sink.end()), expected);
    }

    TEST_CASE("invalid_part_names")
    {
        SUBCASE("line feed")
        {
            std::vector<NamedPart> parts{ text_part("a\nb", "x") };
            auto res = MultipartSerializer().serialize(parts, "1");
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().code == ErrorCode::kINVALID_PART_NAME);
        }
        SUBCASE("carriage return line feed")
        {
            std::vector<NamedPart> parts{ text_part("a\r\nb", "x") };
            auto res = MultipartSerializer().serialize(parts, "1");
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().code == ErrorCode::kINVALID_PART_NAME);
        }
        SUBCASE("empty")
        {
            std::vector<NamedPart> parts{ text_part("", "x") };
            auto res = MultipartSerializer().serialize(parts, "1");
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().code == ErrorCode::kINVALID_PART_NAME);
        }
        SUBCASE("filename")
        {
            std::vector<NamedPart> parts{ NamedPart{ "f", "a\nb", std::nullopt, "x" } };
            auto res = MultipartSerializer().serialize(parts, "1");
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().code == ErrorCode::kINVALID_PART_NAME);
        }
    }

    TEST_CASE("invalid_boundary")
    {
        std::vector<NamedPart> parts{ text_part("a", "x") };

        auto empty = MultipartSerializer().serialize(parts, "");
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().code == ErrorCode::kINVALID_BOUNDARY);

        auto too_long = MultipartSerializer().serialize(parts, std::string(71, 'x'));
        REQUIRE_FALSE(too_long.has_value());
        CHECK(too_long.error().code == ErrorCode::kINVALID_BOUNDARY);

        auto line_break = MultipartSerializer().serialize(parts, "a\r\nb");
        REQUIRE_FALSE(line_break.has_value());
        CHECK(line_break.error().code == ErrorCode::kINVALID_BOUNDARY);

        CHECK(MultipartSerializer().serialize(parts, std::string(70, 'x')).has_value());
    }

    TEST_CASE("deterministic")
    {
        std::vector<NamedPart> parts{ text_part("a", "x"),
                                      NamedPart{ "f", "f.bin", "image/png", "\x89PNG" } };
        auto first = MultipartSerializer().serialize(parts, "boundary");
        auto second = MultipartSerializer().serialize(parts, "boundary");
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK_EQ(first.value(), second.value());
    }
}
