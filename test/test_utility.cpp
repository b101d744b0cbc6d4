#include <doctest/doctest.h>

#include <initializer_list>

#include <formdata/errors.hpp>
#include <formdata/utils.hpp>

using namespace formdata;

TEST_SUITE("utility")
{
    TEST_CASE("escape_quoted")
    {
        CHECK_EQ(escape_quoted("plain"), "plain");
        CHECK_EQ(escape_quoted("say \"hi\""), "say \\\"hi\\\"");
        CHECK_EQ(escape_quoted("C:\\tmp"), "C:\\\\tmp");
        CHECK_EQ(escape_quoted(""), "");
    }

    TEST_CASE("has_line_break")
    {
        CHECK_FALSE(has_line_break("name"));
        CHECK(has_line_break("a\r\nb"));
        CHECK(has_line_break("a\nb"));
        CHECK(has_line_break("a\r"));
    }

    TEST_CASE("record_child_path")
    {
        CHECK_EQ(record_child_path("", "address"), "address");
        CHECK_EQ(record_child_path("address", "city"), "address[city]");
        CHECK_EQ(record_child_path("a[b]", "c"), "a[b][c]");
    }

    TEST_CASE("sequence_child_path")
    {
        CHECK_EQ(sequence_child_path("tags", 0), "tags[0]");
        CHECK_EQ(sequence_child_path("tags[3]", 12), "tags[3][12]");
        // brackets are kept for an empty parent, unlike record fields
        CHECK_EQ(sequence_child_path("", 0), "[0]");
    }

    TEST_CASE("content_type_header")
    {
        CHECK_EQ(content_type_header("123"), "multipart/form-data; boundary=123");
    }

    TEST_CASE("contains")
    {
        CHECK(contains("abc--123def", "--123"));
        CHECK_FALSE(contains("abc-123", "--123"));
    }

    TEST_CASE("error_to_string")
    {
        EncodingError err{ ErrorCode::kBOUNDARY_COLLISION, "boom", "a[b]", nullptr };
        CHECK_EQ(err.to_string(), "BoundaryCollision at 'a[b]': boom");
        CHECK_FALSE(err.has_cause());
        CHECK_THROWS_AS(err.rethrow_cause(), std::logic_error);

        EncodingError root_err{ ErrorCode::kROOT_NOT_KEYED, "no record", {}, nullptr };
        CHECK_EQ(root_err.to_string(), "RootNotKeyed: no record");
    }

    TEST_CASE("error_level")
    {
        EncodingError traversal{ ErrorCode::kTRAVERSAL_FAILURE, "x", "a", nullptr };
        CHECK(traversal.level() == ErrorLevel::FATAL);

        for (auto code : { ErrorCode::kROOT_NOT_KEYED,
                           ErrorCode::kINVALID_PART_NAME,
                           ErrorCode::kBOUNDARY_COLLISION,
                           ErrorCode::kINVALID_BOUNDARY })
        {
            EncodingError err{ code, "x", {}, nullptr };
            CHECK(err.level() == ErrorLevel::SERIOUS);
        }
    }
}
