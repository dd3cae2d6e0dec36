#include <gtest/gtest.h>
#include <secr/idgen/codegen/exception.hpp>

#include <string>

using namespace secr::idgen;

namespace {

    SourceLocation at(const std::string& file, int line, int column)
    {
        SourceLocation where;
        where.set_file(file);
        where.set_line(line);
        where.set_column(column);
        return where;
    }
}

TEST(exception_tests, location_text)
{
    EXPECT_EQ("a.hpp:3:7", codegen::to_string(at("a.hpp", 3, 7)));
    EXPECT_EQ("models/user.hpp:1:1", codegen::to_string(at("models/user.hpp", 1, 1)));
}

TEST(exception_tests, kind_names)
{
    EXPECT_STREQ("ConfigError", codegen::kind_name(codegen::generation_errc::config_error));
    EXPECT_STREQ("ShapeError", codegen::kind_name(codegen::generation_errc::shape_error));
    EXPECT_STREQ("LiteralFormatError", codegen::kind_name(codegen::generation_errc::literal_format_error));
    EXPECT_STREQ("LexicalError", codegen::kind_name(codegen::generation_errc::lexical_error));
}

TEST(exception_tests, generation_errors_keep_detail_and_location)
{
    try {
        throw codegen::literal_format_error("invalid uuid literal \"x\"", "x", at("b.hpp", 2, 4));
    }
    catch(const codegen::generation_error& e)
    {
        EXPECT_EQ(codegen::generation_errc::literal_format_error, e.errc());
        EXPECT_STREQ("secr::idgen::generation", e.code().category().name());
        EXPECT_EQ("invalid uuid literal \"x\"", e.detail());
        EXPECT_EQ("b.hpp:2:4", codegen::to_string(e.where()));
    }
}
