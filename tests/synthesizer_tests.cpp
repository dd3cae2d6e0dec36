#include <gtest/gtest.h>
#include <secr/idgen/codegen/synthesizer.hpp>

#include <string>

using namespace secr::idgen;
using namespace secr::idgen::codegen;

namespace {

    TargetShape make_shape(std::string name, std::string body)
    {
        TargetShape shape;
        shape.set_name(std::move(name));
        shape.set_body(std::move(body));
        return shape;
    }

    MarkerConfig with_adapter(bool flag)
    {
        MarkerConfig config;
        config.set_derive_adapter(flag);
        return config;
    }

    std::size_t occurrences(const std::string& text, const std::string& what)
    {
        std::size_t count = 0;
        for (auto pos = text.find(what) ; pos != std::string::npos ; pos = text.find(what, pos + 1))
            ++count;
        return count;
    }
}

TEST(synthesizer_tests, deterministic)
{
    auto shape = make_shape("user", "\n    int extra;\n");
    shape.add_parents("audit");
    auto a = synthesize(with_adapter(true), shape);
    auto b = synthesize(with_adapter(true), shape);
    EXPECT_EQ(a.text(), b.text());
    EXPECT_EQ(a.SerializeAsString(), b.SerializeAsString());
}

TEST(synthesizer_tests, names_the_declaration)
{
    auto generated = synthesize(with_adapter(false), make_shape("order", ""));
    EXPECT_EQ("order", generated.name());
    EXPECT_EQ(0u, generated.text().find("namespace order {\n"));
    EXPECT_EQ('}', generated.text().back());
}

TEST(synthesizer_tests, declares_tag_id_and_companion)
{
    auto text = synthesize(with_adapter(false), make_shape("user", "")).text();
    EXPECT_EQ(1u, occurrences(text, "struct id_tag;"));
    EXPECT_EQ(1u, occurrences(text, "using id = ::secr::idgen::tagged_uuid<id_tag>;"));
    EXPECT_EQ(1u, occurrences(text, "namespace ids {"));
    EXPECT_EQ(1u, occurrences(text, "constexpr id apply(const ::boost::uuids::uuid& value)"));
    EXPECT_EQ(1u, occurrences(text, "id literal(const char (&text)[N]) = delete;"));
    EXPECT_EQ(1u, occurrences(text, "Effect<id> random()"));
    EXPECT_EQ(1u, occurrences(text, "namespace unsafe {"));
}

TEST(synthesizer_tests, exactly_one_combined_instance)
{
    auto text = synthesize(with_adapter(true), make_shape("user", "")).text();
    EXPECT_EQ(1u, occurrences(text, "hash_order_show_of(const id*)"));
    EXPECT_EQ(0u, occurrences(text, "operator=="));
}

TEST(synthesizer_tests, adapter_only_when_requested)
{
    auto without = synthesize(with_adapter(false), make_shape("user", ""));
    EXPECT_FALSE(without.has_adapter());
    EXPECT_EQ(0u, occurrences(without.text(), "column_mapping"));

    auto with = synthesize(with_adapter(true), make_shape("user", ""));
    EXPECT_TRUE(with.has_adapter());
    EXPECT_EQ(1u, occurrences(with.text(), "column_mapping_of(const id*)"));
    EXPECT_EQ(1u, occurrences(with.text(), ".imap<id>("));
}

TEST(synthesizer_tests, parents_first_body_last)
{
    auto body = std::string("\n    struct profile { int age; };\n    int b; int a;\n");
    auto shape = make_shape("user", body);
    shape.add_parents("audit");
    shape.add_parents("::core::entity");
    auto text = synthesize(with_adapter(true), shape).text();

    EXPECT_EQ(std::string("namespace user {\n"
                          "    using namespace audit;\n"
                          "    using namespace ::core::entity;\n"),
              text.substr(0, text.find('\n', text.find("entity")) + 1));

    auto body_at = text.find(body);
    ASSERT_NE(std::string::npos, body_at);
    EXPECT_EQ(text.size() - 1, body_at + body.size());
    EXPECT_LT(text.find("struct id_tag;"), body_at);
    EXPECT_LT(text.find("column_mapping_of"), body_at);
    EXPECT_LT(text.find("hash_order_show_of"), body_at);
}
