#include <gtest/gtest.h>
#include <models/entities.hpp>
#include <secr/idgen/sql/column.hpp>

#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <memory>
#include <string>

using namespace secr::idgen;

namespace {

    struct db_deleter
    {
        void operator()(sqlite3* db) const { sqlite3_close(db); }
    };

    struct stmt_deleter
    {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };

    using db_ptr = std::unique_ptr<sqlite3, db_deleter>;
    using stmt_ptr = std::unique_ptr<sqlite3_stmt, stmt_deleter>;

    struct sql_column_tests : testing::Test
    {
        void SetUp() override
        {
            sqlite3* raw = nullptr;
            ASSERT_EQ(SQLITE_OK, sqlite3_open(":memory:", &raw));
            db.reset(raw);
            exec("CREATE TABLE orders (id BLOB PRIMARY KEY, note TEXT)");
        }

        void exec(const std::string& sql)
        {
            ASSERT_EQ(SQLITE_OK, sqlite3_exec(db.get(), sql.c_str(), nullptr, nullptr, nullptr))
            << sqlite3_errmsg(db.get());
        }

        stmt_ptr prepare(const std::string& sql)
        {
            sqlite3_stmt* raw = nullptr;
            auto rc = sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw, nullptr);
            if (rc != SQLITE_OK)
                throw sql::sql_error(rc, sql);
            return stmt_ptr(raw);
        }

        db_ptr db;
    };
}

TEST_F(sql_column_tests, round_trip)
{
    const auto key = SECR_IDGEN_ID_LITERAL(models::order::ids, "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_EQ(models::order::ids::apply(boost::uuids::string_generator()("123e4567-e89b-12d3-a456-426614174000")), key);

    auto insert = prepare("INSERT INTO orders (id, note) VALUES (?, 'first')");
    sql::bind_column(insert.get(), 1, key);
    ASSERT_EQ(SQLITE_DONE, sqlite3_step(insert.get()));

    auto select = prepare("SELECT id, length(id), typeof(id) FROM orders");
    ASSERT_EQ(SQLITE_ROW, sqlite3_step(select.get()));
    EXPECT_EQ(16, sqlite3_column_int(select.get(), 1));
    EXPECT_EQ(std::string("blob"), reinterpret_cast<const char*>(sqlite3_column_text(select.get(), 2)));
    EXPECT_EQ(key, sql::read_column<models::order::id>(select.get(), 0));
}

TEST_F(sql_column_tests, lookup_by_id)
{
    auto a = models::invoice::ids::unsafe::random();
    auto b = models::invoice::ids::unsafe::random();
    for (auto& key : { a, b })
    {
        auto insert = prepare("INSERT INTO orders (id) VALUES (?)");
        sql::bind_column(insert.get(), 1, key);
        ASSERT_EQ(SQLITE_DONE, sqlite3_step(insert.get()));
    }

    auto select = prepare("SELECT id FROM orders WHERE id = ?");
    sql::bind_column(select.get(), 1, b);
    ASSERT_EQ(SQLITE_ROW, sqlite3_step(select.get()));
    EXPECT_EQ(b, sql::read_column<models::invoice::id>(select.get(), 0));
    EXPECT_EQ(SQLITE_DONE, sqlite3_step(select.get()));
}

TEST_F(sql_column_tests, plain_uuid)
{
    auto value = boost::uuids::string_generator()("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    auto select = prepare("SELECT ?");
    sql::bind_column(select.get(), 1, value);
    ASSERT_EQ(SQLITE_ROW, sqlite3_step(select.get()));
    EXPECT_EQ(value, sql::read_column<uuid>(select.get(), 0));
}

TEST_F(sql_column_tests, invalid_columns)
{
    auto select = prepare("SELECT 'text', x'0102', NULL");
    ASSERT_EQ(SQLITE_ROW, sqlite3_step(select.get()));
    EXPECT_THROW(sql::read_column<models::order::id>(select.get(), 0), sql::invalid_column);
    EXPECT_THROW(sql::read_column<models::order::id>(select.get(), 1), sql::invalid_column);
    EXPECT_THROW(sql::read_column<uuid>(select.get(), 2), sql::invalid_column);
}

TEST_F(sql_column_tests, bind_errors)
{
    auto insert = prepare("INSERT INTO orders (id) VALUES (?)");
    try {
        sql::bind_column(insert.get(), 5, models::order::ids::unsafe::random());
        FAIL() << "no exception thrown";
    }
    catch(const sql::sql_error& e)
    {
        EXPECT_EQ(SQLITE_RANGE, e.code().value());
        EXPECT_EQ(&sql::sqlite_category(), &e.code().category());
    }
}
