#include <secr/idgen/sql/errors.hpp>
#include <sqlite3.h>

namespace secr { namespace idgen { namespace sql {

    namespace {

        struct _sqlite_category : error_category
        {
            const char *     name() const noexcept override {
                return "sqlite";
            }

            std::string message( int ev ) const override
            {
                return sqlite3_errstr(ev);
            }
        };
    }

    const error_category& sqlite_category()
    {
        static const _sqlite_category _ {};
        return _;
    }

    error_code make_sqlite_error(int result_code)
    {
        return error_code(result_code, sqlite_category());
    }

    invalid_column::invalid_column(const std::string& what)
    : sql_error(SQLITE_MISMATCH, what)
    {}

}}}
