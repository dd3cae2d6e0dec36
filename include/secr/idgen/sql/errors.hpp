#pragma once
#include <secr/idgen/config.hpp>
#include <string>

namespace secr { namespace idgen { namespace sql {

    /// the category of sqlite3 result codes
    const error_category& sqlite_category();

    error_code make_sqlite_error(int result_code);

	struct sql_error : system_error
	{
        sql_error(int result_code, const std::string& what)
        : system_error(make_sqlite_error(result_code), what)
        {}
	};

    /// a stored value that cannot be read back as the mapped type
	struct invalid_column : sql_error
	{
        explicit invalid_column(const std::string& what);
	};

}}}
