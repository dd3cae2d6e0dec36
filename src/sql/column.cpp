#include <secr/idgen/sql/column.hpp>

#include <boost/format.hpp>
#include <algorithm>
#include <cstdint>

namespace secr { namespace idgen { namespace sql {

    namespace {

        void write_uuid(sqlite3_stmt* stmt, int index, const uuid& value)
        {
            auto rc = sqlite3_bind_blob(stmt, index,
                                        value.data, static_cast<int>(value.size()),
                                        SQLITE_TRANSIENT);
            if (rc != SQLITE_OK)
                throw sql_error(rc, "binding uuid to parameter " + std::to_string(index));
        }

        uuid read_uuid(sqlite3_stmt* stmt, int column)
        {
            if (sqlite3_column_type(stmt, column) != SQLITE_BLOB)
                throw invalid_column((boost::format("column %1% does not hold a BLOB") % column).str());

            auto data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
            auto size = sqlite3_column_bytes(stmt, column);

            uuid result;
            if (size != static_cast<int>(result.size()))
            {
                throw invalid_column((boost::format("column %1% holds %2% bytes, a uuid needs %3%")
                                      % column % size % result.size()).str());
            }
            std::copy(data, data + size, result.begin());
            return result;
        }
    }

    const column_mapping<uuid>& uuid_column()
    {
        static const column_mapping<uuid> mapping { &write_uuid, &read_uuid };
        return mapping;
    }

    const column_mapping<uuid>& column_mapping_of(const uuid*)
    {
        return uuid_column();
    }

}}}
