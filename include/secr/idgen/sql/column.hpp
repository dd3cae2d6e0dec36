#pragma once

#include <secr/idgen/config.hpp>
#include <secr/idgen/sql/errors.hpp>

#include <boost/type_traits/make_void.hpp>
#include <sqlite3.h>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace secr { namespace idgen { namespace sql {

    /// How a value of type T is bound to a statement parameter and read back
    /// from a result column.
    template<class T>
    struct column_mapping
    {
        using value_type = T;
        using write_function = std::function<void(sqlite3_stmt*, int, const T&)>;
        using read_function = std::function<T(sqlite3_stmt*, int)>;

        column_mapping(write_function write, read_function read)
        : _write(std::move(write))
        , _read(std::move(read))
        {}

        /// bind `value` to the 1-based parameter `index`
        /// @throws sql_error
        void write(sqlite3_stmt* stmt, int index, const T& value) const {
            _write(stmt, index, value);
        }

        /// read the 0-based result `column` of the current row
        /// @throws sql_error, invalid_column
        T read(sqlite3_stmt* stmt, int column) const {
            return _read(stmt, column);
        }

        /// The mapping of a U stored as this mapping's T: reading wraps the
        /// T read, writing unwraps the U before writing it.
        template<class U>
        column_mapping<U> imap(std::function<U(const T&)> wrap,
                               std::function<T(const U&)> unwrap) const
        {
            auto self = *this;
            return column_mapping<U>(
                [self, unwrap](sqlite3_stmt* stmt, int index, const U& value) {
                    self.write(stmt, index, unwrap(value));
                },
                [self, wrap](sqlite3_stmt* stmt, int column) {
                    return wrap(self.read(stmt, column));
                });
        }

    private:
        write_function _write;
        read_function _read;
    };

    /// a uuid stored as a 16 byte BLOB
    const column_mapping<uuid>& uuid_column();

    const column_mapping<uuid>& column_mapping_of(const uuid*);

    template<class T, class = void>
    struct has_column_mapping : std::false_type {};

    template<class T>
    struct has_column_mapping<T, boost::void_t<decltype(column_mapping_of(std::declval<const T*>()))>>
    : std::true_type {};

    template<class T>
    void bind_column(sqlite3_stmt* stmt, int index, const T& value)
    {
        column_mapping_of(std::addressof(value)).write(stmt, index, value);
    }

    template<class T>
    T read_column(sqlite3_stmt* stmt, int column)
    {
        return column_mapping_of(static_cast<const T*>(nullptr)).read(stmt, column);
    }

}}}
