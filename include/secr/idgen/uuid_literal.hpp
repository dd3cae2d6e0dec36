#pragma once

#include <secr/idgen/config.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace secr { namespace idgen {

    struct invalid_uuid_literal : std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    namespace detail {

        constexpr int hex_digit(char c)
        {
            return (c >= '0' and c <= '9') ? c - '0'
            : (c >= 'a' and c <= 'f') ? c - 'a' + 10
            : (c >= 'A' and c <= 'F') ? c - 'A' + 10
            : -1;
        }

        struct literal_cursor
        {
            const char* text;
            std::size_t size;
            std::size_t pos;

            constexpr char next()
            {
                if (pos >= size)
                    throw invalid_uuid_literal("invalid uuid literal: unexpected end of text");
                return text[pos++];
            }
        };

        constexpr std::uint8_t nibble(char c)
        {
            return hex_digit(c) < 0
            ? throw invalid_uuid_literal("invalid uuid literal: expected a hexadecimal digit")
            : static_cast<std::uint8_t>(hex_digit(c));
        }
    }

    /// Parse `size` characters of `text` with the grammar of
    /// boost::uuids::string_generator: 32 hex digits, dashes either absent or
    /// placed 8-4-4-4-12, optionally enclosed in braces.
    ///
    /// Usable in a constant expression, where a malformed literal fails to
    /// compile.
    /// @throws invalid_uuid_literal
    constexpr uuid parse_uuid_literal(const char* text, std::size_t size)
    {
        detail::literal_cursor cur { text, size, 0 };
        uuid result {};

        char c = cur.next();
        bool braced = c == '{';
        if (braced)
            c = cur.next();

        bool dashes = false;
        for (std::size_t i = 0 ; i < 16 ; ++i)
        {
            if (i != 0)
                c = cur.next();

            if (i == 4)
            {
                dashes = c == '-';
                if (dashes)
                    c = cur.next();
            }
            else if (dashes and (i == 6 or i == 8 or i == 10))
            {
                if (c != '-')
                    throw invalid_uuid_literal("invalid uuid literal: expected '-'");
                c = cur.next();
            }

            auto high = detail::nibble(c);
            c = cur.next();
            result.data[i] = static_cast<std::uint8_t>((high << 4) | detail::nibble(c));
        }

        if (braced and cur.next() != '}')
            throw invalid_uuid_literal("invalid uuid literal: expected '}'");

        if (cur.pos != size)
            throw invalid_uuid_literal("invalid uuid literal: trailing characters");

        return result;
    }

    template<std::size_t N>
    constexpr uuid parse_uuid_literal(const char (&text)[N])
    {
        return parse_uuid_literal(text, N - 1);
    }

}}

/// An id constant built from a literal during compilation, for sources that
/// are not run through idgen (where `ids::literal` is deleted). `COMPANION`
/// names the id's companion namespace, e.g.
/// SECR_IDGEN_ID_LITERAL(user::ids, "123e4567-e89b-12d3-a456-426614174000")
/// A malformed literal fails to compile.
#define SECR_IDGEN_ID_LITERAL(COMPANION, TEXT)                                  \
    ([] {                                                                       \
        constexpr auto secr_idgen_literal_value =                               \
            COMPANION::apply(::secr::idgen::parse_uuid_literal(TEXT));          \
        return secr_idgen_literal_value;                                        \
    }())
