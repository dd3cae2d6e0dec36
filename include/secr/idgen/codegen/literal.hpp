#pragma once

#include <secr/idgen/codegen/lexer.hpp>
#include <secr/idgen/config.hpp>
#include <secr/idgen/idgen.pb.h>
#include <boost/optional.hpp>
#include <cstddef>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    /// human readable form of the grammar accepted by boost::uuids::string_generator
    extern const char* const uuid_grammar;

    /// Parse `text` exactly as the run time parser would.
    /// @throws literal_format_error naming `text` and the expected grammar
    uuid validate_literal(const std::string& text, const SourceLocation& where);

    /// A C++ expression that constructs `value` without any parsing, e.g.
    /// `::boost::uuids::uuid{{0x12, 0x3e, ...}}`
    std::string uuid_constant(const uuid& value);

    /// The characters a narrow string literal token (unprefixed or `u8`,
    /// raw or not) denotes, with escape sequences decoded. None for any
    /// other token.
    /// @throws literal_format_error for an escape sequence that cannot be
    ///         decoded to a single char
    boost::optional<std::string> narrow_string_value(const source_file& file, const token& tok);

    /// true when `ids` `::` `literal` `(` starts at `i`
    bool is_literal_call(const source_file& file, std::size_t i);

    struct literal_call
    {
        /// index of the `literal` token
        std::size_t first;

        /// one past the closing `)`
        std::size_t last;

        std::string text;
        uuid value;
    };

    /// Validate the call site at `i` (which must satisfy is_literal_call).
    /// The argument is one narrow string literal or several adjacent ones,
    /// which are concatenated.
    /// @throws literal_format_error when the argument is anything else or
    ///         does not hold a valid uuid
    literal_call validate_literal_call(const source_file& file, std::size_t i);

    /// replacement for the tokens [first, last) of a validated call
    std::string render_literal_call(const literal_call& call);

}}}
