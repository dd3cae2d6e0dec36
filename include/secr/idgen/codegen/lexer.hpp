#pragma once

#include <secr/idgen/idgen.pb.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace secr { namespace idgen { namespace codegen {

    enum class token_kind
    {
        identifier,
        number,
        string_literal,
        char_literal,
        punctuation,
        directive,
        end_of_file,
    };

    struct token
    {
        token_kind kind;
        std::string text;

        /// byte offset of the first character in the source text
        std::size_t offset;
        std::uint32_t line;
        std::uint32_t column;

        std::size_t end_offset() const { return offset + text.size(); }

        bool is(token_kind k, const char* t) const {
            return kind == k and text == t;
        }

        bool is_punct(const char* t) const { return is(token_kind::punctuation, t); }
        bool is_ident(const char* t) const { return is(token_kind::identifier, t); }
    };

    /// A source file split into tokens. The last token is always end_of_file.
    struct source_file
    {
        std::string name;
        std::string text;
        std::vector<token> tokens;

        const token& at(std::size_t i) const {
            return i < tokens.size() ? tokens[i] : tokens.back();
        }

        std::string slice(std::size_t first_offset, std::size_t last_offset) const {
            return text.substr(first_offset, last_offset - first_offset);
        }
    };

    /// Comments are dropped, literals and preprocessor directives become
    /// single tokens.
    /// @throws lexical_error on an unterminated comment or literal
    source_file tokenize(std::string name, std::string text);

    SourceLocation location_of(const source_file& file, const token& tok);

}}}
