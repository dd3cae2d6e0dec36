#include <secr/idgen/codegen/lexer.hpp>
#include <secr/idgen/codegen/exception.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    namespace {

        bool is_ident_start(char c) {
            return std::isalpha(static_cast<unsigned char>(c)) or c == '_' or c == '$';
        }

        bool is_ident_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '$';
        }

        bool is_digit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_literal_prefix(const std::string& s) {
            static const char* prefixes[] = { "u8", "u", "U", "L" };
            return std::find_if(std::begin(prefixes), std::end(prefixes),
                                [&s](const char* p) { return s == p; }) != std::end(prefixes);
        }

        bool is_raw_prefix(const std::string& s) {
            static const char* prefixes[] = { "R", "u8R", "uR", "UR", "LR" };
            return std::find_if(std::begin(prefixes), std::end(prefixes),
                                [&s](const char* p) { return s == p; }) != std::end(prefixes);
        }

        struct scanner
        {
            scanner(const std::string& name, const std::string& text)
            : _name(name), _text(text)
            {}

            bool done() const { return _pos >= _text.size(); }
            char peek(std::size_t ahead = 0) const {
                auto p = _pos + ahead;
                return p < _text.size() ? _text[p] : '\0';
            }

            char advance()
            {
                char c = _text[_pos++];
                if (c == '\n') {
                    ++_line;
                    _column = 1;
                    _at_line_start = true;
                }
                else {
                    ++_column;
                    if (not std::isspace(static_cast<unsigned char>(c)))
                        _at_line_start = false;
                }
                return c;
            }

            bool consume_if(char c)
            {
                if (not done() and peek() == c) {
                    advance();
                    return true;
                }
                return false;
            }

            [[noreturn]] void fail(const std::string& what, std::uint32_t line, std::uint32_t column) const
            {
                SourceLocation where;
                where.set_file(_name);
                where.set_line(line);
                where.set_column(column);
                throw lexical_error(what, where);
            }

            void skip_space_and_comments()
            {
                while (not done())
                {
                    auto c = peek();
                    if (std::isspace(static_cast<unsigned char>(c))) {
                        advance();
                    }
                    else if (c == '/' and peek(1) == '/') {
                        while (not done() and peek() != '\n')
                            advance();
                    }
                    else if (c == '/' and peek(1) == '*') {
                        auto line = _line, column = _column;
                        advance(); advance();
                        while (not (peek() == '*' and peek(1) == '/')) {
                            if (done())
                                fail("unterminated comment", line, column);
                            advance();
                        }
                        advance(); advance();
                    }
                    else {
                        break;
                    }
                }
            }

            void quoted(char quote, std::uint32_t line, std::uint32_t column)
            {
                advance();
                while (true)
                {
                    if (done() or peek() == '\n')
                        fail(quote == '"' ? "unterminated string literal" : "unterminated character literal",
                             line, column);
                    auto c = advance();
                    if (c == '\\') {
                        if (done())
                            fail("unterminated escape sequence", line, column);
                        advance();
                    }
                    else if (c == quote) {
                        return;
                    }
                }
            }

            void raw_string(std::uint32_t line, std::uint32_t column)
            {
                advance();
                std::string delimiter;
                while (not done() and peek() != '(') {
                    if (delimiter.size() >= 16 or std::isspace(static_cast<unsigned char>(peek())))
                        fail("invalid raw string delimiter", line, column);
                    delimiter.push_back(advance());
                }
                if (not consume_if('('))
                    fail("unterminated raw string literal", line, column);
                auto terminator = ")" + delimiter + "\"";
                auto found = _text.find(terminator, _pos);
                if (found == std::string::npos)
                    fail("unterminated raw string literal", line, column);
                while (_pos < found + terminator.size())
                    advance();
            }

            void number()
            {
                while (not done())
                {
                    auto c = peek();
                    if ((c == '+' or c == '-')
                        and (_text[_pos - 1] == 'e' or _text[_pos - 1] == 'E'
                             or _text[_pos - 1] == 'p' or _text[_pos - 1] == 'P'))
                        advance();
                    else if (is_ident_char(c) or c == '.' or (c == '\'' and is_digit(peek(1))))
                        advance();
                    else
                        break;
                }
            }

            void directive()
            {
                while (not done() and peek() != '\n')
                {
                    if (peek() == '\\' and peek(1) == '\n') {
                        advance();
                    }
                    advance();
                }
            }

            token next()
            {
                skip_space_and_comments();
                token tok { token_kind::end_of_file, {}, _pos, _line, _column };
                if (done())
                    return tok;

                auto first = _pos;
                auto line = _line, column = _column;
                auto c = peek();

                if (c == '#' and _at_line_start) {
                    directive();
                    tok.kind = token_kind::directive;
                }
                else if (is_ident_start(c)) {
                    while (not done() and is_ident_char(peek()))
                        advance();
                    auto word = _text.substr(first, _pos - first);
                    if (peek() == '"' and is_raw_prefix(word)) {
                        raw_string(line, column);
                        tok.kind = token_kind::string_literal;
                    }
                    else if (peek() == '"' and is_literal_prefix(word)) {
                        quoted('"', line, column);
                        tok.kind = token_kind::string_literal;
                    }
                    else if (peek() == '\'' and is_literal_prefix(word)) {
                        quoted('\'', line, column);
                        tok.kind = token_kind::char_literal;
                    }
                    else {
                        tok.kind = token_kind::identifier;
                    }
                }
                else if (is_digit(c) or (c == '.' and is_digit(peek(1)))) {
                    number();
                    tok.kind = token_kind::number;
                }
                else if (c == '"') {
                    quoted('"', line, column);
                    tok.kind = token_kind::string_literal;
                }
                else if (c == '\'') {
                    quoted('\'', line, column);
                    tok.kind = token_kind::char_literal;
                }
                else if (c == ':' and peek(1) == ':') {
                    advance(); advance();
                    tok.kind = token_kind::punctuation;
                }
                else {
                    advance();
                    tok.kind = token_kind::punctuation;
                }

                tok.text = _text.substr(first, _pos - first);
                return tok;
            }

        private:
            const std::string& _name;
            const std::string& _text;
            std::size_t _pos = 0;
            std::uint32_t _line = 1;
            std::uint32_t _column = 1;
            bool _at_line_start = true;
        };
    }

    source_file tokenize(std::string name, std::string text)
    {
        source_file file { std::move(name), std::move(text), {} };
        scanner scan(file.name, file.text);
        while (true)
        {
            auto tok = scan.next();
            auto eof = tok.kind == token_kind::end_of_file;
            file.tokens.push_back(std::move(tok));
            if (eof)
                break;
        }
        return file;
    }

    SourceLocation location_of(const source_file& file, const token& tok)
    {
        SourceLocation where;
        where.set_file(file.name);
        where.set_line(tok.line);
        where.set_column(tok.column);
        return where;
    }

}}}
