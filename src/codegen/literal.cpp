#include <secr/idgen/codegen/literal.hpp>
#include <secr/idgen/codegen/exception.hpp>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/uuid/string_generator.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace secr { namespace idgen { namespace codegen {

    const char* const uuid_grammar =
    "32 hexadecimal digits, either undivided or grouped 8-4-4-4-12 by dashes,"
    " optionally enclosed in braces (e.g. 123e4567-e89b-12d3-a456-426614174000)";

    uuid validate_literal(const std::string& text, const SourceLocation& where)
    {
        try {
            return boost::uuids::string_generator()(text);
        }
        catch(const std::runtime_error&)
        {
            auto message = boost::format("invalid uuid literal \"%1%\": expected %2%")
            % text
            % uuid_grammar;
            throw literal_format_error(message.str(), text, where);
        }
    }

    std::string uuid_constant(const uuid& value)
    {
        std::ostringstream ss;
        ss << "::boost::uuids::uuid{{";
        auto sep = "";
        for (auto byte : value)
        {
            ss << sep << "0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<unsigned>(byte);
            sep = ", ";
        }
        ss << "}}";
        return ss.str();
    }

    namespace {

        int hex_value(char c)
        {
            if (c >= '0' and c <= '9') return c - '0';
            if (c >= 'a' and c <= 'f') return c - 'a' + 10;
            if (c >= 'A' and c <= 'F') return c - 'A' + 10;
            return -1;
        }

        bool is_octal(char c) { return c >= '0' and c <= '7'; }

        [[noreturn]] void bad_escape(const std::string& why,
                                     const std::string& chars,
                                     const std::string& spelling,
                                     const SourceLocation& where)
        {
            throw literal_format_error(why + " in uuid literal " + spelling, chars, where);
        }

        std::string decode_escapes(const std::string& chars,
                                   const std::string& spelling,
                                   const SourceLocation& where)
        {
            auto fail = [&](const std::string& why) {
                bad_escape(why, chars, spelling, where);
            };

            std::string out;
            for (std::size_t i = 0 ; i < chars.size() ; ++i)
            {
                char c = chars[i];
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                if (++i == chars.size())
                    bad_escape("incomplete escape sequence", chars, spelling, where);

                c = chars[i];
                switch (c)
                {
                    case '\'': case '"': case '?': case '\\':
                        out.push_back(c);
                        break;
                    case 'a': out.push_back('\a'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'v': out.push_back('\v'); break;

                    case 'x':
                    {
                        unsigned value = 0;
                        std::size_t digits = 0;
                        while (i + 1 < chars.size() and hex_value(chars[i + 1]) >= 0)
                        {
                            value = value * 16 + static_cast<unsigned>(hex_value(chars[++i]));
                            if (value > 0xff)
                                fail("hexadecimal escape sequence out of range");
                            ++digits;
                        }
                        if (digits == 0)
                            fail("\\x used with no following hex digits");
                        out.push_back(static_cast<char>(value));
                        break;
                    }

                    case 'u': case 'U':
                        fail("universal character name");
                        break;

                    default:
                    {
                        if (not is_octal(c))
                            fail(std::string("unknown escape sequence \\") + c);
                        unsigned value = static_cast<unsigned>(c - '0');
                        for (int n = 1 ; n < 3 and i + 1 < chars.size() and is_octal(chars[i + 1]) ; ++n)
                            value = value * 8 + static_cast<unsigned>(chars[++i] - '0');
                        if (value > 0xff)
                            fail("octal escape sequence out of range");
                        out.push_back(static_cast<char>(value));
                        break;
                    }
                }
            }
            return out;
        }
    }

    boost::optional<std::string> narrow_string_value(const source_file& file, const token& tok)
    {
        auto& t = tok.text;
        if (tok.kind != token_kind::string_literal)
            return boost::none;

        auto quote = t.find('"');
        auto prefix = t.substr(0, quote);

        if (prefix == "R" or prefix == "u8R")
        {
            // R"delimiter( chars )delimiter"
            auto open = t.find('(', quote);
            auto delimiter = open - quote - 1;
            auto close = t.size() - 2 - delimiter;
            return t.substr(open + 1, close - open - 1);
        }

        if (not (prefix.empty() or prefix == "u8"))
            return boost::none;

        return decode_escapes(t.substr(quote + 1, t.size() - quote - 2), t, location_of(file, tok));
    }

    bool is_literal_call(const source_file& file, std::size_t i)
    {
        return file.at(i).is_ident("ids")
        and file.at(i + 1).is_punct("::")
        and file.at(i + 2).is_ident("literal")
        and file.at(i + 3).is_punct("(");
    }

    literal_call validate_literal_call(const source_file& file, std::size_t i)
    {
        auto first = i + 2;
        auto& open = file.at(i + 3);
        auto where = location_of(file, file.at(i + 4));

        std::string contents;
        auto t = i + 4;
        for ( ; file.at(t).kind == token_kind::string_literal ; ++t)
        {
            auto value = narrow_string_value(file, file.at(t));
            if (not value)
                break;
            contents += *value;
        }

        if (t == i + 4 or not file.at(t).is_punct(")"))
        {
            // report whatever was written between the parentheses
            int depth = 1;
            for ( ; file.at(t).kind != token_kind::end_of_file ; ++t)
            {
                if (file.at(t).is_punct("(")) ++depth;
                else if (file.at(t).is_punct(")") and --depth == 0) break;
            }
            auto written = file.slice(open.end_offset(), file.at(t).offset);
            throw literal_format_error("ids::literal requires a narrow string literal argument, found: "
                                       + written,
                                       written,
                                       where);
        }

        auto value = validate_literal(contents, where);
        BOOST_LOG_TRIVIAL(debug) << to_string(where) << ": folded uuid literal " << contents;
        return literal_call { first, t + 1, contents, value };
    }

    std::string render_literal_call(const literal_call& call)
    {
        return "apply(" + uuid_constant(call.value) + ")";
    }

}}}
