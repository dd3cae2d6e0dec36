#include <secr/idgen/codegen/marker_config.hpp>
#include <secr/idgen/codegen/exception.hpp>
#include <secr/idgen/config.hpp>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <algorithm>
#include <memory>
#include <vector>

namespace secr { namespace idgen { namespace codegen {

    namespace {

        /// one past the `]` closing the attribute list opened at `i`,
        /// or none when the file ends first
        boost::optional<std::size_t> attribute_end(const source_file& file, std::size_t i)
        {
            int depth = 0;
            for (auto t = i ; t < file.tokens.size() ; ++t)
            {
                auto& tok = file.tokens[t];
                if (tok.kind == token_kind::end_of_file)
                    break;
                if (tok.is_punct("[") or tok.is_punct("("))
                    ++depth;
                else if (tok.is_punct("]") or tok.is_punct(")"))
                {
                    if (--depth == 0)
                        return t + 1;
                }
            }
            return boost::none;
        }

        bool is_marker_name_at(const source_file& file, std::size_t t)
        {
            return file.at(t).is_ident(marker_scope)
            and file.at(t + 1).is_punct("::")
            and file.at(t + 2).is_ident(marker_name);
        }

        [[noreturn]] void unexpected_pattern(const source_file& file, std::size_t first, std::size_t last)
        {
            auto& head = file.at(first);
            auto& tail = file.at(last - 1);
            auto text = file.slice(head.offset, std::max(tail.end_offset(), head.end_offset()));
            throw config_error((boost::format("unexpected annotation pattern: %1%") % text).str(),
                               location_of(file, head));
        }

        boost::optional<bool> boolean_literal(const token& tok)
        {
            if (tok.is_ident("true"))
                return true;
            if (tok.is_ident("false"))
                return false;
            return boost::none;
        }
    }

    bool is_attribute_start(const source_file& file, std::size_t i)
    {
        return file.at(i).is_punct("[") and file.at(i + 1).is_punct("[");
    }

    bool names_marker(const source_file& file, std::size_t i)
    {
        if (not is_attribute_start(file, i))
            return false;

        auto end = attribute_end(file, i);
        auto last = end ? *end : file.tokens.size() - 1;
        for (auto t = i + 2 ; t < last ; ++t)
        {
            if (is_marker_name_at(file, t))
                return true;
        }
        return false;
    }

    parsed_marker parse_marker(const source_file& file, std::size_t first)
    {
        auto end = attribute_end(file, first);
        if (not end)
            unexpected_pattern(file, first, file.tokens.size() - 1);

        // the marker must be the only attribute in its list
        auto t = first + 2;
        if (not is_marker_name_at(file, t))
            unexpected_pattern(file, first, *end);
        t += 3;

        parsed_marker result { MarkerConfig(), first, *end };

        if (file.at(t).is_punct("("))
        {
            std::vector<const token*> args;
            auto close = t + 1;
            int depth = 1;
            for ( ; close < *end ; ++close)
            {
                auto& tok = file.tokens[close];
                if (tok.is_punct("(")) ++depth;
                else if (tok.is_punct(")") and --depth == 0) break;
                args.push_back(std::addressof(tok));
            }
            if (close >= *end)
                unexpected_pattern(file, first, *end);

            if (args.size() == 1 and boolean_literal(*args[0]))
            {
                result.config.set_derive_adapter(*boolean_literal(*args[0]));
            }
            else if (args.size() == 3
                     and args[0]->is_ident(derive_adapter_parameter)
                     and args[1]->is_punct("=")
                     and boolean_literal(*args[2]))
            {
                result.config.set_derive_adapter(*boolean_literal(*args[2]));
            }
            else if (not args.empty())
            {
                unexpected_pattern(file, first, *end);
            }
            t = close + 1;
        }

        if (not (file.at(t).is_punct("]") and file.at(t + 1).is_punct("]") and t + 2 == *end))
            unexpected_pattern(file, first, *end);

        return result;
    }

    MarkerConfig parse_marker_config(const std::string& invocation)
    {
        auto file = tokenize("<marker>", invocation);
        if (not names_marker(file, 0))
        {
            throw config_error("unexpected annotation pattern: " + invocation,
                               location_of(file, file.at(0)));
        }
        auto marker = parse_marker(file, 0);
        if (not file.at(marker.last).is(token_kind::end_of_file, ""))
            unexpected_pattern(file, 0, file.tokens.size() - 1);
        return marker.config;
    }

}}}
