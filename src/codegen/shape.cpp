#include <secr/idgen/codegen/shape.hpp>
#include <secr/idgen/codegen/exception.hpp>

#include <boost/format.hpp>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    namespace {

        static const std::string only_named_namespaces =
        "[[secr::derive_id]] can only be applied to a named namespace";

        [[noreturn]] void reject(const source_file& file, const token& at, const std::string& reason)
        {
            throw shape_error(only_named_namespaces + ": " + reason, location_of(file, at));
        }

        std::string describe(const token& tok)
        {
            if (tok.kind == token_kind::end_of_file)
                return "end of file";
            return (boost::format("'%1%'") % tok.text).str();
        }

        std::size_t matching_brace(const source_file& file, std::size_t open)
        {
            int depth = 0;
            for (auto t = open ; t < file.tokens.size() ; ++t)
            {
                auto& tok = file.tokens[t];
                if (tok.is_punct("{"))
                    ++depth;
                else if (tok.is_punct("}") and --depth == 0)
                    return t;
            }
            reject(file, file.tokens[open], "unterminated namespace body");
        }

        /// parse `using namespace a::b;` at t, returning the index after `;`
        std::size_t using_directive(const source_file& file, std::size_t t, std::string& name)
        {
            if (not (file.at(t).is_ident("using") and file.at(t + 1).is_ident("namespace")))
                return t;

            auto u = t + 2;
            std::string qualified;
            while (file.at(u).kind == token_kind::identifier or file.at(u).is_punct("::"))
            {
                qualified += file.at(u).text;
                ++u;
            }
            if (qualified.empty() or qualified.back() == ':' or not file.at(u).is_punct(";"))
                return t;

            name = qualified;
            return u + 1;
        }
    }

    validated_shape validate_shape(const source_file& file,
                                   std::size_t first,
                                   const parsed_marker& marker)
    {
        auto& head = file.at(marker.first);
        std::size_t name_index;

        if (file.at(first).is_ident("namespace"))
        {
            if (marker.first != first + 1)
                reject(file, head, "the marker must directly follow the namespace keyword");
            if (first > 0 and file.at(first - 1).is_ident("inline"))
                reject(file, file.at(first - 1), "inline namespaces are not supported");
            name_index = marker.last;
        }
        else if (first == marker.first)
        {
            auto& next = file.at(marker.last);
            if (next.is_ident("inline"))
                reject(file, next, "inline namespaces are not supported");
            if (not next.is_ident("namespace"))
                reject(file, next, "found " + describe(next));
            name_index = marker.last + 1;
        }
        else
        {
            reject(file, head, "the marker is not attached to a declaration");
        }

        auto& name = file.at(name_index);
        if (is_attribute_start(file, name_index))
            reject(file, name, "exactly one marker and no other attribute may be applied");
        if (name.is_punct("{"))
            reject(file, name, "anonymous namespaces are not supported");
        if (name.kind != token_kind::identifier)
            reject(file, name, "expected a namespace name, found " + describe(name));

        auto& after_name = file.at(name_index + 1);
        if (after_name.is_punct("::"))
            reject(file, after_name, "nested namespace definitions are not supported");
        if (after_name.is_punct("="))
            reject(file, after_name, "namespace aliases are not supported");
        if (not after_name.is_punct("{"))
            reject(file, after_name, "expected '{', found " + describe(after_name));

        auto open = name_index + 1;
        auto close = matching_brace(file, open);

        validated_shape result;
        result.first = first;
        result.body_close = close;
        result.last = close + 1;
        result.shape.set_name(name.text);
        *result.shape.mutable_location() = location_of(file, head);

        auto t = open + 1;
        auto body_offset = file.tokens[open].end_offset();
        while (t < close)
        {
            std::string parent;
            auto next = using_directive(file, t, parent);
            if (next == t)
                break;
            result.shape.add_parents(parent);
            body_offset = file.tokens[next - 1].end_offset();
            t = next;
        }

        result.body_first = t;
        result.body_offset = body_offset;
        result.shape.set_body(file.slice(body_offset, file.tokens[close].offset));
        return result;
    }

}}}
