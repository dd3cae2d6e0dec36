#include <secr/idgen/codegen/transform.hpp>
#include <secr/idgen/codegen/exception.hpp>
#include <secr/idgen/codegen/literal.hpp>
#include <secr/idgen/codegen/marker_config.hpp>
#include <secr/idgen/codegen/shape.hpp>
#include <secr/idgen/codegen/synthesizer.hpp>

#include <boost/log/trivial.hpp>

namespace secr { namespace idgen { namespace codegen {

    namespace {

        struct transformer
        {
            transformer(const source_file& file, transform_result& result)
            : _file(file), _result(result)
            {}

            /// rewrite the tokens [t, stop) whose text spans [offset, end_offset)
            std::string run(std::size_t t, std::size_t stop,
                            std::size_t offset, std::size_t end_offset)
            {
                std::string out;
                auto copied = offset;

                while (t < stop and _file.tokens[t].kind != token_kind::end_of_file)
                {
                    auto& tok = _file.tokens[t];

                    if (is_literal_call(_file, t))
                    {
                        auto call = validate_literal_call(_file, t);
                        out += _file.slice(copied, _file.tokens[call.first].offset);
                        out += render_literal_call(call);
                        copied = _file.tokens[call.last - 1].end_offset();
                        ++_result.literals;
                        t = call.last;
                        continue;
                    }

                    std::size_t marker_at;
                    if (tok.is_ident("namespace") and names_marker(_file, t + 1))
                        marker_at = t + 1;
                    else if (names_marker(_file, t))
                        marker_at = t;
                    else {
                        ++t;
                        continue;
                    }

                    auto marker = parse_marker(_file, marker_at);
                    auto validated = validate_shape(_file, t, marker);
                    auto& close = _file.tokens[validated.body_close];

                    // markers and literal call sites nested in the body are
                    // expanded before the body is handed over
                    validated.shape.set_body(run(validated.body_first, validated.body_close,
                                                 validated.body_offset, close.offset));

                    auto generated = synthesize(marker.config, validated.shape);
                    BOOST_LOG_TRIVIAL(debug)
                    << to_string(validated.shape.location())
                    << ": expanded [[secr::derive_id]] on namespace " << generated.name()
                    << (generated.has_adapter() ? " with column adapter" : "");

                    out += _file.slice(copied, tok.offset);
                    out += generated.text();
                    copied = close.end_offset();
                    ++_result.declarations;
                    t = validated.last;
                }

                out += _file.slice(copied, end_offset);
                return out;
            }

        private:
            const source_file& _file;
            transform_result& _result;
        };
    }

    transform_result transform(const source_file& file)
    {
        transform_result result;
        transformer xf(file, result);
        result.text = xf.run(0, file.tokens.size(), 0, file.text.size());
        return result;
    }

    transform_result transform(std::string name, std::string text)
    {
        return transform(tokenize(std::move(name), std::move(text)));
    }

}}}
