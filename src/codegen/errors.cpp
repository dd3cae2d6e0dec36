#include <secr/idgen/codegen/errors.hpp>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    namespace {

        struct _generation_error_category : error_category
        {
            const char *     name() const noexcept override {
                return "secr::idgen::generation";
            }

            std::string message( int ev ) const override
            {
                switch (static_cast<generation_errc>(ev))
                {
                    case generation_errc::config_error:
                        return "unexpected annotation pattern";

                    case generation_errc::shape_error:
                        return "marker can only be applied to a named namespace";

                    case generation_errc::literal_format_error:
                        return "invalid uuid literal";

                    case generation_errc::lexical_error:
                        return "malformed source text";

                    default:
                        return "unknown error: " + std::to_string(ev);
                }
            }
        };
    }

    const error_category& generation_category()
    {
        static const _generation_error_category _ {};
        return _;
    }

    error_code make_error_code(generation_errc code)
    {
        return error_code(static_cast<int>(code), generation_category());
    }

    error_condition make_error_condition(generation_errc code)
    {
        return error_condition(static_cast<int>(code), generation_category());
    }

    const char* kind_name(generation_errc code)
    {
        switch (code)
        {
            case generation_errc::config_error:
                return "ConfigError";
            case generation_errc::shape_error:
                return "ShapeError";
            case generation_errc::literal_format_error:
                return "LiteralFormatError";
            case generation_errc::lexical_error:
                return "LexicalError";
        }
        return "UnknownError";
    }

}}}
