#pragma once

#include <secr/idgen/config.hpp>
#include <secr/idgen/codegen/errors.hpp>
#include <secr/idgen/idgen.pb.h>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    /// base of every build-aborting failure raised while generating code
	struct generation_error : system_error
	{
        generation_error(generation_errc code, const std::string& detail, SourceLocation where)
        : system_error(make_error_code(code), detail)
        , _detail(detail)
        , _where(std::move(where))
        {}

        generation_errc errc() const {
            return static_cast<generation_errc>(code().value());
        }

        /// the message without the category text appended by system_error
        const std::string& detail() const { return _detail; }

        const SourceLocation& where() const { return _where; }

    private:
        std::string _detail;
        SourceLocation _where;
	};

	struct config_error : generation_error
	{
        config_error(const std::string& detail, SourceLocation where)
        : generation_error(generation_errc::config_error, detail, std::move(where))
        {}
	};

	struct shape_error : generation_error
	{
        shape_error(const std::string& detail, SourceLocation where)
        : generation_error(generation_errc::shape_error, detail, std::move(where))
        {}
	};

	struct literal_format_error : generation_error
	{
        literal_format_error(const std::string& detail, std::string literal, SourceLocation where)
        : generation_error(generation_errc::literal_format_error, detail, std::move(where))
        , _literal(std::move(literal))
        {}

        /// the offending text, as written between the quotes
        const std::string& literal() const { return _literal; }

    private:
        std::string _literal;
	};

	struct lexical_error : generation_error
	{
        lexical_error(const std::string& detail, SourceLocation where)
        : generation_error(generation_errc::lexical_error, detail, std::move(where))
        {}
	};

    /// "file:line:column" for use in messages
    std::string to_string(const SourceLocation& where);

}}}
