#pragma once
#include <secr/idgen/config.hpp>

namespace secr { namespace idgen { namespace codegen {


	enum class generation_errc
	{
		config_error = 1,
        shape_error,
        literal_format_error,
        lexical_error,
	};


    const error_category& generation_category();
    error_code make_error_code(generation_errc code);
    error_condition make_error_condition(generation_errc code);

    /// the diagnostic kind reported for a code, e.g. "ShapeError"
    const char* kind_name(generation_errc code);

}}}

namespace boost { namespace system {
    template<>
    struct is_error_code_enum<secr::idgen::codegen::generation_errc>
    : std::true_type {};

    template<>
    struct is_error_condition_enum<secr::idgen::codegen::generation_errc>
    : std::true_type {};
}}
