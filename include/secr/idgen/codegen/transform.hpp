#pragma once

#include <secr/idgen/codegen/lexer.hpp>
#include <cstddef>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    struct transform_result
    {
        std::string text;

        /// number of annotated namespaces replaced
        std::size_t declarations = 0;

        /// number of ids::literal call sites folded
        std::size_t literals = 0;
    };

    /// Expand every [[secr::derive_id]] namespace and fold every
    /// `ids::literal("...")` call site of `file`. Text outside those
    /// constructs is copied byte for byte.
    ///
    /// @throws config_error, shape_error or literal_format_error on the first
    ///         failure; nothing is produced in that case
    transform_result transform(const source_file& file);

    /// tokenize and transform
    transform_result transform(std::string name, std::string text);

}}}
