#pragma once

#include <secr/idgen/codegen/lexer.hpp>
#include <secr/idgen/codegen/marker_config.hpp>
#include <secr/idgen/idgen.pb.h>
#include <cstddef>

namespace secr { namespace idgen { namespace codegen {

    /// A TargetShape together with where its pieces sit in the source file.
    struct validated_shape
    {
        TargetShape shape;

        /// first token of the declaration: `namespace` or the marker's `[`
        std::size_t first;

        /// first token of the body proper, after the parent directives
        std::size_t body_first;

        /// the closing `}`
        std::size_t body_close;

        /// byte offset where the verbatim body text starts
        std::size_t body_offset;

        /// one past the closing `}`
        std::size_t last;
    };

    /// Confirm that `marker` is applied to a named namespace definition,
    /// written either as `namespace [[marker]] name { ... }` (with `first`
    /// indexing the `namespace` keyword) or as `[[marker]] namespace name { ... }`
    /// (with `first` indexing the marker).
    ///
    /// Leading `using namespace X;` directives of the body become the parents,
    /// the remainder is taken verbatim as the body.
    ///
    /// @throws shape_error for any other shape
    validated_shape validate_shape(const source_file& file,
                                   std::size_t first,
                                   const parsed_marker& marker);

}}}
