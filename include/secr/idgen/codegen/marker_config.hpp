#pragma once

#include <secr/idgen/codegen/lexer.hpp>
#include <secr/idgen/idgen.pb.h>
#include <cstddef>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    /// true when the tokens at `i` open an attribute list, i.e. `[` `[`
    bool is_attribute_start(const source_file& file, std::size_t i);

    /// true when the attribute list opened at `i` mentions secr::derive_id
    /// anywhere inside it
    bool names_marker(const source_file& file, std::size_t i);

    struct parsed_marker
    {
        MarkerConfig config;

        /// index of the first `[`
        std::size_t first;

        /// one past the closing `]]`
        std::size_t last;
    };

    /// Parse the marker whose attribute list opens at `first`.
    ///
    /// Accepted forms:
    ///   [[secr::derive_id]]
    ///   [[secr::derive_id()]]
    ///   [[secr::derive_id(true)]]
    ///   [[secr::derive_id(derive_adapter = false)]]
    ///
    /// @throws config_error for anything else
    parsed_marker parse_marker(const source_file& file, std::size_t first);

    /// Convenience wrapper for a marker held in a string of its own.
    MarkerConfig parse_marker_config(const std::string& invocation);

}}}
