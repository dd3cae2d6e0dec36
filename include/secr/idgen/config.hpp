#pragma once
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/uuid/uuid.hpp>

namespace secr { namespace idgen {

    using error_code = boost::system::error_code;
    using error_condition = boost::system::error_condition;
    using error_category = boost::system::error_category;
    using system_error = boost::system::system_error;
    namespace errc = boost::system::errc;

    using uuid = boost::uuids::uuid;

    /// attribute namespace and name of the marker, as in [[secr::derive_id]]
    static constexpr const char* marker_scope = "secr";
    static constexpr const char* marker_name = "derive_id";

    /// the only named argument a marker accepts
    static constexpr const char* derive_adapter_parameter = "derive_adapter";

}}
