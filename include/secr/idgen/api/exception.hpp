#pragma once

#include <secr/idgen/idgen.pb.h>

#include <exception>
#include <memory>

namespace secr { namespace idgen { namespace api {

    Exception* populate (Exception* emsg, const std::exception& e);
    Exception* populate (Exception* emsg, const std::exception_ptr& ep);

    /// Describe a failure. Generation errors fill in kind, location and (for
    /// literal_format_error) the offending literal; every failure fills in
    /// the message and the exception chain.
    Diagnostic& populate (Diagnostic& dmsg, const std::exception_ptr& ep);
    Diagnostic* populate (Diagnostic* dmsg, const std::exception_ptr& ep);

}}}
