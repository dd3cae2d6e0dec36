#include <secr/idgen/codegen/exception.hpp>

#include <string>

namespace secr { namespace idgen { namespace codegen {

    std::string to_string(const SourceLocation& where)
    {
        return where.file() + ":" + std::to_string(where.line()) + ":" + std::to_string(where.column());
    }

}}}
