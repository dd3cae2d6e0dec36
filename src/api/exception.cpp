#include <secr/idgen/api/exception.hpp>
#include <secr/idgen/codegen/exception.hpp>
#include <valuelib/debug/demangle.hpp>

#include <regex>
#include <typeinfo>
#include <string>

namespace
{
    std::string remove_nested(std::string demangled)
    {
#if _LIBCPP_VERSION
        static const std::regex re("^std::__nested<(.*)>$");
#elif __GLIBCXX__
        static const std::regex re("^std::_Nested_exception<(.*)>$");
#endif
        std::smatch match;
        if (std::regex_match(demangled, match, re))
        {
            demangled = match[1].str();
        }
        return demangled;
    }
}

namespace secr { namespace idgen { namespace api {

    namespace {

        Exception* populate_unknown(Exception* emsg)
        {
            emsg->set_what("unknown error");
            emsg->set_name("unknown");
            return emsg;
        }
    }

    Exception* populate(Exception* emsg, const std::exception& e)
    {
        emsg->set_what(e.what());
        emsg->set_name(remove_nested(value::debug::demangle(typeid(e))));
        try {
            std::rethrow_if_nested(e);
        }
        catch(const std::exception& e)
        {
            populate(emsg->mutable_nested(), e);
        }
        catch(...) {
            populate_unknown(emsg->mutable_nested());
        }
        return emsg;
    }

    Exception* populate(Exception* emsg, const std::exception_ptr& ep)
    {
        try {
            std::rethrow_exception(ep);
        }
        catch(const std::exception& e)
        {
            populate(emsg, e);
        }
        catch(...)
        {
            populate_unknown(emsg);
        }
        return emsg;
    }

    Diagnostic* populate(Diagnostic* dmsg, const std::exception_ptr& ep)
    {
        populate(dmsg->mutable_exception(), ep);
        try {
            std::rethrow_exception(ep);
        }
        catch(const codegen::literal_format_error& e)
        {
            dmsg->set_kind(codegen::kind_name(e.errc()));
            dmsg->set_message(e.detail());
            *dmsg->mutable_location() = e.where();
            dmsg->set_literal(e.literal());
        }
        catch(const codegen::generation_error& e)
        {
            dmsg->set_kind(codegen::kind_name(e.errc()));
            dmsg->set_message(e.detail());
            *dmsg->mutable_location() = e.where();
        }
        catch(const std::exception& e)
        {
            dmsg->set_kind("InternalError");
            dmsg->set_message(e.what());
        }
        catch(...)
        {
            dmsg->set_kind("InternalError");
            dmsg->set_message("unknown error");
        }
        return dmsg;
    }

    Diagnostic& populate(Diagnostic& dmsg, const std::exception_ptr& ep)
    {
        return *populate(std::addressof(dmsg), ep);
    }

}}}
