#include <secr/idgen/codegen/synthesizer.hpp>

#include <sstream>
#include <string>

namespace secr { namespace idgen { namespace codegen {

    namespace {

        static const std::string id_members =
        "\n"
        "    struct id_tag;\n"
        "\n"
        "    using id = ::secr::idgen::tagged_uuid<id_tag>;\n"
        "\n"
        "    namespace ids {\n"
        "\n"
        "        constexpr id apply(const ::boost::uuids::uuid& value)\n"
        "        {\n"
        "            return id(value);\n"
        "        }\n"
        "\n"
        "        // call sites are checked and folded into apply() by idgen; code\n"
        "        // that idgen does not process uses SECR_IDGEN_ID_LITERAL instead\n"
        "        template<::std::size_t N>\n"
        "        id literal(const char (&text)[N]) = delete;\n"
        "\n"
        "        template<template<class...> class Effect>\n"
        "        Effect<id> random()\n"
        "        {\n"
        "            return ::secr::idgen::effect_traits<Effect>::map(::secr::idgen::random_uuid<Effect>(), &apply);\n"
        "        }\n"
        "\n"
        "        namespace unsafe {\n"
        "\n"
        "            inline id random()\n"
        "            {\n"
        "                return ::secr::idgen::effect_traits<::std::future>::run(ids::random<::std::future>());\n"
        "            }\n"
        "\n"
        "        }\n"
        "\n"
        "    }\n"
        "\n"
        "    inline const ::secr::idgen::hash_order_show<id>& hash_order_show_of(const id*)\n"
        "    {\n"
        "        static const ::secr::idgen::hash_order_show<id> instances {};\n"
        "        return instances;\n"
        "    }\n";

        static const std::string adapter_member =
        "\n"
        "    inline const ::secr::idgen::sql::column_mapping<id>& column_mapping_of(const id*)\n"
        "    {\n"
        "        static const auto mapping = ::secr::idgen::sql::uuid_column()\n"
        "            .imap<id>(&ids::apply, &::secr::idgen::unwrap<id_tag>);\n"
        "        return mapping;\n"
        "    }\n";
    }

    GeneratedDeclaration synthesize(const MarkerConfig& config, const TargetShape& shape)
    {
        std::ostringstream os;
        os << "namespace " << shape.name() << " {\n";
        for (auto& parent : shape.parents()) {
            os << "    using namespace " << parent << ";\n";
        }
        os << id_members;
        if (config.derive_adapter()) {
            os << adapter_member;
        }
        os << shape.body() << "}";

        GeneratedDeclaration result;
        result.set_name(shape.name());
        result.set_text(os.str());
        result.set_has_adapter(config.derive_adapter());
        return result;
    }

}}}
