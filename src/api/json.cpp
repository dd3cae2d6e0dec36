#include <secr/idgen/api/json.hpp>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/type_resolver.h>
#include <google/protobuf/util/type_resolver_util.h>

#include <memory>
#include <stdexcept>

namespace secr { namespace idgen { namespace api {

    std::string as_json(const google::protobuf::Message& msg,
                        google::protobuf::util::JsonPrintOptions opts)
    {
        namespace pb = google::protobuf;
        namespace pbu = google::protobuf::util;

        auto buffer = msg.SerializeAsString();
        std::string result;

        auto resolver = std::unique_ptr<pbu::TypeResolver> {
            pbu::NewTypeResolverForDescriptorPool("type.googleapis.com",
                                                  pb::DescriptorPool::generated_pool())
        };

        auto status = pbu::BinaryToJsonString(resolver.get(),
                                              "type.googleapis.com/" + msg.GetDescriptor()->full_name(),
                                              buffer,
                                              std::addressof(result),
                                              opts);
        if (!status.ok())
        {
            throw std::runtime_error(status.ToString());
        }
        return result;
    }

    std::string as_json(const google::protobuf::Message* msg,
                        google::protobuf::util::JsonPrintOptions opts)
    {
        return as_json(*msg, opts);
    }

}}}
