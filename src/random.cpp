#include <secr/idgen/random.hpp>
#include <boost/uuid/random_generator.hpp>

namespace secr { namespace idgen {

    uuid generate_random_uuid()
    {
        thread_local boost::uuids::random_generator generator;
        return generator();
    }

}}
