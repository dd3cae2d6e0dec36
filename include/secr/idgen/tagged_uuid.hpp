#pragma once

#include <secr/idgen/config.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace secr { namespace idgen {

    /// A uuid that only compares, converts and stores as the entity named by
    /// `Tag`. `Tag` is never completed; it only distinguishes one id type
    /// from another.
    template<class Tag>
    struct tagged_uuid
    {
        using tag_type = Tag;
        using value_type = uuid;

        constexpr explicit tagged_uuid(const uuid& value)
        : _value(value)
        {}

        constexpr const uuid& value() const { return _value; }

    private:
        uuid _value;
    };

    template<class Tag>
    uuid unwrap(const tagged_uuid<Tag>& id)
    {
        return id.value();
    }

    /// Equality, total order, display and hash of an id type, all taken from
    /// the underlying uuid.
    template<class Id>
    struct hash_order_show
    {
        bool eqv(const Id& l, const Id& r) const {
            return l.value() == r.value();
        }

        /// -1, 0 or 1
        int compare(const Id& l, const Id& r) const {
            if (l.value() < r.value()) return -1;
            if (r.value() < l.value()) return 1;
            return 0;
        }

        std::string show(const Id& x) const {
            return boost::uuids::to_string(x.value());
        }

        std::size_t hash(const Id& x) const {
            return boost::uuids::hash_value(x.value());
        }
    };

    // every id type declares hash_order_show_of(const id*) next to its tag,
    // where argument dependent lookup finds it
    template<class Tag>
    auto instances_of(const tagged_uuid<Tag>& x)
    -> const hash_order_show<tagged_uuid<Tag>>&
    {
        return hash_order_show_of(std::addressof(x));
    }

    template<class Tag>
    bool operator==(const tagged_uuid<Tag>& l, const tagged_uuid<Tag>& r)
    {
        return instances_of(l).eqv(l, r);
    }

    template<class Tag>
    bool operator!=(const tagged_uuid<Tag>& l, const tagged_uuid<Tag>& r)
    {
        return not instances_of(l).eqv(l, r);
    }

    template<class Tag>
    bool operator<(const tagged_uuid<Tag>& l, const tagged_uuid<Tag>& r)
    {
        return instances_of(l).compare(l, r) < 0;
    }

    template<class Tag>
    bool operator<=(const tagged_uuid<Tag>& l, const tagged_uuid<Tag>& r)
    {
        return instances_of(l).compare(l, r) <= 0;
    }

    template<class Tag>
    bool operator>(const tagged_uuid<Tag>& l, const tagged_uuid<Tag>& r)
    {
        return instances_of(l).compare(l, r) > 0;
    }

    template<class Tag>
    bool operator>=(const tagged_uuid<Tag>& l, const tagged_uuid<Tag>& r)
    {
        return instances_of(l).compare(l, r) >= 0;
    }

    template<class Tag>
    std::string to_string(const tagged_uuid<Tag>& x)
    {
        return instances_of(x).show(x);
    }

    template<class Tag>
    std::ostream& operator<<(std::ostream& os, const tagged_uuid<Tag>& x)
    {
        return os << instances_of(x).show(x);
    }

    /// for boost::hash
    template<class Tag>
    std::size_t hash_value(const tagged_uuid<Tag>& x)
    {
        return instances_of(x).hash(x);
    }

}}

namespace std {

    template<class Tag>
    struct hash<::secr::idgen::tagged_uuid<Tag>>
    {
        std::size_t operator()(const ::secr::idgen::tagged_uuid<Tag>& x) const
        {
            return ::secr::idgen::hash_value(x);
        }
    };

}
