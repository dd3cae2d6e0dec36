#pragma once

#include <secr/idgen/config.hpp>
#include <secr/idgen/effect.hpp>

namespace secr { namespace idgen {

    /// One draw from the calling thread's random generator.
    /// @throws boost::uuids::entropy_error
    uuid generate_random_uuid();

    /// A single deferred draw, performed when the effect is run.
    template<template<class...> class Effect>
    Effect<uuid> random_uuid()
    {
        return effect_traits<Effect>::delay(&generate_random_uuid);
    }

}}
