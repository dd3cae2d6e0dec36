#pragma once

// everything the declarations generated from [[secr::derive_id]] refer to,
// apart from the column adapter (see secr/idgen/sql/column.hpp)

#include <secr/idgen/config.hpp>
#include <secr/idgen/effect.hpp>
#include <secr/idgen/random.hpp>
#include <secr/idgen/tagged_uuid.hpp>
#include <secr/idgen/uuid_literal.hpp>

#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <future>
