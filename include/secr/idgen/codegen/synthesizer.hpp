#pragma once

#include <secr/idgen/idgen.pb.h>

namespace secr { namespace idgen { namespace codegen {

    /// Produce the replacement namespace for an annotated one.
    ///
    /// The output opens with the parent directives, then declares in order:
    /// the `id_tag` / `id` pair, the `ids` companion namespace, the single
    /// hash/order/show instance, the column adapter when
    /// `config.derive_adapter()` is set, and finally `shape.body()` verbatim.
    ///
    /// The result depends on nothing but the two arguments.
    GeneratedDeclaration synthesize(const MarkerConfig& config, const TargetShape& shape);

}}}
