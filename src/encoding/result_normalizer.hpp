#pragma once

#include "core/value.hpp"

namespace runbox::encoding {

// Replaces every binary buffer in the tree with its data URI. Sequences and
// mappings are rebuilt with shape and order kept; scalars and opaque host
// objects come back unchanged. Idempotent.
Value NormalizeResult(const Value& value);
Value NormalizeResult(Value&& value);

}  // namespace runbox::encoding
