#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/scalars.h — Scalar registry
// ═══════════════════════════════════════════════════════════════════
//
//  The converter never builds scalars itself; it asks a registry.
//  Built-in markers map to process-wide scalar instances that are not
//  entered in any cache. Custom scalars are memoized by name in the
//  cache of the build asking for them.
//
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "definitions.h"
#include "types.h"

namespace gqlpp {

// Shared built-in scalar (String, Int, Float, Boolean, ID).
const ScalarType& builtinScalar(BuiltinScalar scalar);

class ScalarRegistry {
public:
    virtual ~ScalarRegistry() = default;
    virtual const ScalarType& resolve(const ScalarMarker& marker, TypeCache& cache) = 0;
};

class DefaultScalarRegistry : public ScalarRegistry {
public:
    const ScalarType& resolve(const ScalarMarker& marker, TypeCache& cache) override;
};

} // namespace gqlpp
