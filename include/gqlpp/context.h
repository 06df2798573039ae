#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/context.h — Per-build state threaded through every builder
// ═══════════════════════════════════════════════════════════════════
//
//  A build runs in two phases:
//    1. builders register a skeleton for every named type they reach
//       and queue composite skeletons here;
//    2. populatePending() evaluates the queued field maps. Populating
//       one type may reach new types, which join the queue, so the pass
//       runs until the queue is drained.
//
//  A skeleton is owned by one context at a time. A context that meets
//  a skeleton left unpopulated by another build (cache hit on a shared
//  cache) adopts it; a context being destroyed detaches only what it
//  still owns. A failed build rolls the cache back to its checkpoint.
//
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "console.h"
#include "scalars.h"
#include "types.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gqlpp {

struct ConverterOptions {
    console::Level logLevel = console::Level::Warn;
    bool applyLogLevel = false;               // push logLevel to the console on construction
    std::shared_ptr<ScalarRegistry> scalars;  // DefaultScalarRegistry when null
};

struct BuildStats {
    std::size_t skeletons = 0;   // composite skeletons queued
    std::size_t populated = 0;   // field maps computed
};

class BuildContext {
public:
    explicit BuildContext(TypeCache& cache, ConverterOptions options = {});
    ~BuildContext();

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;
    BuildContext(BuildContext&&) = delete;
    BuildContext& operator=(BuildContext&&) = delete;

    TypeCache& cache() { return cache_; }
    const TypeCache& cache() const { return cache_; }
    ScalarRegistry& scalars() { return *scalars_; }
    const ConverterOptions& options() const { return options_; }

    // Phase 1: queue a freshly registered skeleton and take ownership.
    void defer(const PendingFields& fields);

    // Cache hit: take over an unpopulated skeleton so this build
    // populates it, whichever build registered it.
    void adopt(const PendingFields& fields);

    // Phase 2. Returns the number of field maps computed by this call.
    std::size_t populatePending();

    std::size_t pendingCount() const;
    const BuildStats& stats() const { return stats_; }

    // Called by skeleton thunks once their field map exists.
    void notePopulated(const PendingFields& fields, TypeKind kind, const std::string& name,
                       std::size_t fieldCount);

    // ── Rollback ──
    struct Checkpoint {
        std::size_t cacheSize = 0;
        std::size_t populated = 0;
    };

    Checkpoint checkpoint() const;

    // Drops every type registered since `mark` and forgets field maps
    // computed since `mark` for types that existed before it.
    void rollback(const Checkpoint& mark);

    // Runs `body`; on any exception rolls back to the state before it
    // and rethrows.
    template <typename Body>
    decltype(auto) transaction(Body&& body) {
        Checkpoint mark = checkpoint();
        try {
            return body();
        } catch (...) {
            rollback(mark);
            throw;
        }
    }

private:
    TypeCache& cache_;
    ConverterOptions options_;
    std::shared_ptr<ScalarRegistry> scalars_;
    std::vector<const PendingFields*> pending_;
    std::vector<const PendingFields*> populatedLog_;
    BuildStats stats_;

    void adoptOrphans();
};

} // namespace gqlpp
