// ═══════════════════════════════════════════════════════════════════
//  src/context.cpp — Build context, the populate pass and rollback
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/context.h"

#include <algorithm>
#include <unordered_set>

namespace gqlpp {

BuildContext::BuildContext(TypeCache& cache, ConverterOptions options)
    : cache_(cache), options_(std::move(options)), scalars_(options_.scalars) {
    if (!scalars_) {
        scalars_ = std::make_shared<DefaultScalarRegistry>();
    }
    if (options_.applyLogLevel) {
        console::setLevel(options_.logLevel);
        console::debug("converter: log level", options_.logLevel);
    }
}

BuildContext::~BuildContext() {
    std::size_t detached = 0;
    for (const PendingFields* fields : pending_) {
        if (fields->context() == this && !fields->populated()) {
            fields->detach();
            ++detached;
        }
    }
    if (detached > 0) {
        console::warn("converter: build context destroyed with", detached,
                      "unpopulated type(s); a later build on the same cache adopts them");
    }
}

void BuildContext::defer(const PendingFields& fields) {
    fields.attach(*this);
    pending_.push_back(&fields);
    ++stats_.skeletons;
}

void BuildContext::adopt(const PendingFields& fields) {
    if (fields.populated() || fields.context() == this) return;
    fields.attach(*this);
    pending_.push_back(&fields);
    console::debug("converter: adopted a skeleton left by another build");
}

void BuildContext::adoptOrphans() {
    for (const auto& slot : cache_) {
        const auto* fields = dynamic_cast<const PendingFields*>(slot.entry.implementation);
        if (fields && !fields->populated() && !fields->context()) {
            adopt(*fields);
        }
    }
}

std::size_t BuildContext::populatePending() {
    std::size_t before = stats_.populated;

    // Skeletons reachable only through types populated by an earlier,
    // since destroyed, build.
    adoptOrphans();

    // pending_ grows while we walk it; index, don't iterate.
    for (std::size_t i = 0; i < pending_.size(); ++i) {
        const PendingFields* fields = pending_[i];
        if (fields->populated()) continue;
        if (!fields->context()) fields->attach(*this);
        fields->populate();
    }
    pending_.clear();

    std::size_t count = stats_.populated - before;
    console::info("converter: populated", count, "type(s),", cache_.size(), "cached");
    return count;
}

std::size_t BuildContext::pendingCount() const {
    return static_cast<std::size_t>(std::count_if(
        pending_.begin(), pending_.end(),
        [](const PendingFields* fields) { return !fields->populated(); }));
}

void BuildContext::notePopulated(const PendingFields& fields, TypeKind kind,
                                 const std::string& name, std::size_t fieldCount) {
    ++stats_.populated;
    populatedLog_.push_back(&fields);
    console::debug("converter: populated", toString(kind), name, "with", fieldCount, "field(s)");
}

BuildContext::Checkpoint BuildContext::checkpoint() const {
    return Checkpoint{cache_.size(), populatedLog_.size()};
}

void BuildContext::rollback(const Checkpoint& mark) {
    std::unordered_set<const PendingFields*> dropped;
    for (const NamedType* type : cache_.typesAfter(mark.cacheSize)) {
        if (const auto* fields = dynamic_cast<const PendingFields*>(type)) {
            dropped.insert(fields);
        }
    }

    // Older types populated since the mark may point at dropped ones.
    for (std::size_t i = mark.populated; i < populatedLog_.size(); ++i) {
        const PendingFields* fields = populatedLog_[i];
        if (dropped.count(fields)) continue;
        fields->reset();
        fields->attach(*this);
        if (std::find(pending_.begin(), pending_.end(), fields) == pending_.end()) {
            pending_.push_back(fields);
        }
    }
    populatedLog_.resize(std::min(populatedLog_.size(), mark.populated));

    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&dropped](const PendingFields* fields) {
                                      return dropped.count(fields) != 0;
                                  }),
                   pending_.end());

    std::size_t removed = cache_.size() - std::min(cache_.size(), mark.cacheSize);
    cache_.truncate(mark.cacheSize);
    if (removed > 0) {
        console::warn("converter: rolled back", removed, "type(s) registered by a failed build");
    }
}

} // namespace gqlpp
