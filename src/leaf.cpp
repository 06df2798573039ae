// ═══════════════════════════════════════════════════════════════════
//  src/leaf.cpp — Enum and scalar builders
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/converter.h"

namespace gqlpp::convert {

const EnumType& fromEnum(BuildContext& ctx, const EnumDefinition& definition) {
    if (definition.name.empty()) {
        throw InternalConsistencyError("Enum definition has no name");
    }

    // Don't rebuild known types
    if (auto* existing = ctx.cache().getAs<EnumType>(definition.name)) {
        return *existing;
    }

    std::vector<EnumValue> values;
    values.reserve(definition.values.size());
    for (const auto& item : definition.values) {
        if (item.name.empty()) {
            throw InternalConsistencyError("Enum '" + definition.name + "' has an unnamed value");
        }
        values.push_back(EnumValue{item.name, item.value});
    }

    auto type = std::make_unique<EnumType>(definition.name, definition.description,
                                           std::move(values));
    return static_cast<const EnumType&>(
        ctx.cache().put(definition.name, &definition, std::move(type)));
}

const ScalarType& fromScalar(BuildContext& ctx, const ScalarMarker& marker) {
    return ctx.scalars().resolve(marker, ctx.cache());
}

} // namespace gqlpp::convert
