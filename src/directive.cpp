// ═══════════════════════════════════════════════════════════════════
//  src/directive.cpp — Directive builder
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/converter.h"

namespace gqlpp::convert {

Directive fromDirective(BuildContext& ctx, const DirectiveDefinition& definition) {
    if (definition.name.empty()) {
        throw InternalConsistencyError("Directive definition has no name");
    }

    Directive directive;
    directive.name = definition.name;
    directive.locations = definition.locations;
    directive.args = fromArguments(ctx, definition.arguments, "@" + definition.name);
    directive.description = definition.description;

    console::debug("converter: directive", "@" + definition.name, "on",
                   nlohmann::json(definition.locations).dump());
    return directive;
}

} // namespace gqlpp::convert
