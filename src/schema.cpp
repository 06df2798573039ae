// ═══════════════════════════════════════════════════════════════════
//  src/schema.cpp — Schema assembly
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/schema.h"
#include "gqlpp/console.h"
#include "gqlpp/scalars.h"

namespace gqlpp {

Schema Schema::build(const SchemaDefinition& definition, SchemaOptions options) {
    if (!definition.query) {
        throw InternalConsistencyError("A schema requires a query type");
    }

    Schema schema;
    schema.converter_ = std::make_unique<Converter>(options.cache, std::move(options.converter));
    Converter& converter = *schema.converter_;

    try {
        converter.context().transaction([&] {
            schema.query_ = &converter.fromObjectType(*definition.query);
            if (definition.mutation) {
                schema.mutation_ = &converter.fromObjectType(*definition.mutation);
            }
            if (definition.subscription) {
                schema.subscription_ = &converter.fromObjectType(*definition.subscription);
            }
            for (const auto& ref : definition.types) {
                convert::resolveNamedType(converter.context(), ref);
            }

            schema.directives_.reserve(definition.directives.size());
            for (const auto& directive : definition.directives) {
                schema.directives_.push_back(converter.fromDirective(directive));
            }

            if (options.populateEagerly) {
                converter.finalize();
            }
        });
    } catch (const std::exception& e) {
        // User callbacks may throw anything.
        console::error("schema: build failed:", e.what());
        throw;
    }

    console::info("schema: built with query type", schema.query_->name(), "and",
                  converter.typeMap().size(), "named type(s)");
    return schema;
}

const NamedType* Schema::getType(const std::string& name) const {
    if (const CacheEntry* entry = typeMap().get(name)) {
        return entry->implementation;
    }
    // Built-in scalars live outside every cache.
    for (auto scalar : {BuiltinScalar::String, BuiltinScalar::Int, BuiltinScalar::Float,
                        BuiltinScalar::Boolean, BuiltinScalar::ID}) {
        if (toString(scalar) == name) return &builtinScalar(scalar);
    }
    return nullptr;
}

const Directive* Schema::directive(const std::string& name) const {
    for (const auto& directive : directives_) {
        if (directive.name == name) return &directive;
    }
    return nullptr;
}

} // namespace gqlpp
