// ═══════════════════════════════════════════════════════════════════
//  src/composite.cpp — Object, interface and input-object builders
// ═══════════════════════════════════════════════════════════════════
//
//  Each builder registers a skeleton in the cache before anything else
//  can reach the same name, queues it on the context, and only then
//  resolves implemented interfaces. Field maps are thunks over the
//  definition; they run in the populate pass or on first access, with
//  whichever context owns the skeleton at that point. A cache hit on
//  an unpopulated skeleton hands it to the calling context.
//
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/converter.h"

#include <typeindex>

namespace gqlpp::convert {

namespace {

void expectKind(const TypeDefinition& definition, TypeDefinition::Kind expected) {
    if (definition.name.empty()) {
        throw InternalConsistencyError("Type definition has no name");
    }
    if (definition.kind != expected) {
        throw WrongKindForBuilder(definition.name, toString(definition.kind), toString(expected));
    }
}

FieldMap buildFields(BuildContext& ctx, const PendingFields& self,
                     const TypeDefinition& definition, TypeKind kind) {
    FieldMap fields;
    fields.reserve(definition.fields.size());
    for (const auto& field : definition.fields) {
        if (field.name.empty()) {
            throw InternalConsistencyError("A field of '" + definition.name + "' has no name");
        }
        fields.emplace_back(field.name, fromField(ctx, field));
    }
    ctx.notePopulated(self, kind, definition.name, fields.size());
    return fields;
}

InputFieldMap buildInputFields(BuildContext& ctx, const PendingFields& self,
                               const TypeDefinition& definition) {
    InputFieldMap fields;
    fields.reserve(definition.fields.size());
    for (const auto& field : definition.fields) {
        if (field.name.empty()) {
            throw InternalConsistencyError("A field of '" + definition.name + "' has no name");
        }
        fields.emplace_back(field.name, fromInputField(ctx, field));
    }
    ctx.notePopulated(self, TypeKind::InputObject, definition.name, fields.size());
    return fields;
}

std::vector<const InterfaceType*> buildInterfaces(BuildContext& ctx,
                                                  const TypeDefinition& definition) {
    std::vector<const InterfaceType*> interfaces;
    interfaces.reserve(definition.interfaces.size());
    for (const TypeDefinition* iface : definition.interfaces) {
        if (!iface) {
            throw InternalConsistencyError("'" + definition.name + "' implements a null interface");
        }
        interfaces.push_back(&fromInterface(ctx, *iface));
    }
    return interfaces;
}

ObjectType::IsTypeOf isTypeOfOrigin(const TypeDefinition& definition) {
    if (!definition.origin) return nullptr;
    std::type_index origin = *definition.origin;
    return [origin](const std::any& value) {
        return value.has_value() && std::type_index(value.type()) == origin;
    };
}

} // namespace

const ObjectType& fromObjectType(BuildContext& ctx, const TypeDefinition& definition) {
    expectKind(definition, TypeDefinition::Kind::Object);

    // Don't rebuild known types
    if (auto* existing = ctx.cache().getAs<ObjectType>(definition.name)) {
        ctx.adopt(*existing);
        return *existing;
    }

    auto skeleton = std::make_unique<ObjectType>(
        definition.name, definition.description,
        [&definition](BuildContext& ctx, const PendingFields& self) {
            return buildFields(ctx, self, definition, TypeKind::Object);
        },
        isTypeOfOrigin(definition));
    ObjectType* object = skeleton.get();

    ctx.cache().put(definition.name, &definition, std::move(skeleton));
    ctx.defer(*object);
    object->setInterfaces(buildInterfaces(ctx, definition));
    return *object;
}

const InterfaceType& fromInterface(BuildContext& ctx, const TypeDefinition& definition) {
    expectKind(definition, TypeDefinition::Kind::Interface);

    if (auto* existing = ctx.cache().getAs<InterfaceType>(definition.name)) {
        ctx.adopt(*existing);
        return *existing;
    }

    auto skeleton = std::make_unique<InterfaceType>(
        definition.name, definition.description,
        [&definition](BuildContext& ctx, const PendingFields& self) {
            return buildFields(ctx, self, definition, TypeKind::Interface);
        });
    InterfaceType* iface = skeleton.get();

    ctx.cache().put(definition.name, &definition, std::move(skeleton));
    ctx.defer(*iface);
    iface->setInterfaces(buildInterfaces(ctx, definition));
    return *iface;
}

const InputObjectType& fromInputObjectType(BuildContext& ctx, const TypeDefinition& definition) {
    expectKind(definition, TypeDefinition::Kind::Input);

    if (auto* existing = ctx.cache().getAs<InputObjectType>(definition.name)) {
        ctx.adopt(*existing);
        return *existing;
    }

    auto skeleton = std::make_unique<InputObjectType>(
        definition.name, definition.description,
        [&definition](BuildContext& ctx, const PendingFields& self) {
            return buildInputFields(ctx, self, definition);
        });
    InputObjectType* input = skeleton.get();

    ctx.cache().put(definition.name, &definition, std::move(skeleton));
    ctx.defer(*input);
    return *input;
}

} // namespace gqlpp::convert
