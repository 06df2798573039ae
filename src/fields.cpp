// ═══════════════════════════════════════════════════════════════════
//  src/fields.cpp — Field, input-field and argument materialization
// ═══════════════════════════════════════════════════════════════════

#include "gqlpp/converter.h"

namespace gqlpp::convert {

std::optional<JsonValue> fromDefaultValue(const DefaultValue& value) {
    switch (value.state()) {
        case DefaultValue::State::NotProvided: return std::nullopt;
        case DefaultValue::State::Null:        return JsonValue::null();
        case DefaultValue::State::Value:       return value.value();
    }
    throw InternalConsistencyError("Default value in an unknown state");
}

Argument fromArgument(BuildContext& ctx, const ArgumentDefinition& definition) {
    Argument argument;
    argument.type = &resolveType(ctx, definition.type);
    argument.defaultValue = fromDefaultValue(definition.defaultValue);
    argument.description = definition.description;
    return argument;
}

ArgumentMap fromArguments(BuildContext& ctx, const std::vector<ArgumentDefinition>& arguments,
                          const std::string& owner) {
    ArgumentMap result;
    result.reserve(arguments.size());
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        const auto& argument = arguments[i];
        if (argument.name.empty()) {
            throw InternalConsistencyError("Argument #" + std::to_string(i) + " of '" + owner +
                                           "' has no name");
        }
        result.emplace_back(argument.name, fromArgument(ctx, argument));
    }
    return result;
}

Field fromField(BuildContext& ctx, const FieldDefinition& definition) {
    Field field;
    field.type = &resolveType(ctx, definition.type);
    field.args = fromArguments(ctx, definition.arguments, definition.name);
    field.description = definition.description;
    field.deprecationReason = definition.deprecationReason;
    field.resolve = definition.resolver;

    // The resolver produces the event stream; each event is already the
    // field's value.
    if (definition.isSubscription) {
        field.subscribe = definition.resolver;
        field.resolve = [](const std::any& event, const JsonValue&, const ResolveInfo&) {
            return event;
        };
    }
    return field;
}

InputField fromInputField(BuildContext& ctx, const FieldDefinition& definition) {
    InputField field;
    field.type = &resolveType(ctx, definition.type);
    field.defaultValue = fromDefaultValue(definition.defaultValue);
    field.description = definition.description;
    return field;
}

} // namespace gqlpp::convert
