#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/json_utils.h — JSON values for defaults, enums and arguments
// ═══════════════════════════════════════════════════════════════════
//  Wraps nlohmann/json. Anything nlohmann::json can construct from
//  converts implicitly, e.g. DefaultValue::of(42).
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>
#include <type_traits>

namespace gqlpp {

// ─────────────────────────────────────────────
//  Concept: JsonSerializable
//  Any type T that nlohmann::json can construct from.
// ─────────────────────────────────────────────
template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

// ─────────────────────────────────────────────
//  class JsonValue
//  A JSON document with value semantics. An explicit JSON null is a
//  real value here; "no value at all" is modelled by the caller
//  (std::optional<JsonValue> or DefaultValue).
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nullptr) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    template <JsonSerializable T>
        requires(!std::is_same_v<std::decay_t<T>, JsonValue>)
    JsonValue(const T& value) : data_(nlohmann::json(value)) {}

    JsonValue(std::initializer_list<nlohmann::json::basic_json::value_type> init)
        : data_(nlohmann::json(init)) {}

    static JsonValue null() { return JsonValue(nlohmann::json(nullptr)); }
    static JsonValue object() { return JsonValue(nlohmann::json::object()); }

    // ── Member access; missing keys read as null ──
    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return null();
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    template <typename T>
    T get(const std::string& key, const T& fallback) const {
        if (!data_.is_object() || !data_.contains(key)) return fallback;
        const auto& v = data_.at(key);
        if (v.is_null()) return fallback;
        return v.get<T>();
    }

    // ── Inspection ──
    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isArray() const { return data_.is_array(); }
    bool isString() const { return data_.is_string(); }
    bool isNumber() const { return data_.is_number(); }
    bool isBoolean() const { return data_.is_boolean(); }
    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }
    std::size_t size() const { return data_.size(); }

    // JSON type name, e.g. "null", "number", "object"
    std::string typeName() const { return data_.type_name(); }

    std::string dump(int indent = -1) const { return data_.dump(indent); }

    const nlohmann::json& raw() const { return data_; }
    nlohmann::json& raw() { return data_; }

    bool operator==(const JsonValue& other) const { return data_ == other.data_; }
    bool operator!=(const JsonValue& other) const { return data_ != other.data_; }

    friend void to_json(nlohmann::json& j, const JsonValue& v) { j = v.data_; }

private:
    nlohmann::json data_;
};

} // namespace gqlpp
