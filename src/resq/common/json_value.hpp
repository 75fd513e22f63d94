/**
 * @file json_value.hpp
 * @brief Minimal JSON document model used by the configuration loaders.
 */
#pragma once
#include "resq/common/common.hpp"

namespace resq
{

/**
 * @brief A parsed JSON value.
 *
 * @details
 * Objects are stored in a `std::map`, so key order is not preserved. Any
 * configuration whose order matters (rule lists, template task lists) is
 * expressed as a JSON array.
 *
 * The typed accessors (`as_string()`, `as_number()`, ...) throw `ConfigError`
 * naming `context` when the value has the wrong kind, so loaders can report
 * the offending path without checking kinds by hand.
 */
struct JsonValue
{
    enum class Kind
    {
        Null,
        Bool,
        Number,
        String,
        Object,
        Array
    };

    Kind kind{Kind::Null};
    bool bool_value{false};
    double number_value{0.0};
    std::string string_value;
    std::map<std::string, JsonValue> object_values;
    std::vector<JsonValue> array_values;

    static JsonValue make_null();
    static JsonValue make_bool(bool value);
    static JsonValue make_number(double value);
    static JsonValue make_string(std::string value);
    static JsonValue make_object();
    static JsonValue make_array();

    bool is_null() const noexcept { return kind == Kind::Null; }
    bool is_object() const noexcept { return kind == Kind::Object; }
    bool is_array() const noexcept { return kind == Kind::Array; }
    bool is_string() const noexcept { return kind == Kind::String; }
    bool is_number() const noexcept { return kind == Kind::Number; }
    bool is_bool() const noexcept { return kind == Kind::Bool; }

    /**
     * @brief Look up an object member.
     * @return Pointer to the member, or nullptr if absent or this is not an object.
     */
    const JsonValue* find(const std::string& key) const;

    /**
     * @brief Look up a required object member.
     * @throw ConfigError if this is not an object or the key is absent.
     */
    const JsonValue& at(const std::string& key, const std::string& context) const;

    const std::string& as_string(const std::string& context) const;
    double as_number(const std::string& context) const;
    int as_int(const std::string& context) const;
    bool as_bool(const std::string& context) const;
    const std::vector<JsonValue>& as_array(const std::string& context) const;
    const std::map<std::string, JsonValue>& as_object(const std::string& context) const;

    /**
     * @brief Reject object members outside `allowed`.
     * @throw ConfigError naming the first unknown key.
     */
    void expect_only_keys(const std::set<std::string>& allowed, const std::string& context) const;

    /// Insert or replace an object member. Converts a null value into an object.
    JsonValue& set(const std::string& key, JsonValue value);

    /// Append an array element. Converts a null value into an array.
    JsonValue& push_back(JsonValue value);
};

/**
 * @brief Parse a JSON document.
 * @throw ConfigError with the byte offset of the first syntax error.
 */
JsonValue json_parse(const std::string& text);

/**
 * @brief Read and parse a JSON file.
 * @throw ConfigError if the file cannot be read or parsed.
 */
JsonValue json_parse_file(const std::string& path);

/**
 * @brief Serialize a JSON value.
 * @param indent Indentation width; 0 produces a single line.
 */
std::string json_stringify(const JsonValue& value, int indent = 0);

} // namespace resq
