#ifndef FSMON_CONFIG_H
#define FSMON_CONFIG_H

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <variant>
#include <cstdint>

namespace Json {
class Value;
}

namespace fsmon {
namespace core {

/**
 * @brief Configuration value types
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    double,
    bool,
    std::vector<std::string>
>;

/**
 * @brief Config - JSON configuration loader
 *
 * Nested JSON objects are flattened into dotted keys, so
 * {"fs_monitor": {"max_watches": 10}} is read back with
 * get_int("fs_monitor.max_watches").
 */
class Config {
public:
    Config();
    ~Config();

    /**
     * @brief Load configuration from JSON file
     *
     * @param path Path to JSON file
     * @return true if loaded successfully
     */
    bool load_from_file(const std::string& path);

    /**
     * @brief Load configuration from JSON string
     *
     * Replaces any previously loaded values.
     *
     * @param json JSON string
     * @return true if parsed successfully
     */
    bool load_from_string(const std::string& json);

    /**
     * @brief Last parse error, empty after a successful load
     */
    const std::string& last_error() const { return last_error_; }

    /**
     * @brief Get string value
     *
     * @param key Key path (e.g., "fs_monitor.thread_priority")
     * @param default_value Default value if key not found
     * @return Value or default
     */
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    /**
     * @brief Get integer value
     */
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;

    /**
     * @brief Get double value
     */
    double get_double(const std::string& key, double default_value = 0.0) const;

    /**
     * @brief Get boolean value
     */
    bool get_bool(const std::string& key, bool default_value = false) const;

    /**
     * @brief Get string array
     */
    std::vector<std::string> get_string_array(const std::string& key) const;

    /**
     * @brief Check if key exists
     */
    bool has_key(const std::string& key) const;

    /**
     * @brief Check that a key holds a value of type T
     */
    template<typename T>
    bool holds(const std::string& key) const {
        const ConfigValue* val = get_value(key);
        return val && std::holds_alternative<T>(*val);
    }

    /**
     * @brief Set a value (for programmatic configuration)
     */
    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_double(const std::string& key, double value);
    void set_bool(const std::string& key, bool value);
    void set_string_array(const std::string& key, const std::vector<std::string>& value);

    /**
     * @brief Clear all configuration
     */
    void clear();

    /**
     * @brief All keys currently set, sorted
     */
    std::vector<std::string> keys() const;

private:
    std::map<std::string, ConfigValue> data_;
    std::string last_error_;

    /**
     * @brief Flatten a parsed JSON value into dotted keys
     */
    bool flatten(const std::string& prefix, const Json::Value& node);

    /**
     * @brief Get value by key path
     */
    const ConfigValue* get_value(const std::string& key) const;
};

} // namespace core
} // namespace fsmon

#endif // FSMON_CONFIG_H
