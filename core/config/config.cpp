#include "config.h"
#include "core/logger/logger.h"
#include <json/json.h>
#include <fstream>
#include <sstream>

namespace fsmon {
namespace core {

Config::Config() {
}

Config::~Config() {
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        last_error_ = "cannot open " + path;
        FSMON_LOG_ERROR("Config", "Failed to open config file: " + path);
        return false;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    return load_from_string(buffer.str());
}

bool Config::load_from_string(const std::string& json) {
    clear();

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        last_error_ = errors;
        FSMON_LOG_ERROR("Config", "Failed to parse configuration: " + errors);
        return false;
    }

    if (!root.isObject()) {
        last_error_ = "top-level JSON value must be an object";
        FSMON_LOG_ERROR("Config", last_error_);
        return false;
    }

    if (!flatten("", root)) {
        clear();
        return false;
    }

    last_error_.clear();
    FSMON_LOG_DEBUG("Config", "Loaded " + std::to_string(data_.size()) + " configuration keys");
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const ConfigValue* val = get_value(key);
    if (val && std::holds_alternative<std::string>(*val)) {
        return std::get<std::string>(*val);
    }
    return default_value;
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const ConfigValue* val = get_value(key);
    if (val && std::holds_alternative<int64_t>(*val)) {
        return std::get<int64_t>(*val);
    }
    return default_value;
}

double Config::get_double(const std::string& key, double default_value) const {
    const ConfigValue* val = get_value(key);
    if (val && std::holds_alternative<double>(*val)) {
        return std::get<double>(*val);
    }
    if (val && std::holds_alternative<int64_t>(*val)) {
        return static_cast<double>(std::get<int64_t>(*val));
    }
    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const ConfigValue* val = get_value(key);
    if (val && std::holds_alternative<bool>(*val)) {
        return std::get<bool>(*val);
    }
    return default_value;
}

std::vector<std::string> Config::get_string_array(const std::string& key) const {
    const ConfigValue* val = get_value(key);
    if (val && std::holds_alternative<std::vector<std::string>>(*val)) {
        return std::get<std::vector<std::string>>(*val);
    }
    return {};
}

bool Config::has_key(const std::string& key) const {
    return data_.find(key) != data_.end();
}

void Config::set_string(const std::string& key, const std::string& value) {
    data_[key] = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    data_[key] = value;
}

void Config::set_double(const std::string& key, double value) {
    data_[key] = value;
}

void Config::set_bool(const std::string& key, bool value) {
    data_[key] = value;
}

void Config::set_string_array(const std::string& key, const std::vector<std::string>& value) {
    data_[key] = value;
}

void Config::clear() {
    data_.clear();
}

std::vector<std::string> Config::keys() const {
    std::vector<std::string> result;
    result.reserve(data_.size());
    for (const auto& entry : data_) {
        result.push_back(entry.first);
    }
    return result;
}

const ConfigValue* Config::get_value(const std::string& key) const {
    auto it = data_.find(key);
    if (it != data_.end()) {
        return &it->second;
    }
    return nullptr;
}

bool Config::flatten(const std::string& prefix, const Json::Value& node) {
    if (node.isObject()) {
        for (const auto& name : node.getMemberNames()) {
            std::string key = prefix.empty() ? name : prefix + "." + name;
            if (!flatten(key, node[name])) {
                return false;
            }
        }
        return true;
    }

    if (node.isBool()) {
        data_[prefix] = node.asBool();
    } else if (node.isInt64()) {
        data_[prefix] = static_cast<int64_t>(node.asInt64());
    } else if (node.isDouble()) {
        data_[prefix] = node.asDouble();
    } else if (node.isString()) {
        data_[prefix] = node.asString();
    } else if (node.isArray()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            if (!item.isString()) {
                last_error_ = "array '" + prefix + "' may only contain strings";
                FSMON_LOG_ERROR("Config", last_error_);
                return false;
            }
            items.push_back(item.asString());
        }
        data_[prefix] = items;
    } else if (node.isNull()) {
        // null leaves the key unset so the default applies
    } else {
        last_error_ = "unsupported value for key '" + prefix + "'";
        FSMON_LOG_ERROR("Config", last_error_);
        return false;
    }
    return true;
}

} // namespace core
} // namespace fsmon
