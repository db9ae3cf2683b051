#include <sandforge/core/config.hpp>
#include <sandforge/core/logger.hpp>
#include <sandforge/core/utils.hpp>

#include <fstream>
#include <sstream>

namespace sandforge {

Config::Config() : root_(Json::object()) {}

Config::Config(const Json& root) : root_(root.is_object() ? root : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream file(path.c_str());
    if (!file.is_open()) {
        LOG_ERROR("Cannot open config file: %s", path.c_str());
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();

    if (!load_string(content.str())) {
        LOG_ERROR("Invalid config file: %s", path.c_str());
        return false;
    }
    path_ = path;
    return true;
}

bool Config::load_string(const std::string& text) {
    Json parsed;
    try {
        parsed = Json::parse(text);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse config JSON: %s", e.what());
        return false;
    }

    if (!parsed.is_object()) {
        LOG_ERROR("Config root must be a JSON object");
        return false;
    }

    root_ = parsed;
    return true;
}

const Json* Config::find(const std::string& key) const {
    const Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) return nullptr;
        Json::const_iterator it = node->find(parts[i]);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::ensure(const std::string& key) {
    Json* node = &root_;
    std::vector<std::string> parts = split(key, '.');
    for (size_t i = 0; i < parts.size(); ++i) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[parts[i]];
    }
    return *node;
}

bool Config::has(const std::string& key) const {
    const Json* node = find(key);
    return node != nullptr && !node->is_null();
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    const Json* node = find(key);
    if (!node) return default_value;
    if (node->is_string()) return node->get<std::string>();
    if (node->is_number_integer()) return std::to_string(node->get<int64_t>());
    if (node->is_boolean()) return node->get<bool>() ? "true" : "false";
    return default_value;
}

int64_t Config::get_int(const std::string& key, int64_t default_value) const {
    const Json* node = find(key);
    if (!node) return default_value;
    if (node->is_number_integer()) return node->get<int64_t>();
    if (node->is_number_float()) return static_cast<int64_t>(node->get<double>());
    if (node->is_string()) {
        try {
            return std::stoll(node->get<std::string>());
        } catch (const std::exception&) {
            LOG_WARN("Config key '%s' is not a number, using default", key.c_str());
        }
    }
    return default_value;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    const Json* node = find(key);
    if (!node) return default_value;
    if (node->is_boolean()) return node->get<bool>();
    if (node->is_number_integer()) return node->get<int64_t>() != 0;
    if (node->is_string()) {
        std::string val = to_lower(node->get<std::string>());
        if (val == "true" || val == "1" || val == "yes") return true;
        if (val == "false" || val == "0" || val == "no") return false;
    }
    return default_value;
}

std::vector<std::string> Config::get_string_list(const std::string& key) const {
    std::vector<std::string> out;
    const Json* node = find(key);
    if (!node || !node->is_array()) return out;
    for (size_t i = 0; i < node->size(); ++i) {
        if ((*node)[i].is_string()) {
            out.push_back((*node)[i].get<std::string>());
        }
    }
    return out;
}

std::vector<int64_t> Config::get_int_list(const std::string& key) const {
    std::vector<int64_t> out;
    const Json* node = find(key);
    if (!node || !node->is_array()) return out;
    for (size_t i = 0; i < node->size(); ++i) {
        if ((*node)[i].is_number_integer()) {
            out.push_back((*node)[i].get<int64_t>());
        }
    }
    return out;
}

Json Config::get_json(const std::string& key) const {
    const Json* node = find(key);
    return node ? *node : Json();
}

void Config::set_string(const std::string& key, const std::string& value) {
    ensure(key) = value;
}

void Config::set_int(const std::string& key, int64_t value) {
    ensure(key) = value;
}

void Config::set_bool(const std::string& key, bool value) {
    ensure(key) = value;
}

} // namespace sandforge
