/*
 * sandforge - Configuration
 *
 * JSON-backed configuration with dotted-key access:
 *
 *   cfg.get_string("sandbox.self_hosted.base_image", "node:18-alpine")
 *
 * Values are looked up by walking nested objects; a missing key or a value
 * of the wrong type yields the supplied default.
 */
#ifndef sandforge_CORE_CONFIG_HPP
#define sandforge_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace sandforge {

class Config {
public:
    Config();
    explicit Config(const Json& root);

    // Load from a JSON file. Returns false (and logs) on I/O or parse errors.
    bool load_file(const std::string& path);

    // Load from a JSON document in memory
    bool load_string(const std::string& text);

    bool has(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_value) const;
    int64_t get_int(const std::string& key, int64_t default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;
    std::vector<std::string> get_string_list(const std::string& key) const;
    std::vector<int64_t> get_int_list(const std::string& key) const;

    // Raw subtree; null Json when absent
    Json get_json(const std::string& key) const;

    void set_string(const std::string& key, const std::string& value);
    void set_int(const std::string& key, int64_t value);
    void set_bool(const std::string& key, bool value);

    const Json& root() const { return root_; }
    const std::string& path() const { return path_; }

private:
    Json root_;
    std::string path_;

    const Json* find(const std::string& key) const;
    Json& ensure(const std::string& key);
};

} // namespace sandforge

#endif // sandforge_CORE_CONFIG_HPP
