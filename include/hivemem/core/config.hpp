/*
 * HiveMem C++ - Configuration
 *
 * JSON configuration with dotted-path access ("sync.port").
 */
#ifndef hivemem_CORE_CONFIG_HPP
#define hivemem_CORE_CONFIG_HPP

#include <hivemem/core/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace hivemem {

class Config {
public:
    Config();
    explicit Config(const Json& data);

    bool load_file(const std::string& path);
    bool load_string(const std::string& text);

    bool has(const std::string& path) const;

    std::string get_string(const std::string& path, const std::string& default_value = "") const;
    int64_t get_int(const std::string& path, int64_t default_value = 0) const;
    double get_double(const std::string& path, double default_value = 0.0) const;
    bool get_bool(const std::string& path, bool default_value = false) const;
    std::vector<std::string> get_string_list(const std::string& path) const;

    void set_string(const std::string& path, const std::string& value);
    void set_int(const std::string& path, int64_t value);
    void set_double(const std::string& path, double value);
    void set_bool(const std::string& path, bool value);

    const Json& data() const { return data_; }
    const std::string& last_error() const { return last_error_; }

private:
    const Json* find(const std::string& path) const;
    Json& slot(const std::string& path);

    Json data_;
    std::string last_error_;
};

} // namespace hivemem

#endif // hivemem_CORE_CONFIG_HPP
