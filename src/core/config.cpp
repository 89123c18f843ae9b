/*
 * HiveMem C++ - Configuration Implementation
 */
#include <hivemem/core/config.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <fstream>
#include <sstream>

namespace hivemem {

Config::Config() : data_(Json::object()) {}

Config::Config(const Json& data) : data_(data.is_object() ? data : Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        last_error_ = "cannot open " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return load_string(ss.str());
}

bool Config::load_string(const std::string& text) {
    try {
        Json parsed = Json::parse(text);
        if (!parsed.is_object()) {
            last_error_ = "config root must be an object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const Json::parse_error& e) {
        last_error_ = e.what();
        LOG_ERROR("[Config] Parse error: %s", e.what());
        return false;
    }
}

const Json* Config::find(const std::string& path) const {
    const Json* node = &data_;
    for (const auto& part : split(path, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &(*it);
    }
    return node;
}

Json& Config::slot(const std::string& path) {
    Json* node = &data_;
    for (const auto& part : split(path, '.')) {
        if (!node->is_object()) {
            *node = Json::object();
        }
        node = &(*node)[part];
    }
    return *node;
}

bool Config::has(const std::string& path) const {
    const Json* node = find(path);
    return node != nullptr && !node->is_null();
}

std::string Config::get_string(const std::string& path, const std::string& default_value) const {
    const Json* node = find(path);
    if (!node || !node->is_string()) return default_value;
    return node->get<std::string>();
}

int64_t Config::get_int(const std::string& path, int64_t default_value) const {
    const Json* node = find(path);
    if (!node || !node->is_number()) return default_value;
    if (node->is_number_float()) {
        return static_cast<int64_t>(node->get<double>());
    }
    return node->get<int64_t>();
}

double Config::get_double(const std::string& path, double default_value) const {
    const Json* node = find(path);
    if (!node || !node->is_number()) return default_value;
    return node->get<double>();
}

bool Config::get_bool(const std::string& path, bool default_value) const {
    const Json* node = find(path);
    if (!node || !node->is_boolean()) return default_value;
    return node->get<bool>();
}

std::vector<std::string> Config::get_string_list(const std::string& path) const {
    std::vector<std::string> out;
    const Json* node = find(path);
    if (!node || !node->is_array()) return out;
    for (const auto& item : *node) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

void Config::set_string(const std::string& path, const std::string& value) { slot(path) = value; }

void Config::set_int(const std::string& path, int64_t value) { slot(path) = value; }

void Config::set_double(const std::string& path, double value) { slot(path) = value; }

void Config::set_bool(const std::string& path, bool value) { slot(path) = value; }

} // namespace hivemem
