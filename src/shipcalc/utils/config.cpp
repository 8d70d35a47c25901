// src/shipcalc/utils/config.cpp
#include "shipcalc/utils/config.hpp"
#include <fstream>
#include <utility>

namespace shipcalc {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

std::shared_ptr<Config> Config::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::make_shared<Config>();
    }
    return instance_;
}

std::string Config::trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    load_from_stream(file);
    return true;
}

void Config::load_from_stream(std::istream& in) {
    std::unordered_map<std::string, std::string> parsed;
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        size_t pos = trimmed.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = trim(trimmed.substr(0, pos));
        if (key.empty()) {
            continue;
        }
        parsed[key] = trim(trimmed.substr(pos + 1));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_ = std::move(parsed);
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

} // namespace utils
} // namespace shipcalc
