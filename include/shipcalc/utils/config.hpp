// include/shipcalc/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <istream>
#include <sstream>

namespace shipcalc {
namespace utils {

// key=value settings. Lines starting with '#' and blank lines are ignored.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    static std::string trim(const std::string& text);

public:
    Config() = default;

    static std::shared_ptr<Config> instance();

    // Returns false when the file cannot be opened; existing values are kept then.
    bool load_from_file(const std::string& filename);

    // Replaces all values with the ones parsed from the stream.
    void load_from_stream(std::istream& in);

    bool has(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace shipcalc
