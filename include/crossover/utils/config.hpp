// include/crossover/utils/config.hpp
#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <istream>
#include <sstream>

namespace crossover {
namespace utils {

// Flat key = value store backing crossover.conf.
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

    // Returns false if the file cannot be opened; existing values are kept.
    bool load_from_file(const std::string& filename);

    // Replaces all values with the key = value lines read from `in`.
    // Blank lines and lines starting with '#' are skipped.
    void load(std::istream& in);

    bool contains(const std::string& key) const;

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

    std::string get(const std::string& key, const std::string& default_value) const;
    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    // Comma separated list, entries trimmed, empty entries dropped.
    std::vector<std::string> get_list(const std::string& key,
                                      const std::vector<std::string>& default_value) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace crossover
