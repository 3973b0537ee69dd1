// src/crossover/utils/config.cpp
#include "crossover/utils/config.hpp"
#include <fstream>

namespace crossover {
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
    load(file);
    return true;
}

void Config::load(std::istream& in) {
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
        if (!key.empty()) {
            parsed[key] = trim(trimmed.substr(pos + 1));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_ = std::move(parsed);
}

bool Config::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) > 0;
}

std::string Config::get(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_value;
}

std::vector<std::string> Config::get_list(const std::string& key,
                                          const std::vector<std::string>& default_value) const {
    std::string raw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        raw = it->second;
    }

    std::vector<std::string> items;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace utils
} // namespace crossover
