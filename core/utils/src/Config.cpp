#include "Config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ConsoleGate {

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        std::vector<std::pair<std::string, std::string>> parsed;
        size_t skipped = 0;
        std::string line;
        while (std::getline(file, line)) {
            auto trimmed = trim(line);
            if (trimmed.empty() || trimmed[0] == '#') continue;

            size_t eq = trimmed.find('=');
            std::string key = eq == std::string::npos ? "" : trim(trimmed.substr(0, eq));
            if (key.empty()) {
                ++skipped;
                continue;
            }
            parsed.emplace_back(std::move(key), trim(trimmed.substr(eq + 1)));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        skippedLines_ += skipped;
        for (auto& [key, value] : parsed) {
            if (overrideExisting || settings_.find(key) == settings_.end()) {
                settings_[key] = std::move(value);
            }
        }
        return true;
    }

    bool Config::saveToFile(const std::string& path) const {
        std::vector<std::pair<std::string, std::string>> sorted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sorted.assign(settings_.begin(), settings_.end());
        }
        std::sort(sorted.begin(), sorted.end());

        std::ofstream file(path);
        if (!file.is_open()) {
            return false;
        }
        for (const auto& [key, value] : sorted) {
            file << key << "=" << value << '\n';
        }
        return static_cast<bool>(file);
    }

    void Config::applyOverrides(const std::vector<std::pair<std::string, std::string>>& overrides) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [key, value] : overrides) {
            settings_[key] = value;
        }
    }

    std::vector<std::string> Config::unknownKeys(const std::vector<std::string>& known) const {
        std::vector<std::string> unknown;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : settings_) {
            if (std::find(known.begin(), known.end(), entry.first) == known.end()) {
                unknown.push_back(entry.first);
            }
        }
        std::sort(unknown.begin(), unknown.end());
        return unknown;
    }

    size_t Config::skippedLines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return skippedLines_;
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.find(key) != settings_.end();
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it != settings_.end() ? it->second : defaultValue;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::string val = get(key);
        if (val.empty()) return defaultValue;
        try {
            size_t consumed = 0;
            int parsed = std::stoi(val, &consumed);
            return consumed == val.size() ? parsed : defaultValue;
        } catch (const std::invalid_argument&) {
            return defaultValue;
        } catch (const std::out_of_range&) {
            return defaultValue;
        }
    }

    void Config::setInt(const std::string& key, int value) {
        set(key, std::to_string(value));
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string val = get(key);
        // stoull accepts a leading '-' and wraps; sizes are never negative
        if (val.empty() || !std::isdigit(static_cast<unsigned char>(val[0]))) return defaultValue;
        try {
            size_t consumed = 0;
            auto parsed = std::stoull(val, &consumed);
            return consumed == val.size() ? static_cast<size_t>(parsed) : defaultValue;
        } catch (const std::invalid_argument&) {
            return defaultValue;
        } catch (const std::out_of_range&) {
            return defaultValue;
        }
    }

    void Config::setSize(const std::string& key, size_t value) {
        set(key, std::to_string(value));
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::string val = get(key);
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
        if (val == "0" || val == "false" || val == "no" || val == "off") return false;
        return defaultValue;
    }

    void Config::setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    std::string Config::trim(const std::string& value) {
        auto start = value.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(start, end - start + 1);
    }

}
