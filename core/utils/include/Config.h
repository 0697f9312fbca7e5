#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ConsoleGate {

    /**
     * @brief Thread-safe key=value settings store
     *
     * File format: one `key=value` per line, `#` starts a comment line,
     * surrounding whitespace is ignored. Lines without `=` are skipped and
     * counted in skippedLines().
     *
     * Typed getters return the default when the key is absent or the value
     * does not parse completely ("80x" is not an int).
     */
    class Config {
    public:
        Config() = default;

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        /**
         * @brief Set each pair, replacing file values (command-line flags)
         */
        void applyOverrides(const std::vector<std::pair<std::string, std::string>>& overrides);

        /**
         * @brief Keys present here but not in known, sorted
         */
        std::vector<std::string> unknownKeys(const std::vector<std::string>& known) const;

        size_t skippedLines() const;

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        void setSize(const std::string& key, size_t value);

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

    private:
        std::unordered_map<std::string, std::string> settings_;
        size_t skippedLines_{0};
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
    };

}
