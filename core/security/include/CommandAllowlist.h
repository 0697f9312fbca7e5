#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace ConsoleGate {

/**
 * @brief Immutable set of authorized command prefixes
 *
 * Each entry is 1..N whitespace-free tokens joined by single spaces,
 * e.g. "calendar events list". Entries are validated on construction and
 * the set never changes afterwards, so one instance can be shared by any
 * number of request threads without locking.
 */
class CommandAllowlist {
public:
    /**
     * @throws std::invalid_argument if an entry is empty, not normalized,
     *         or contains a shell metacharacter
     */
    explicit CommandAllowlist(const std::vector<std::string>& entries);
    CommandAllowlist(std::initializer_list<std::string> entries);

    /**
     * @brief The built-in table of command families the console exposes
     */
    static const CommandAllowlist& defaults();

    bool contains(const std::string& prefix) const;

    /**
     * @brief Token count of the deepest entry (3 for the built-in table)
     */
    size_t maxDepth() const { return maxDepth_; }

    size_t size() const { return entries_.size(); }

    /**
     * @brief All entries, sorted
     */
    std::vector<std::string> entries() const;

private:
    void add(const std::string& entry);

    std::unordered_set<std::string> entries_;
    size_t maxDepth_{0};
};

} // namespace ConsoleGate
