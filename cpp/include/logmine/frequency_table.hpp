#ifndef LOGMINE_FREQUENCY_TABLE_HPP
#define LOGMINE_FREQUENCY_TABLE_HPP

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <cstdint>

namespace logmine {

/**
 * Counter that remembers the order keys were first seen
 */
class FrequencyTable {
public:
    using Entry = std::pair<std::string, uint64_t>;

    void add(const std::string& key, uint64_t n = 1);

    uint64_t count(const std::string& key) const;

    /**
     * Entries in first-seen order
     */
    const std::vector<Entry>& entries() const { return entries_; }

    /**
     * Up to n entries by descending count, ties kept in first-seen order
     */
    std::vector<Entry> most_common(size_t n) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    uint64_t total() const;
    void clear();

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace logmine

#endif // LOGMINE_FREQUENCY_TABLE_HPP
