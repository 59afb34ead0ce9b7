#include "logmine/frequency_table.hpp"
#include <algorithm>

namespace logmine {

void FrequencyTable::add(const std::string& key, uint64_t n) {
    auto it = index_.find(key);
    if (it == index_.end()) {
        index_.emplace(key, entries_.size());
        entries_.emplace_back(key, n);
    } else {
        entries_[it->second].second += n;
    }
}

uint64_t FrequencyTable::count(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? 0 : entries_[it->second].second;
}

std::vector<FrequencyTable::Entry> FrequencyTable::most_common(size_t n) const {
    std::vector<Entry> sorted_entries = entries_;
    std::stable_sort(sorted_entries.begin(), sorted_entries.end(),
                     [](const Entry& a, const Entry& b) { return a.second > b.second; });

    if (sorted_entries.size() > n) {
        sorted_entries.resize(n);
    }
    return sorted_entries;
}

uint64_t FrequencyTable::total() const {
    uint64_t sum = 0;
    for (const auto& entry : entries_) {
        sum += entry.second;
    }
    return sum;
}

void FrequencyTable::clear() {
    entries_.clear();
    index_.clear();
}

} // namespace logmine
