#include "memory.hpp"
#include "classifier.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace memcat {

MemoryStore::MemoryStore(const Classifier& classifier, Clock clock)
    : classifier_(classifier)
    , clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string MemoryStore::next_id(int64_t now_micros) {
    // Bump past the previous id so ids stay unique and increasing even when
    // the clock stalls or steps backwards.
    int64_t micros = std::max(now_micros, last_id_micros_ + 1);
    last_id_micros_ = micros;
    return "mem_" + format_compact_timestamp(micros);
}

MemoryItem MemoryStore::create(const std::string& user_id,
                               const std::string& content,
                               std::optional<MemoryCategory> category,
                               Metadata metadata) {
    if (content.empty()) {
        throw std::invalid_argument("content must not be empty");
    }
    if (metadata.is_null()) {
        metadata = Metadata::object();
    } else if (!metadata.is_object()) {
        throw std::invalid_argument("metadata must be an object");
    }

    // Classification is pure, so it runs outside the lock
    MemoryCategory cat = category ? *category : classifier_.classify(content);

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = clock_();
    MemoryItem item;
    item.id = next_id(epoch_micros(now));
    item.content = content;
    item.category = cat;
    item.timestamp = format_timestamp(now);
    item.user_id = user_id;
    item.metadata = std::move(metadata);

    items_[user_id].push_back(item);

    if (debug_) {
        std::cerr << "[memory] Saved " << item.id << " ("
                  << category_to_string(cat) << ") for user '" << user_id
                  << "': " << utf8_truncate(content, 50) << "\n";
    }
    return item;
}

std::vector<MemoryItem> MemoryStore::list(const std::string& user_id,
                                          std::optional<MemoryCategory> category_filter,
                                          int64_t limit) const {
    if (limit <= 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(user_id);
    if (it == items_.end()) return {};

    std::vector<MemoryItem> result;
    for (const auto& item : it->second) {
        if (category_filter && item.category != *category_filter) continue;
        result.push_back(item);
    }

    std::stable_sort(result.begin(), result.end(),
        [](const MemoryItem& a, const MemoryItem& b) { return a.timestamp > b.timestamp; });

    if (result.size() > static_cast<uint64_t>(limit)) {
        result.resize(static_cast<size_t>(limit));
    }
    return result;
}

SearchResult MemoryStore::search(const std::string& user_id,
                                 const std::string& query,
                                 std::optional<MemoryCategory> category_filter) const {
    if (query.empty()) {
        throw std::invalid_argument("query must not be empty");
    }
    std::string needle = utf8_to_lower(query);

    std::lock_guard<std::mutex> lock(mutex_);

    SearchResult result;
    auto it = items_.find(user_id);
    if (it == items_.end()) return result;

    for (const auto& item : it->second) {
        if (category_filter && item.category != *category_filter) continue;
        if (utf8_to_lower(item.content).find(needle) == std::string::npos) continue;

        result.total_matches++;
        if (result.memories.size() < kSearchLimit) {
            result.memories.push_back(item);
        }
    }
    return result;
}

RemoveOutcome MemoryStore::remove(const std::string& user_id, const std::string& memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(user_id);
    if (it == items_.end()) return RemoveOutcome::UserNotFound;

    auto& items = it->second;
    auto found = std::find_if(items.begin(), items.end(),
        [&memory_id](const MemoryItem& item) { return item.id == memory_id; });
    if (found == items.end()) return RemoveOutcome::MemoryNotFound;

    items.erase(found);

    if (debug_) {
        std::cerr << "[memory] Deleted " << memory_id << " for user '" << user_id << "'\n";
    }
    return RemoveOutcome::Removed;
}

std::optional<MemoryStats> MemoryStore::stats(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = items_.find(user_id);
    if (it == items_.end() || it->second.empty()) return std::nullopt;

    const auto& items = it->second;
    MemoryStats stats;
    stats.total = static_cast<uint32_t>(items.size());

    for (const auto& item : items) {
        auto found = std::find_if(stats.categories.begin(), stats.categories.end(),
            [&item](const CategoryCount& c) { return c.category == item.category; });
        if (found == stats.categories.end()) {
            stats.categories.push_back(CategoryCount{item.category, 1, 0.0});
        } else {
            found->count++;
        }
    }
    for (auto& c : stats.categories) {
        c.percentage = static_cast<double>(c.count) / static_cast<double>(stats.total) * 100.0;
    }

    // min_element / max_element both return the first of equal elements
    auto by_time = [](const MemoryItem& a, const MemoryItem& b) {
        return a.timestamp < b.timestamp;
    };
    stats.oldest = *std::min_element(items.begin(), items.end(), by_time);
    stats.newest = *std::max_element(items.begin(), items.end(), by_time);
    return stats;
}

size_t MemoryStore::count(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(user_id);
    return it == items_.end() ? 0 : it->second.size();
}

size_t MemoryStore::total_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [user, items] : items_) {
        n += items.size();
    }
    return n;
}

} // namespace memcat
