#pragma once
#include "category.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace memcat {

class Classifier; // forward declaration

// Order-preserving metadata map, opaque to the store
using Metadata = nlohmann::ordered_json;

inline constexpr const char* kDefaultUserId = "default";
inline constexpr int64_t kDefaultListLimit = 10;
inline constexpr size_t kSearchLimit = 10;

struct MemoryItem {
    std::string id;
    std::string content;
    MemoryCategory category = MemoryCategory::General;
    std::string timestamp;  // ISO 8601, fixed width, so it sorts lexicographically
    std::string user_id = kDefaultUserId;
    Metadata metadata = Metadata::object();
};

struct CategoryCount {
    MemoryCategory category;
    uint32_t count = 0;
    double percentage = 0.0;
};

struct MemoryStats {
    uint32_t total = 0;
    std::vector<CategoryCount> categories;  // only categories present, first-appearance order
    MemoryItem oldest;
    MemoryItem newest;
};

struct SearchResult {
    std::vector<MemoryItem> memories;  // insertion order, at most kSearchLimit
    size_t total_matches = 0;          // before truncation
};

enum class RemoveOutcome { Removed, UserNotFound, MemoryNotFound };

// Process-wide memory store, partitioned by user id. Every public method
// takes the store mutex, so each call is atomic with respect to the others.
class MemoryStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // The classifier must outlive the store. An empty clock uses system_clock.
    explicit MemoryStore(const Classifier& classifier, Clock clock = {});

    // Append a new item for user_id. Without a category the classifier picks one.
    // Throws std::invalid_argument on empty content or non-object metadata.
    MemoryItem create(const std::string& user_id,
                      const std::string& content,
                      std::optional<MemoryCategory> category = std::nullopt,
                      Metadata metadata = Metadata::object());

    // Most recent first (stable: equal timestamps keep insertion order),
    // truncated to limit. limit <= 0 yields nothing.
    std::vector<MemoryItem> list(const std::string& user_id,
                                 std::optional<MemoryCategory> category_filter,
                                 int64_t limit = kDefaultListLimit) const;

    // Case-insensitive substring match over content, in insertion order.
    // Throws std::invalid_argument on an empty query.
    SearchResult search(const std::string& user_id,
                        const std::string& query,
                        std::optional<MemoryCategory> category_filter) const;

    RemoveOutcome remove(const std::string& user_id, const std::string& memory_id);

    // std::nullopt when the user has no items.
    std::optional<MemoryStats> stats(const std::string& user_id) const;

    size_t count(const std::string& user_id) const;
    size_t total_count() const;

    const Classifier& classifier() const { return classifier_; }

    void set_debug(bool debug) { debug_ = debug; }

private:
    std::string next_id(int64_t now_micros);

    const Classifier& classifier_;
    Clock clock_;
    bool debug_ = false;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<MemoryItem>> items_;
    int64_t last_id_micros_ = 0;
};

} // namespace memcat
