#include "render.hpp"
#include "../util.hpp"
#include <cstdio>
#include <sstream>

namespace memcat {

using ojson = nlohmann::ordered_json;

std::string format_percentage(double pct) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", pct);
    return buf;
}

static std::string upper(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}

static std::string str(const ojson& v, const char* key) {
    auto it = v.find(key);
    if (it == v.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

static void render_items(std::ostringstream& ss, const ojson& items) {
    for (const auto& m : items) {
        ss << "- [" << upper(str(m, "category")) << "] " << str(m, "id") << "\n"
           << "  " << str(m, "timestamp") << "\n"
           << "  " << str(m, "content") << "\n\n";
    }
}

static std::string preview(const std::string& s) {
    std::string cut = utf8_truncate(s, 100);
    return cut.size() < s.size() ? cut + "..." : cut;
}

static std::string render_save(const ojson& v) {
    const auto& m = v.at("memory");
    std::ostringstream ss;
    ss << "Memory saved.\n"
       << "ID: " << str(m, "id") << "\n"
       << "Category: " << str(m, "category") << "\n"
       << "Content: " << preview(str(m, "content"));
    return ss.str();
}

static std::string render_retrieve(const ojson& v) {
    const auto& items = v.at("memories");
    if (items.empty()) {
        std::string cat = str(v, "category");
        if (!cat.empty()) return "No memories found in category '" + cat + "'";
        return "No memories found";
    }
    std::ostringstream ss;
    ss << items.size() << " memory(ies) found:\n\n";
    render_items(ss, items);
    return ss.str();
}

static std::string render_categorize(const ojson& v) {
    const auto& s = v.at("scores");
    std::ostringstream ss;
    ss << "Category: " << upper(str(v, "category")) << "\n"
       << "Scores: personal=" << s.value("personal", 0)
       << " professional=" << s.value("professional", 0)
       << " technical=" << s.value("technical", 0);
    return ss.str();
}

static std::string render_delete(const ojson& v) {
    std::string id = str(v, "memory_id");
    if (v.value("deleted", false)) return "Memory " + id + " deleted";
    if (str(v, "reason") == "user_not_found") return "User '" + str(v, "user_id") + "' not found";
    return "Memory " + id + " not found";
}

static std::string render_search(const ojson& v) {
    const auto& items = v.at("memories");
    std::string query = str(v, "query");
    if (items.empty()) return "No memories found matching '" + query + "'";

    size_t total = v.value("total_matches", items.size());
    std::ostringstream ss;
    ss << total << " result(s) for '" << query << "'";
    if (total > items.size()) ss << " (showing first " << items.size() << ")";
    ss << ":\n\n";
    render_items(ss, items);
    return ss.str();
}

static std::string render_stats(const ojson& v) {
    if (v.value("empty", true)) return "No memories stored yet";

    std::ostringstream ss;
    ss << "MEMORY STATISTICS\n"
       << std::string(30, '=') << "\n\n"
       << "Total memories: " << v.value("total", 0) << "\n\n"
       << "By category:\n";
    for (const auto& c : v.at("categories")) {
        ss << "  - " << upper(str(c, "category")) << ": " << c.value("count", 0)
           << " (" << format_percentage(c.value("percentage", 0.0)) << "%)\n";
    }
    ss << "\nOldest memory: " << str(v.at("oldest"), "timestamp") << "\n"
       << "Newest memory: " << str(v.at("newest"), "timestamp") << "\n";
    return ss.str();
}

std::string render_result(const std::string& operation, const OperationResult& result) {
    if (!result.success) return "Error: " + result.error;

    const auto& v = result.value;
    if (operation == "save")             return render_save(v);
    if (operation == "retrieveMemories") return render_retrieve(v);
    if (operation == "categorizeText")   return render_categorize(v);
    if (operation == "deleteMemory")     return render_delete(v);
    if (operation == "searchMemories")   return render_search(v);
    if (operation == "getMemoryStats")   return render_stats(v);
    return v.dump(2);
}

} // namespace memcat
