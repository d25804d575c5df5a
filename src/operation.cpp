#include "operation.hpp"
#include "memory.hpp"
#include "operations/save_memory.hpp"
#include "operations/retrieve_memories.hpp"
#include "operations/categorize_text.hpp"
#include "operations/delete_memory.hpp"
#include "operations/search_memories.hpp"
#include "operations/memory_stats.hpp"

namespace memcat {

std::vector<std::unique_ptr<Operation>> create_memory_operations(MemoryStore& store) {
    std::vector<std::unique_ptr<Operation>> ops;
    ops.push_back(std::make_unique<SaveMemoryOperation>(store));
    ops.push_back(std::make_unique<RetrieveMemoriesOperation>(store));
    ops.push_back(std::make_unique<CategorizeTextOperation>(store.classifier()));
    ops.push_back(std::make_unique<DeleteMemoryOperation>(store));
    ops.push_back(std::make_unique<SearchMemoriesOperation>(store));
    ops.push_back(std::make_unique<MemoryStatsOperation>(store));
    return ops;
}

} // namespace memcat
