#include "agentcoord/store.hpp"
#include "agentcoord/memory_store.hpp"
#include "agentcoord/sqlite_store.hpp"
#include "agentcoord/exceptions.hpp"

namespace agentcoord {

std::shared_ptr<CoordinationStore> make_store(const StoreConfig& config) {
    switch (config.backend) {
        case StoreBackend::Memory:
            return std::make_shared<MemoryStore>();
        case StoreBackend::Sqlite:
            if (config.database_path.empty()) {
                throw InvalidRequestException("Sqlite store requires a database path");
            }
            return std::make_shared<SqliteStore>(config.database_path, config.busy_timeout);
    }
    throw InvalidRequestException("Unknown store backend");
}

} // namespace agentcoord
