#pragma once

#include "shadow_document.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace shadowsync {

// Persistence for shadow documents. Implementations may block; the store
// calls them while holding only the affected device's lock.
class shadow_repository {
public:
    virtual ~shadow_repository() = default;

    virtual std::optional<shadow_document> load_shadow(const std::string& device_id) = 0;

    // Throws on failure; the in-memory state is then left unchanged.
    virtual void save_shadow(const shadow_document& doc) = 0;
};

class memory_shadow_repository : public shadow_repository {
public:
    std::optional<shadow_document> load_shadow(const std::string& device_id) override;
    void save_shadow(const shadow_document& doc) override;

    std::size_t size() const;
    uint64_t save_count() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, shadow_document> m_docs;
    uint64_t m_saves = 0;
};

} // namespace shadowsync
