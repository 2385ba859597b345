#include "shadow_repository.hpp"

namespace shadowsync {

std::optional<shadow_document> memory_shadow_repository::load_shadow(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_docs.find(device_id);
    if (it != m_docs.end()) return it->second;
    return std::nullopt;
}

void memory_shadow_repository::save_shadow(const shadow_document& doc) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_docs[doc.device_id] = doc;
    ++m_saves;
}

std::size_t memory_shadow_repository::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_docs.size();
}

uint64_t memory_shadow_repository::save_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_saves;
}

} // namespace shadowsync
