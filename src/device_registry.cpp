#include "device_registry.hpp"
#include <mutex>

namespace shadowsync {

memory_device_registry::memory_device_registry(bool admit_all,
                                               const std::vector<std::string>& devices)
    : m_admit_all(admit_all), m_devices(devices.begin(), devices.end())
{}

bool memory_device_registry::exists(const std::string& device_id) const {
    if (m_admit_all) return !device_id.empty();
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_devices.count(device_id) > 0;
}

void memory_device_registry::add(const std::string& device_id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_devices.insert(device_id);
}

bool memory_device_registry::remove(const std::string& device_id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return m_devices.erase(device_id) > 0;
}

std::size_t memory_device_registry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_devices.size();
}

} // namespace shadowsync
