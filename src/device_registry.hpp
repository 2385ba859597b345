#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace shadowsync {

// Source of truth for which devices exist. Shadow mutations for devices it
// does not know are rejected.
class device_registry {
public:
    virtual ~device_registry() = default;

    virtual bool exists(const std::string& device_id) const = 0;
    virtual void add(const std::string& device_id) = 0;
    virtual bool remove(const std::string& device_id) = 0;
};

class memory_device_registry : public device_registry {
public:
    // With admit_all, exists() is true for every id (open fleet).
    explicit memory_device_registry(bool admit_all = false,
                                    const std::vector<std::string>& devices = {});

    bool exists(const std::string& device_id) const override;
    void add(const std::string& device_id) override;
    bool remove(const std::string& device_id) override;

    std::size_t size() const;

private:
    bool m_admit_all;
    mutable std::shared_mutex m_mutex;
    std::unordered_set<std::string> m_devices;
};

} // namespace shadowsync
