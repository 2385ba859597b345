#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace shadowsync {

// Broker operation attempted without a live connection.
class not_connected_error : public std::runtime_error {
public:
    explicit not_connected_error(const std::string& what)
        : std::runtime_error(what) {}
};

// Shadow mutation targeting a device the registry does not know.
class device_not_found_error : public std::runtime_error {
public:
    explicit device_not_found_error(const std::string& device_id)
        : std::runtime_error("device not found: " + device_id), m_device_id(device_id) {}

    device_not_found_error(const std::string& device_id, const std::string& what)
        : std::runtime_error(what), m_device_id(device_id) {}

    const std::string& device_id() const { return m_device_id; }

private:
    std::string m_device_id;
};

// The device exists but its shadow has been decommissioned (read-only).
class device_decommissioned_error : public device_not_found_error {
public:
    explicit device_decommissioned_error(const std::string& device_id)
        : device_not_found_error(device_id, "device decommissioned: " + device_id) {}
};

// Payload could not be deserialized. Acknowledged and discarded, never retried.
class malformed_message_error : public std::runtime_error {
public:
    explicit malformed_message_error(const std::string& what)
        : std::runtime_error(what) {}
};

// A matched subscriber's handler raised or reported failure.
class callback_failure_error : public std::runtime_error {
public:
    explicit callback_failure_error(const std::string& what)
        : std::runtime_error(what) {}
};

class invalid_pattern_error : public std::invalid_argument {
public:
    explicit invalid_pattern_error(const std::string& what)
        : std::invalid_argument(what) {}
};

// Optimistic concurrency check on desired-state updates failed.
class version_conflict_error : public std::runtime_error {
public:
    version_conflict_error(uint64_t expected, uint64_t actual)
        : std::runtime_error("version conflict: expected " + std::to_string(expected) +
                             ", current " + std::to_string(actual)),
          m_expected(expected), m_actual(actual) {}

    uint64_t expected() const { return m_expected; }
    uint64_t actual() const { return m_actual; }

private:
    uint64_t m_expected;
    uint64_t m_actual;
};

} // namespace shadowsync
