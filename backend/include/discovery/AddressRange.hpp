#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace tvlink {

/**
 * @brief Inclusive IPv4 address range, iterated in ascending order.
 *
 * A range whose first address is above its last is empty.
 */
class AddressRange {
public:
    static constexpr std::size_t kMaxHosts = 65536;

    AddressRange() = default;
    // Throws std::runtime_error on unparsable addresses or more than kMaxHosts entries.
    AddressRange(const std::string& first, const std::string& last);

    // "192.168.1" + host numbers 10..12 -> 192.168.1.10 - 192.168.1.12
    static AddressRange from_subnet(const std::string& prefix, int first_host, int last_host);

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    std::string at(std::size_t index) const;

    std::string first() const;
    std::string last() const;

private:
    uint32_t first_ = 0;
    std::size_t size_ = 0;
};

} // namespace tvlink
