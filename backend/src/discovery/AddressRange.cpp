#include "discovery/AddressRange.hpp"
#include "core/ErrorCatalog.hpp"

#include <stdexcept>
#include <boost/asio/ip/address_v4.hpp>

namespace asio = boost::asio;

namespace tvlink {

namespace {

uint32_t parse_v4(const std::string& text) {
    boost::system::error_code ec;
    auto addr = asio::ip::make_address_v4(text, ec);
    if (ec) throw std::runtime_error(std::string(errors::D3400_INVALID_RANGE) + ": " + text);
    return addr.to_uint();
}

} // namespace

AddressRange::AddressRange(const std::string& first, const std::string& last) {
    const uint32_t a = parse_v4(first);
    const uint32_t b = parse_v4(last);
    first_ = a;
    if (a > b) {
        size_ = 0;
        return;
    }
    const uint64_t count = static_cast<uint64_t>(b) - static_cast<uint64_t>(a) + 1;
    if (count > kMaxHosts) throw std::runtime_error(errors::D3400_RANGE_TOO_LARGE);
    size_ = static_cast<std::size_t>(count);
}

AddressRange AddressRange::from_subnet(const std::string& prefix, int first_host, int last_host) {
    if (first_host < 0 || first_host > 255 || last_host < 0 || last_host > 255) {
        throw std::runtime_error(std::string(errors::D3400_INVALID_RANGE) + ": host numbers must be 0-255");
    }
    return AddressRange(prefix + "." + std::to_string(first_host), prefix + "." + std::to_string(last_host));
}

std::string AddressRange::at(std::size_t index) const {
    if (index >= size_) throw std::out_of_range("AddressRange::at");
    return asio::ip::address_v4(first_ + static_cast<uint32_t>(index)).to_string();
}

std::string AddressRange::first() const {
    return asio::ip::address_v4(first_).to_string();
}

std::string AddressRange::last() const {
    if (size_ == 0) return first();
    return asio::ip::address_v4(first_ + static_cast<uint32_t>(size_ - 1)).to_string();
}

} // namespace tvlink
