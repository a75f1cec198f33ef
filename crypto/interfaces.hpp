#pragma once

#include "algorithms.hpp"

#include <memory>
#include <vector>

namespace krbmic {

class ChecksumProvider {
public:
    virtual ~ChecksumProvider() = default;

    virtual std::size_t checksum_size() const = 0;

    // Keyed checksum over data, with the usage-specific key derived from key.
    // key must be aes_key_length(strength) bytes long.
    virtual std::vector<std::uint8_t> checksum(
        const std::vector<std::uint8_t> &key,
        std::int32_t key_usage,
        const std::vector<std::uint8_t> &data,
        AesStrength strength) = 0;
};

} // namespace krbmic
