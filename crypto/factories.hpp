#pragma once

#include "interfaces.hpp"

namespace krbmic {

// OpenSSL-backed hmac-sha1-96-aes128 / hmac-sha1-96-aes256 (RFC 3962).
std::unique_ptr<ChecksumProvider> make_aes_sha1_checksum_provider();

} // namespace krbmic
