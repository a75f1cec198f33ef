#pragma once

#include <openssl/asn1.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace krbmic {

constexpr const char *OID_MS_KRB5 = "1.2.840.48018.1.2.2";
constexpr const char *OID_KRB5 = "1.2.840.113554.1.2.2";

struct MechTypeListDeleter {
    void operator()(ASN1_SEQUENCE_ANY *list) const;
};

// SPNEGO MechTypeList ::= SEQUENCE OF MechType (OBJECT IDENTIFIER)
using MechTypeListPtr = std::unique_ptr<ASN1_SEQUENCE_ANY, MechTypeListDeleter>;

// The list offered during negotiation: MS Kerberos, then Kerberos V5.
MechTypeListPtr make_mech_list();

// DER encoding of make_mech_list(). Binds every MIC to the negotiated
// mechanism set.
std::vector<std::uint8_t> encode_mech_list();

} // namespace krbmic
