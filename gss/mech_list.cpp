#include "mech_list.hpp"

#include "../encoding/der.hpp"
#include "../errors/error.hpp"

#include <openssl/objects.h>

#include <string>

namespace krbmic {

namespace {

void push_oid(ASN1_SEQUENCE_ANY *list, const char *oid) {
    ASN1_OBJECT *obj = OBJ_txt2obj(oid, 1);
    if (!obj) {
        throw Error(ErrorKind::EncodingFailure, std::string("OBJ_txt2obj failed for ") + oid);
    }

    ASN1_TYPE *type = ASN1_TYPE_new();
    if (!type) {
        ASN1_OBJECT_free(obj);
        throw Error(ErrorKind::EncodingFailure, "ASN1_TYPE_new failed");
    }
    // type takes ownership of obj
    ASN1_TYPE_set(type, V_ASN1_OBJECT, obj);

    if (sk_ASN1_TYPE_push(list, type) <= 0) {
        ASN1_TYPE_free(type);
        throw Error(ErrorKind::EncodingFailure, "sk_ASN1_TYPE_push failed");
    }
}

} // namespace

void MechTypeListDeleter::operator()(ASN1_SEQUENCE_ANY *list) const {
    sk_ASN1_TYPE_pop_free(list, ASN1_TYPE_free);
}

MechTypeListPtr make_mech_list() {
    MechTypeListPtr list(sk_ASN1_TYPE_new_null());
    if (!list) {
        throw Error(ErrorKind::EncodingFailure, "sk_ASN1_TYPE_new_null failed");
    }

    push_oid(list.get(), OID_MS_KRB5);
    push_oid(list.get(), OID_KRB5);
    return list;
}

std::vector<std::uint8_t> encode_mech_list() {
    MechTypeListPtr list = make_mech_list();
    return der_encode<ASN1_SEQUENCE_ANY>(list.get(), i2d_ASN1_SEQUENCE_ANY);
}

} // namespace krbmic
