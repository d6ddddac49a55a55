#ifndef CERTAUTH_CORE_KEYS_PEM_HEADER
#define CERTAUTH_CORE_KEYS_PEM_HEADER

#include "certauth/common/types.hpp"
#include <optional>
#include <string>

namespace certauth {

class public_key;

/// DER encoded SubjectPublicKeyInfo (rfc5280), empty if the key type is not supported
byte_vector public_key_spki(public_key const&);

/// PEM encoded SubjectPublicKeyInfo ("-----BEGIN PUBLIC KEY-----"), nullopt if the key type is not supported
std::optional<std::string> public_key_pem(public_key const&);

/// wrap DER data to PEM with given label, base64 in 64 char lines
std::string to_pem(std::string_view label, const_span der);

}

#endif
