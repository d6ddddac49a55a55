#ifndef CERTAUTH_CERT_CERT_KEYS_HEADER
#define CERTAUTH_CERT_CERT_KEYS_HEADER

#include "certificate.hpp"

#include "certauth/core/ssh_public_key.hpp"

namespace certauth {

/// plain public key blob of the certified key (plain algorithm name followed by the key material)
byte_vector certified_public_key_blob(ssh_certificate const&);

/// the certified key, invalid key if it is not supported
ssh_public_key load_certified_public_key(ssh_certificate const&, crypto_context const&, crypto_call_context const&);

/// the certificate authority key that signed the certificate
ssh_public_key load_ca_public_key(ssh_certificate const&, crypto_context const&, crypto_call_context const&);

/// sha256 fingerprint of the certificate authority key ("SHA256:<base64>"), empty on failure
std::string ca_fingerprint(ssh_certificate const&, crypto_context const&, crypto_call_context const&);

/** \brief Verify the certificate authority signature
 *
 *  The signature is over all bytes of the certificate blob preceding the signature field, the blob
 *  must be the one the certificate was decoded from.
 */
bool verify_certificate_signature(const_span blob, ssh_certificate const&, crypto_context const&, crypto_call_context const&);

}

#endif
