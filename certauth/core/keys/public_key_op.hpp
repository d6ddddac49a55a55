#ifndef CERTAUTH_CORE_KEYS_PUBLIC_KEY_OP_HEADER
#define CERTAUTH_CORE_KEYS_PUBLIC_KEY_OP_HEADER

#include "certauth/common/types.hpp"
#include "certauth/crypto/ids.hpp"

#include <memory>

namespace certauth {

class ssh_bf_binout_writer;
class ssh_bf_reader;
class public_key;
struct crypto_context;
struct crypto_call_context;

// ssh encoded ecdsa signature (mpint r, mpint s) to fixed size r || s
byte_vector from_ecdsa_signature_blob(key_type, const_span payload);

/*
	ssh-ed25519:  string pubkey
	ssh-rsa:      mpint e, mpint n
	ecdsa-sha2-*: string curve, string Q
*/
bool write_public_key_fields(ssh_bf_binout_writer&, public_key const&);
std::shared_ptr<public_key> read_public_key_fields(ssh_bf_reader&, key_type, crypto_context const&, crypto_call_context const&);

}

#endif
