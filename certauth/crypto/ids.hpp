#ifndef CERTAUTH_CRYPTO_IDS_HEADER
#define CERTAUTH_CRYPTO_IDS_HEADER

#include "certauth/common/types.hpp"
#include <string_view>

namespace certauth {

enum class key_type {
	unknown = 0,
	ssh_rsa,
	ssh_dss,
	ssh_ed25519,
	ecdsa_sha2_nistp256,
	ecdsa_sha2_nistp384,
	ecdsa_sha2_nistp521
};

std::size_t const ed25519_key_size = 32;

std::string_view to_string(key_type);
key_type from_string(type_tag<key_type>, std::string_view);

bool is_ecdsa(key_type);

// this will give the curve name only for ecdsa types, otherwise empty
std::string_view to_curve_name(key_type);

// size of single coordinate of the curve point in bytes, 0 for non-ecdsa types
std::size_t ecdsa_coordinate_size(key_type);

enum class hash_type {
	unknown = 0,
	sha1,
	sha2_256,
	sha2_384,
	sha2_512
};

std::string_view to_string(hash_type);

/// signature algorithms, for rsa keys there are several
enum class signature_type {
	unknown = 0,
	ssh_rsa,
	rsa_sha2_256,
	rsa_sha2_512,
	ssh_dss,
	ssh_ed25519,
	ecdsa_sha2_nistp256,
	ecdsa_sha2_nistp384,
	ecdsa_sha2_nistp521
};

std::string_view to_string(signature_type);
signature_type from_string(type_tag<signature_type>, std::string_view);

// the key type that can produce the signature type
key_type to_key_type(signature_type);

// the hash that is applied to the message before signing, unknown for ed25519 which hashes internally
hash_type signature_hash(signature_type);

// signature type which has the same name as the key type
signature_type default_signature_type(key_type);

// check the signature type can be used with the key type
bool is_compatible(key_type, signature_type);

}

#endif
