#ifndef CERTAUTH_CERT_CERTIFICATE_HEADER
#define CERTAUTH_CERT_CERTIFICATE_HEADER

#include "certauth/common/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace certauth {

std::uint32_t const cert_type_user = 1;
std::uint32_t const cert_type_host = 2;

// the max size of the certificate algorithm identifier that is considered when sniffing
std::size_t const max_cert_algorithm_size = 64;

std::uint64_t const cert_valid_forever = 0xFFFFFFFFFFFFFFFF;

enum class cert_type {
	unknown = 0,
	user,
	host
};

std::string_view to_string(cert_type);
cert_type to_cert_type(std::uint32_t raw);

/// public key algorithm families that can be certified, each has fixed number of key material fields
enum class cert_key_family {
	rsa,      // e, n
	ecdsa,    // curve, point
	ed25519,  // public key
	dss       // p, q, g, y
};

std::string_view to_string(cert_key_family);

// number of length prefixed fields the public key material has in the certificate
std::size_t key_field_count(cert_key_family);

// family by the certificate algorithm identifier (e.g. "ssh-rsa-cert-v01@openssh.com"), nullopt if not supported
std::optional<cert_key_family> key_family_from_algorithm(std::string_view);

/// name -> data, used for both critical options and extensions
using cert_option_map = std::map<std::string, byte_vector, std::less<>>;

/// decoded openssh certificate (PROTOCOL.certkeys)
struct ssh_certificate {
	std::string algorithm;
	byte_vector nonce;
	// the key material fields as they were in the certificate (including length prefixes)
	byte_vector key_material;
	std::uint64_t serial{};
	cert_type type{};
	std::uint32_t raw_type{};
	std::string key_id;
	// empty means valid for any principal
	std::vector<std::string> principals;
	std::uint64_t valid_after{};
	std::uint64_t valid_before{};
	cert_option_map critical_options;
	cert_option_map extensions;
	byte_vector reserved;
	// CA public key blob
	byte_vector signature_key;
	// CA signature blob over the certificate
	byte_vector signature;

	bool operator==(ssh_certificate const&) const = default;
};

// the plain key algorithm of certificate algorithm, e.g. "ssh-ed25519" for "ssh-ed25519-cert-v01@openssh.com"
std::string_view plain_key_algorithm(std::string_view cert_algorithm);

}

#endif
