#ifndef CERTAUTH_CORE_SSH_PUBLIC_KEY_HEADER
#define CERTAUTH_CORE_SSH_PUBLIC_KEY_HEADER

#include "certauth/crypto/crypto_context.hpp"
#include "certauth/crypto/public_key.hpp"
#include <memory>
#include <optional>

namespace certauth {

class binout;

/** \brief SSH Public Key that is used for signature checking
 */
class ssh_public_key {
public:
	ssh_public_key() = default;
	ssh_public_key(std::shared_ptr<public_key>);

	key_type type() const;
	bool valid() const;

	// signature needs to be ssh encoded signature, the signature algorithm must be usable with the key type
	bool verify(const_span msg, const_span signature) const;

	bool serialise(binout&) const;

	// sha256 fingerprint with base64 encoding
	std::string fingerprint(crypto_context const& crypto, crypto_call_context const& call) const;

	// SubjectPublicKeyInfo in PEM encoding
	std::optional<std::string> pem() const;

	std::shared_ptr<public_key> const& impl() const { return key_impl_; }

private:
	std::shared_ptr<public_key> key_impl_;
};

ssh_public_key load_ssh_public_key(const_span data, crypto_context const&, crypto_call_context const&);
ssh_public_key load_base64_ssh_public_key(std::string_view data, crypto_context const&, crypto_call_context const&);

byte_vector to_byte_vector(ssh_public_key const&);

/// decoded ssh signature blob: string algorithm, string signature
struct ssh_signature {
	signature_type type{};
	std::string_view algorithm;
	const_span payload;
};

std::optional<ssh_signature> parse_ssh_signature(const_span);

}

#endif
