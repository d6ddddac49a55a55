#ifndef CERTAUTH_CORE_SSH_KEY_HEADER
#define CERTAUTH_CORE_SSH_KEY_HEADER

#include "base_key.hpp"
#include "ssh_private_key.hpp"
#include "ssh_public_key.hpp"

#include <memory>

namespace certauth {

/// base_key over the ssh keys, either with private key or only public key (verify only)
class ssh_key : public base_key {
public:
	ssh_key(ssh_private_key);
	ssh_key(ssh_public_key, std::string comment = "");

	bool valid() const;

	key_type type() const override;
	std::string comment() const override;
	bool is_private_key() const override;

	byte_vector sign(const_span data, std::string_view algorithm) const override;
	bool verify(const_span data, const_span signature, std::string_view algorithm) const override;
	byte_vector public_ssh(std::string_view algorithm) const override;
	std::optional<std::string> public_pem() const override;

	ssh_public_key const& public_key() const { return public_; }

private:
	ssh_private_key private_;
	ssh_public_key public_;
	std::string comment_;
};

// nullptr if the key is not valid
std::shared_ptr<base_key const> make_ssh_key(ssh_private_key);
std::shared_ptr<base_key const> make_ssh_key(ssh_public_key, std::string comment = "");

// resolve algorithm name for the key type, unknown if not usable with it
signature_type signature_type_for(key_type, std::string_view algorithm);

}

#endif
