#ifndef CERTAUTH_CORE_BASE_KEY_HEADER
#define CERTAUTH_CORE_BASE_KEY_HEADER

#include "certauth/common/types.hpp"
#include "certauth/crypto/ids.hpp"

#include <optional>
#include <string>

namespace certauth {

/** \brief Key used in public key authentication
 *
 *  The algorithm argument is ssh signature algorithm name (e.g. "rsa-sha2-256"),
 *  empty selects the algorithm that has the same name as the key type.
 */
class base_key {
public:
	virtual ~base_key() = default;

	virtual key_type type() const = 0;
	virtual std::string comment() const = 0;

	/// can the key be used to sign
	virtual bool is_private_key() const = 0;

	/// ssh encoded signature (string algorithm, string signature), empty on failure
	virtual byte_vector sign(const_span data, std::string_view algorithm) const = 0;

	/// verify ssh encoded signature, if algorithm is given the signature must be made with it
	virtual bool verify(const_span data, const_span signature, std::string_view algorithm) const = 0;

	/// public key blob as sent in public key authentication
	virtual byte_vector public_ssh(std::string_view algorithm) const = 0;

	/// PEM encoded public key, not all key types support it
	virtual std::optional<std::string> public_pem() const = 0;
};

}

#endif
