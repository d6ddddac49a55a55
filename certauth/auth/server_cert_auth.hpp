#ifndef CERTAUTH_AUTH_SERVER_CERT_AUTH_HEADER
#define CERTAUTH_AUTH_SERVER_CERT_AUTH_HEADER

#include "cert_auth_config.hpp"

#include "certauth/cert/certificate.hpp"
#include "certauth/cert/cert_validator.hpp"
#include "certauth/core/ssh_public_key.hpp"
#include "certauth/crypto/crypto_context.hpp"

#include <optional>

namespace certauth {

enum class cert_auth_state {
	// not publickey request with certificate, some other authenticator should handle it
	not_applicable,
	failed,
	succeeded
};

std::string_view to_string(cert_auth_state);

struct cert_auth_result {
	cert_auth_state state{};
	// the reason for failure
	std::string reason;
	// true if this was query without signature
	bool query{};
	// the decoded certificate if it could be decoded
	std::optional<ssh_certificate> certificate;
};

/** \brief Authorise publickey requests that carry openssh certificate
 *
 *  The certificate must be user certificate signed by trusted certificate authority and valid for the
 *  requested user, and the request signature must be made by the certified key.
 *  Malformed requests and certificates only fail the attempt.
 */
class server_cert_auth {
public:
	server_cert_auth(server_cert_auth_config, crypto_context const&, crypto_call_context const&);
	virtual ~server_cert_auth() = default;

	/// payload is the SSH_MSG_USERAUTH_REQUEST including the message type
	cert_auth_result authenticate(const_span session_id, const_span payload, std::uint64_t now);
	cert_auth_result authenticate(const_span session_id, const_span payload);

	server_cert_auth_config const& config() const { return config_; }

protected:
	/// is the key allowed to sign user certificates, by default the fingerprint must be in the config
	virtual bool trusted_ca(ssh_certificate const&, std::string_view ca_fingerprint) const;

private:
	cert_auth_result fail(std::string reason, std::optional<ssh_certificate> cert = std::nullopt) const;

private:
	server_cert_auth_config config_;
	crypto_context const& crypto_;
	crypto_call_context const& call_;
};

}

#endif
