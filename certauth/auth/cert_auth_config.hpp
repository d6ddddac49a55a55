#ifndef CERTAUTH_AUTH_CERT_AUTH_CONFIG_HEADER
#define CERTAUTH_AUTH_CERT_AUTH_CONFIG_HEADER

#include "auth_protocol.hpp"

#include "certauth/cert/cert_text.hpp"
#include "certauth/cert/cert_validator.hpp"
#include "certauth/cert/certified_key.hpp"
#include "certauth/crypto/crypto_context.hpp"

#include <string>
#include <vector>

namespace certauth {

/// client side certificate authentication settings
struct cert_auth_config {
	std::string username;
	std::string service{connection_service_name};

	// openssh private key file content
	std::string private_key;

	// certificate as binary or openssh public key file line
	certificate_data certificate;

	// signature algorithm, empty for the key type default
	std::string signature_algorithm;

	validation_policy policy;
};

/// server side certificate authentication settings
struct server_cert_auth_config {
	// "SHA256:<base64>" fingerprints of certificate authorities that are trusted to sign user certificates
	std::vector<std::string> trusted_ca_fingerprints;

	validation_policy policy;
};

/** \brief Load the private key and certificate of the config
 *
 *  The certificate text is converted to binary before combining it with the key.
 *  Failures are logged and returned, nothing is thrown.
 */
cert_result<certified_key> load_client_cert_key(cert_auth_config const&, crypto_context const&, crypto_call_context const&);

}

#endif
