#include "cert_auth_config.hpp"

#include "certauth/cert/cert_keys.hpp"
#include "certauth/core/ssh_key.hpp"
#include "certauth/core/ssh_private_key.hpp"

namespace certauth {

cert_result<certified_key> load_client_cert_key(cert_auth_config const& config, crypto_context const& crypto, crypto_call_context const& call) {
	ssh_private_key priv = load_ssh_private_key(std::string_view(config.private_key), crypto, call);
	if(!priv.valid()) {
		call.log.log(logger::error, "Failed to load private key for certificate authentication");
		return cert_error(cert_errc::invalid_key, "Failed to load private key");
	}

	auto cert = to_certificate_blob(config.certificate);
	if(!cert) {
		call.log.log(logger::error, "Failed to parse certificate: {}", cert.error().message());
		return cert.error();
	}

	auto res = make_certified_key(make_ssh_key(std::move(priv)), *cert);
	if(!res) {
		call.log.log(logger::error, "Failed to load certificate: {}", res.error().message());
		return res;
	}

	// the certificate must certify the key we sign with
	if(certified_public_key_blob(res->certificate()) != res->base().public_ssh({})) {
		call.log.log(logger::error, "Certificate is not for the private key [key id={}]", res->certificate().key_id);
		return cert_error(cert_errc::invalid_key, "Certificate does not match the private key");
	}

	call.log.log(logger::debug, "Loaded certificate [key id={}, serial={}]", res->certificate().key_id, res->certificate().serial);
	return res;
}

}
