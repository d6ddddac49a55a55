#include "client_cert_auth.hpp"
#include "auth_protocol.hpp"

#include "certauth/common/logger.hpp"
#include "certauth/core/ssh_binary_util.hpp"

namespace certauth {

byte_vector make_cert_userauth_request(const_span session_id, std::string_view username, std::string_view service,
	certified_key const& key, std::string_view signature_algorithm, logger& log)
{
	log.log(logger::debug_trace, "creating certificate auth request [username={}, service={}]", username, service);

	if(!key.is_private_key()) {
		log.log(logger::error, "Certificate auth requires private key");
		return {};
	}

	auto const& cert = key.certificate();
	std::string pk_alg = cert_request_algorithm(cert.algorithm, signature_algorithm);

	byte_vector req = serialise_userauth_pk_request(username, service, true, pk_alg, key.certificate_blob());

	auto sig = key.sign(pk_signature_data(session_id, req), signature_algorithm);
	if(sig.empty()) {
		log.log(logger::error, "Failed to sign certificate auth request [algorithm={}]", pk_alg);
		return {};
	}

	// write the signature at the end of the request
	ssh_bf_writer w(req, req.size());
	w.write(to_string_view(sig));

	log.log(logger::debug, "Certificate auth request [algorithm={}, key id={}, serial={}]", pk_alg, cert.key_id, cert.serial);
	return req;
}

byte_vector make_cert_userauth_query(std::string_view username, std::string_view service,
	certified_key const& key, std::string_view signature_algorithm)
{
	auto const& cert = key.certificate();
	return serialise_userauth_pk_request(username, service, false,
		cert_request_algorithm(cert.algorithm, signature_algorithm), key.certificate_blob());
}

}
