#include "server_cert_auth.hpp"
#include "auth_protocol.hpp"

#include "certauth/cert/cert_codec.hpp"
#include "certauth/cert/cert_keys.hpp"
#include "certauth/cert/format_sniffer.hpp"

#include <algorithm>

namespace certauth {

std::string_view to_string(cert_auth_state s) {
	using enum cert_auth_state;
	if(s == not_applicable) return "not applicable";
	if(s == failed) return "failed";
	if(s == succeeded) return "succeeded";
	return "unknown";
}

server_cert_auth::server_cert_auth(server_cert_auth_config c, crypto_context const& crypto, crypto_call_context const& call)
: config_(std::move(c))
, crypto_(crypto)
, call_(call)
{
}

bool server_cert_auth::trusted_ca(ssh_certificate const&, std::string_view ca_fingerprint) const {
	auto const& l = config_.trusted_ca_fingerprints;
	return std::find(l.begin(), l.end(), ca_fingerprint) != l.end();
}

cert_auth_result server_cert_auth::fail(std::string reason, std::optional<ssh_certificate> cert) const {
	call_.log.log(logger::info, "Certificate authentication failed: {}", reason);
	return cert_auth_result{cert_auth_state::failed, std::move(reason), false, std::move(cert)};
}

// the request algorithm must name the certificate algorithm, ssh-rsa certificates can use rsa-sha2 signatures
static bool algorithm_matches(std::string_view request_alg, ssh_certificate const& cert) {
	return request_alg == cert.algorithm
		|| cert_request_algorithm(cert.algorithm, cert_signature_algorithm(request_alg)) == request_alg;
}

cert_auth_result server_cert_auth::authenticate(const_span session_id, const_span payload, std::uint64_t now) {
	auto req = parse_userauth_pk_request(payload);
	if(!req) {
		call_.log.log(logger::debug, "Not a valid publickey request");
		return cert_auth_result{cert_auth_state::not_applicable, "Not a publickey request"};
	}

	auto blob = to_span(req->pk_blob);
	if(!is_certificate(blob)) {
		call_.log.log(logger::debug_trace, "Public key is not a certificate [algorithm={}]", req->pk_algorithm);
		return cert_auth_result{cert_auth_state::not_applicable, "Public key is not a certificate"};
	}

	auto decoded = decode_certificate(blob, call_.log);
	if(!decoded) {
		return fail(decoded.error().message());
	}
	ssh_certificate const& cert = decoded.value();

	if(!algorithm_matches(req->pk_algorithm, cert)) {
		return fail("Certificate algorithm mismatch: " + std::string(req->pk_algorithm), cert);
	}

	if(cert.type != cert_type::user) {
		return fail("Not a user certificate", cert);
	}

	if(!verify_certificate_signature(blob, cert, crypto_, call_)) {
		return fail("Certificate signature verification failed", cert);
	}

	std::string fp = ca_fingerprint(cert, crypto_, call_);
	if(!trusted_ca(cert, fp)) {
		return fail("Certificate authority not trusted: " + fp, cert);
	}

	auto verdict = validate_certificate(cert, req->user, now, config_.policy);
	if(!verdict) {
		return fail(verdict.reason.value_or("Certificate not valid"), cert);
	}

	if(!req->is_auth) {
		call_.log.log(logger::debug, "Certificate acceptable [user={}, key id={}]", req->user, cert.key_id);
		return cert_auth_result{cert_auth_state::succeeded, {}, true, cert};
	}

	auto key = load_certified_public_key(cert, crypto_, call_);
	if(!key.valid()) {
		return fail("Unsupported certified key: " + cert.algorithm, cert);
	}

	auto sig = parse_ssh_signature(to_span(req->signature));
	if(!sig || sig->algorithm != cert_signature_algorithm(req->pk_algorithm)) {
		return fail("Signature algorithm does not match the request", cert);
	}

	byte_vector signed_data = pk_signature_data(session_id, payload.subspan(0, req->signed_size));
	if(!key.verify(signed_data, to_span(req->signature))) {
		return fail("Verifying signature failed", cert);
	}

	call_.log.log(logger::info, "Certificate authentication succeeded [user={}, key id={}, serial={}, ca={}]",
		req->user, cert.key_id, cert.serial, fp);

	return cert_auth_result{cert_auth_state::succeeded, {}, false, cert};
}

cert_auth_result server_cert_auth::authenticate(const_span session_id, const_span payload) {
	return authenticate(session_id, payload, current_unix_time());
}

}
