#include "auth_protocol.hpp"

#include "certauth/core/ssh_binary_util.hpp"
#include "certauth/cert/certificate.hpp"

namespace certauth {

std::optional<userauth_pk_request> parse_userauth_pk_request(const_span payload) {
	ssh_bf_reader r(payload);
	std::uint8_t type{};
	userauth_pk_request res;
	if(!r.read(type) || type != ssh_userauth_request
		|| !r.read(res.user)
		|| !r.read(res.service)
		|| !r.read(res.method)
		|| res.method != publickey_method_name
		|| !r.read(res.is_auth)
		|| !r.read(res.pk_algorithm)
		|| !r.read(res.pk_blob))
	{
		return std::nullopt;
	}

	res.signed_size = r.used_size();

	if(res.is_auth) {
		if(!r.read(res.signature)) {
			return std::nullopt;
		}
	}

	return res;
}

byte_vector serialise_userauth_pk_request(std::string_view user, std::string_view service, bool is_auth,
	std::string_view pk_algorithm, const_span pk_blob)
{
	byte_vector res;
	ssh_bf_writer w(res);
	w.write(ssh_userauth_request);
	w.write(user);
	w.write(service);
	w.write(publickey_method_name);
	w.write(is_auth);
	w.write(pk_algorithm);
	w.write(to_string_view(pk_blob));
	return res;
}

byte_vector pk_signature_data(const_span session_id, const_span request) {
	byte_vector res;
	res.reserve(4 + session_id.size() + request.size());
	byte_vector_binout out(res);
	ssh_bf_binout_writer w(out);
	w.write(to_string_view(session_id));
	w.write(request);
	return res;
}

std::string cert_request_algorithm(std::string_view cert_algorithm, std::string_view signature_algorithm) {
	if(cert_algorithm.starts_with("ssh-rsa-cert-v") && signature_algorithm.starts_with("rsa-sha2-")) {
		return std::string(signature_algorithm) + std::string(cert_algorithm.substr(std::string_view("ssh-rsa").size()));
	}
	return std::string(cert_algorithm);
}

std::string_view cert_signature_algorithm(std::string_view request_algorithm) {
	return plain_key_algorithm(request_algorithm);
}

}
