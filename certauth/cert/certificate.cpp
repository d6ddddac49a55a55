#include "certificate.hpp"

namespace certauth {

std::string_view to_string(cert_type t) {
	using enum cert_type;
	if(t == user) return "user";
	if(t == host) return "host";
	return "unknown";
}

cert_type to_cert_type(std::uint32_t raw) {
	if(raw == cert_type_user) return cert_type::user;
	if(raw == cert_type_host) return cert_type::host;
	return cert_type::unknown;
}

std::string_view to_string(cert_key_family f) {
	switch(f) {
		case cert_key_family::rsa: return "rsa";
		case cert_key_family::ecdsa: return "ecdsa";
		case cert_key_family::ed25519: return "ed25519";
		case cert_key_family::dss: return "dss";
	}
	return "unknown";
}

std::size_t key_field_count(cert_key_family f) {
	switch(f) {
		case cert_key_family::rsa: return 2;
		case cert_key_family::ecdsa: return 2;
		case cert_key_family::ed25519: return 1;
		case cert_key_family::dss: return 4;
	}
	return 0;
}

std::optional<cert_key_family> key_family_from_algorithm(std::string_view alg) {
	if(alg.starts_with("ssh-rsa")) return cert_key_family::rsa;
	if(alg.starts_with("ecdsa-sha2-nistp")) return cert_key_family::ecdsa;
	if(alg.starts_with("ssh-ed25519")) return cert_key_family::ed25519;
	if(alg.starts_with("ssh-dss")) return cert_key_family::dss;
	return std::nullopt;
}

std::string_view plain_key_algorithm(std::string_view cert_algorithm) {
	return cert_algorithm.substr(0, cert_algorithm.find("-cert-v"));
}

}
