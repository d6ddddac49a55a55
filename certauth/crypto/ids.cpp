#include "ids.hpp"

namespace certauth {

std::string_view to_string(key_type t) {
	using enum key_type;
	if(t == ssh_rsa) return "ssh-rsa";
	if(t == ssh_dss) return "ssh-dss";
	if(t == ssh_ed25519) return "ssh-ed25519";
	if(t == ecdsa_sha2_nistp256) return "ecdsa-sha2-nistp256";
	if(t == ecdsa_sha2_nistp384) return "ecdsa-sha2-nistp384";
	if(t == ecdsa_sha2_nistp521) return "ecdsa-sha2-nistp521";
	return "unknown";
}

key_type from_string(type_tag<key_type>, std::string_view s) {
	using enum key_type;
	if(s == "ssh-rsa") return ssh_rsa;
	if(s == "ssh-dss") return ssh_dss;
	if(s == "ssh-ed25519") return ssh_ed25519;
	if(s == "ecdsa-sha2-nistp256") return ecdsa_sha2_nistp256;
	if(s == "ecdsa-sha2-nistp384") return ecdsa_sha2_nistp384;
	if(s == "ecdsa-sha2-nistp521") return ecdsa_sha2_nistp521;
	return unknown;
}

bool is_ecdsa(key_type t) {
	using enum key_type;
	return t == ecdsa_sha2_nistp256 || t == ecdsa_sha2_nistp384 || t == ecdsa_sha2_nistp521;
}

std::string_view to_curve_name(key_type t) {
	using enum key_type;
	if(t == ecdsa_sha2_nistp256) return "nistp256";
	if(t == ecdsa_sha2_nistp384) return "nistp384";
	if(t == ecdsa_sha2_nistp521) return "nistp521";
	return "";
}

std::size_t ecdsa_coordinate_size(key_type t) {
	using enum key_type;
	if(t == ecdsa_sha2_nistp256) return 32;
	if(t == ecdsa_sha2_nistp384) return 48;
	if(t == ecdsa_sha2_nistp521) return 66;
	return 0;
}

std::string_view to_string(hash_type t) {
	using enum hash_type;
	if(t == sha1) return "sha1";
	if(t == sha2_256) return "sha2-256";
	if(t == sha2_384) return "sha2-384";
	if(t == sha2_512) return "sha2-512";
	return "unknown";
}

std::string_view to_string(signature_type t) {
	using enum signature_type;
	if(t == ssh_rsa) return "ssh-rsa";
	if(t == rsa_sha2_256) return "rsa-sha2-256";
	if(t == rsa_sha2_512) return "rsa-sha2-512";
	if(t == ssh_dss) return "ssh-dss";
	if(t == ssh_ed25519) return "ssh-ed25519";
	if(t == ecdsa_sha2_nistp256) return "ecdsa-sha2-nistp256";
	if(t == ecdsa_sha2_nistp384) return "ecdsa-sha2-nistp384";
	if(t == ecdsa_sha2_nistp521) return "ecdsa-sha2-nistp521";
	return "unknown";
}

signature_type from_string(type_tag<signature_type>, std::string_view s) {
	using enum signature_type;
	if(s == "ssh-rsa") return ssh_rsa;
	if(s == "rsa-sha2-256") return rsa_sha2_256;
	if(s == "rsa-sha2-512") return rsa_sha2_512;
	if(s == "ssh-dss") return ssh_dss;
	if(s == "ssh-ed25519") return ssh_ed25519;
	if(s == "ecdsa-sha2-nistp256") return ecdsa_sha2_nistp256;
	if(s == "ecdsa-sha2-nistp384") return ecdsa_sha2_nistp384;
	if(s == "ecdsa-sha2-nistp521") return ecdsa_sha2_nistp521;
	return unknown;
}

key_type to_key_type(signature_type t) {
	switch(t) {
		case signature_type::ssh_rsa:
		case signature_type::rsa_sha2_256:
		case signature_type::rsa_sha2_512: return key_type::ssh_rsa;
		case signature_type::ssh_dss: return key_type::ssh_dss;
		case signature_type::ssh_ed25519: return key_type::ssh_ed25519;
		case signature_type::ecdsa_sha2_nistp256: return key_type::ecdsa_sha2_nistp256;
		case signature_type::ecdsa_sha2_nistp384: return key_type::ecdsa_sha2_nistp384;
		case signature_type::ecdsa_sha2_nistp521: return key_type::ecdsa_sha2_nistp521;
		case signature_type::unknown: break;
	}
	return key_type::unknown;
}

hash_type signature_hash(signature_type t) {
	switch(t) {
		case signature_type::ssh_rsa:
		case signature_type::ssh_dss: return hash_type::sha1;
		case signature_type::rsa_sha2_256:
		case signature_type::ecdsa_sha2_nistp256: return hash_type::sha2_256;
		case signature_type::ecdsa_sha2_nistp384: return hash_type::sha2_384;
		case signature_type::rsa_sha2_512:
		case signature_type::ecdsa_sha2_nistp521: return hash_type::sha2_512;
		case signature_type::ssh_ed25519:
		case signature_type::unknown: break;
	}
	return hash_type::unknown;
}

signature_type default_signature_type(key_type t) {
	return from_string(type_tag<signature_type>{}, to_string(t));
}

bool is_compatible(key_type k, signature_type s) {
	return k != key_type::unknown && to_key_type(s) == k;
}

}
