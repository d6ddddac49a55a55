#include "cert_keys.hpp"

#include "certauth/core/ssh_binary_util.hpp"

#include <cstring>

namespace certauth {

byte_vector certified_public_key_blob(ssh_certificate const& cert) {
	byte_vector res;
	ssh_bf_writer w(res);
	w.write(plain_key_algorithm(cert.algorithm));
	w.write(const_span(cert.key_material));
	return res;
}

ssh_public_key load_certified_public_key(ssh_certificate const& cert, crypto_context const& crypto, crypto_call_context const& call) {
	auto key = load_ssh_public_key(certified_public_key_blob(cert), crypto, call);
	if(!key.valid()) {
		call.log.log(logger::debug, "Unable to load certified key of type {}", cert.algorithm);
	}
	return key;
}

ssh_public_key load_ca_public_key(ssh_certificate const& cert, crypto_context const& crypto, crypto_call_context const& call) {
	auto key = load_ssh_public_key(cert.signature_key, crypto, call);
	if(!key.valid()) {
		call.log.log(logger::debug, "Unable to load certificate authority key");
	}
	return key;
}

std::string ca_fingerprint(ssh_certificate const& cert, crypto_context const& crypto, crypto_call_context const& call) {
	std::string res;
	auto sha256 = crypto.construct_hash(hash_type::sha2_256, call);
	if(sha256) {
		sha256->process(cert.signature_key);
		res = "SHA256:" + encode_base64(sha256->digest());
	}
	return res;
}

bool verify_certificate_signature(const_span blob, ssh_certificate const& cert, crypto_context const& crypto, crypto_call_context const& call) {
	// the blob must end with the signature field
	std::size_t sig_field_size = 4 + cert.signature.size();
	if(blob.size() < sig_field_size) {
		call.log.log(logger::debug, "Certificate data too small for signature");
		return false;
	}

	std::size_t signed_size = blob.size() - sig_field_size;
	ssh_bf_reader r(blob.subspan(signed_size));
	std::string_view sig;
	if(!r.read(sig) || r.size_left() || sig.size() != cert.signature.size()
		|| (!sig.empty() && std::memcmp(sig.data(), cert.signature.data(), sig.size()) != 0))
	{
		call.log.log(logger::debug, "Certificate data does not end with the signature");
		return false;
	}

	auto ca = load_ca_public_key(cert, crypto, call);
	if(!ca.valid()) {
		return false;
	}

	bool res = ca.verify(blob.subspan(0, signed_size), cert.signature);
	if(!res) {
		call.log.log(logger::info, "Certificate signature verification failed [key id={}]", cert.key_id);
	}
	return res;
}

}
