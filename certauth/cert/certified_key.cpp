#include "certified_key.hpp"
#include "cert_codec.hpp"
#include "format_sniffer.hpp"

namespace certauth {

certified_key::certified_key(std::shared_ptr<base_key const> base, ssh_certificate cert, byte_vector blob)
: base_(std::move(base))
, cert_(std::make_shared<ssh_certificate const>(std::move(cert)))
, blob_(std::move(blob))
{
	CERTAUTH_ASSERT(base_, "certified key requires base key");
}

key_type certified_key::type() const {
	return base_->type();
}

std::string certified_key::comment() const {
	return base_->comment();
}

bool certified_key::is_private_key() const {
	return base_->is_private_key();
}

byte_vector certified_key::sign(const_span data, std::string_view algorithm) const {
	return base_->sign(data, algorithm);
}

bool certified_key::verify(const_span data, const_span signature, std::string_view algorithm) const {
	return base_->verify(data, signature, algorithm);
}

byte_vector certified_key::public_ssh(std::string_view algorithm) const {
	return base_->public_ssh(algorithm);
}

std::optional<std::string> certified_key::public_pem() const {
	return base_->public_pem();
}

static cert_result<certified_key> make_from_blob(std::shared_ptr<base_key const> base, const_span data) {
	if(!is_certificate(data)) {
		return cert_error(cert_errc::not_a_certificate, "Buffer does not appear to be a certificate");
	}

	auto cert = decode_certificate(data);
	if(!cert) {
		return cert.error();
	}

	if(!base) {
		return cert_error(cert_errc::invalid_key, "Missing key for certificate");
	}

	return certified_key(std::move(base), std::move(cert).value(), to_byte_vector(data));
}

cert_result<certified_key> make_certified_key(std::shared_ptr<base_key const> base, certificate_data const& data) {
	auto blob = std::get_if<byte_vector>(&data);
	if(!blob) {
		return cert_error(cert_errc::not_a_buffer, "Certificate must be binary data");
	}
	return make_from_blob(std::move(base), *blob);
}

std::optional<byte_vector> extract_certificate_from_data(const_span data) {
	if(!is_certificate(data)) {
		return std::nullopt;
	}
	return to_byte_vector(data);
}

cert_load_result load_certificate(const_span data) {
	cert_load_result res;
	if(!is_certificate(data)) {
		res.status = cert_load_result::not_a_certificate;
		return res;
	}

	auto cert = decode_certificate(data);
	if(cert) {
		res.status = cert_load_result::ok;
		res.certificate = std::move(cert).value();
	} else {
		res.status = cert_load_result::invalid;
		res.error = cert.error();
	}
	return res;
}

}
