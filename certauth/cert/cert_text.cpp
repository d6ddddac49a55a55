#include "cert_text.hpp"
#include "format_sniffer.hpp"

#include "certauth/common/util.hpp"
#include "certauth/core/ssh_binary_util.hpp"

namespace certauth {

static std::string_view trim(std::string_view s) {
	auto b = s.find_first_not_of(" \t\r\n");
	if(b == std::string_view::npos) {
		return {};
	}
	auto e = s.find_last_not_of(" \t\r\n");
	return s.substr(b, e-b+1);
}

static std::string_view next_token(std::string_view& s) {
	s = trim(s);
	auto p = s.find_first_of(" \t");
	std::string_view res = s.substr(0, p);
	s = p == std::string_view::npos ? std::string_view{} : s.substr(p);
	return res;
}

cert_result<byte_vector> parse_certificate_text(std::string_view text) {
	std::string_view rest = text;
	std::string_view type = next_token(rest);
	std::string_view data = next_token(rest);

	if(type.empty() || data.empty()) {
		return cert_error(cert_errc::not_a_certificate, "Certificate text must have type and data");
	}

	if(type.find("-cert-v") == std::string_view::npos) {
		return cert_error(cert_errc::not_a_certificate, "Not a certificate type: " + std::string(type));
	}

	byte_vector blob = decode_base64(data);
	if(blob.empty()) {
		return cert_error(cert_errc::invalid_certificate, "Invalid certificate: bad base64 data");
	}

	if(!is_certificate(blob)) {
		return cert_error(cert_errc::not_a_certificate, "Buffer does not appear to be a certificate");
	}

	ssh_bf_reader r(blob);
	std::string_view blob_type;
	if(!r.read(blob_type) || blob_type != type) {
		return cert_error(cert_errc::invalid_certificate, "Invalid certificate: type " + std::string(type)
			+ " does not match the data type " + std::string(blob_type));
	}

	return blob;
}

cert_result<certificate_data> to_certificate_blob(certificate_data const& d) {
	if(auto text = std::get_if<std::string>(&d)) {
		auto res = parse_certificate_text(*text);
		if(!res) {
			return res.error();
		}
		return certificate_data(std::move(res).value());
	}
	return d;
}

}
