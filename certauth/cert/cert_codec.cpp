#include "cert_codec.hpp"

#include "certauth/common/logger.hpp"
#include "certauth/core/ssh_binary_util.hpp"

namespace certauth {

namespace {

cert_error truncated(std::string_view field) {
	return cert_error(cert_errc::invalid_certificate, "Invalid certificate: truncated " + std::string(field));
}

bool read_bytes(ssh_bf_reader& r, byte_vector& out) {
	std::string_view v;
	bool ret = r.read(v);
	if(ret) {
		out = to_byte_vector(v);
	}
	return ret;
}

bool read_string(ssh_bf_reader& r, std::string& out) {
	std::string_view v;
	bool ret = r.read(v);
	if(ret) {
		out = v;
	}
	return ret;
}

// skip the fields of public key, returns the span of the skipped bytes
std::optional<const_span> read_key_material(ssh_bf_reader& r, cert_key_family family) {
	const_span start = r.rest_of_span();
	std::size_t const count = key_field_count(family);
	for(std::size_t i = 0; i != count; ++i) {
		std::string_view field;
		if(!r.read(field)) {
			return std::nullopt;
		}
	}
	return start.subspan(0, start.size() - r.size_left());
}

cert_error read_principals(std::string_view data, std::vector<std::string>& out) {
	ssh_bf_reader r(to_span(data));
	while(r.size_left()) {
		std::string_view p;
		if(!r.read(p)) {
			return truncated("principal");
		}
		out.emplace_back(p);
	}
	return {};
}

cert_error read_options(std::string_view data, cert_option_map& out, std::string_view field) {
	ssh_bf_reader r(to_span(data));
	while(r.size_left()) {
		std::string_view name, value;
		if(!r.read(name) || !r.read(value)) {
			return truncated(field);
		}
		// later entry with the same name replaces the earlier one
		out.insert_or_assign(std::string(name), to_byte_vector(value));
	}
	return {};
}

}

cert_result<ssh_certificate> decode_certificate(const_span data, logger& log) {
	ssh_bf_reader r(data);
	ssh_certificate cert;

	if(!read_string(r, cert.algorithm)) {
		return truncated("algorithm");
	}

	auto family = key_family_from_algorithm(cert.algorithm);
	if(!family) {
		log.log(logger::debug, "Unsupported certificate type: {}", cert.algorithm);
		return cert_error(cert_errc::unsupported_key_type, "Unsupported certificate type: " + cert.algorithm);
	}

	if(!read_bytes(r, cert.nonce)) {
		return truncated("nonce");
	}

	auto key = read_key_material(r, *family);
	if(!key) {
		return truncated("public key");
	}
	cert.key_material = to_byte_vector(*key);

	if(!r.read(cert.serial)) {
		return truncated("serial");
	}

	if(!r.read(cert.raw_type)) {
		return truncated("type");
	}
	cert.type = to_cert_type(cert.raw_type);

	if(!read_string(r, cert.key_id)) {
		return truncated("key id");
	}

	std::string_view principals;
	if(!r.read(principals)) {
		return truncated("principals");
	}
	if(auto err = read_principals(principals, cert.principals)) {
		return err;
	}

	if(!r.read(cert.valid_after)) {
		return truncated("valid after");
	}

	if(!r.read(cert.valid_before)) {
		return truncated("valid before");
	}

	std::string_view options;
	if(!r.read(options)) {
		return truncated("critical options");
	}
	if(auto err = read_options(options, cert.critical_options, "critical option")) {
		return err;
	}

	std::string_view extensions;
	if(!r.read(extensions)) {
		return truncated("extensions");
	}
	if(auto err = read_options(extensions, cert.extensions, "extension")) {
		return err;
	}

	if(!read_bytes(r, cert.reserved)) {
		return truncated("reserved");
	}

	if(!read_bytes(r, cert.signature_key)) {
		return truncated("signature key");
	}

	if(!read_bytes(r, cert.signature)) {
		return truncated("signature");
	}

	if(r.size_left()) {
		log.log(logger::debug, "Ignoring {} bytes after certificate signature", r.size_left());
	}

	log.log(logger::debug_trace, "Decoded {} certificate [key id={}, serial={}]", to_string(cert.type), cert.key_id, cert.serial);

	return cert;
}

cert_result<ssh_certificate> decode_certificate(const_span data) {
	stdout_logger quiet(logger::log_none);
	return decode_certificate(data, quiet);
}

static byte_vector encode_options(cert_option_map const& m) {
	byte_vector res;
	ssh_bf_writer w(res);
	for(auto&& [name, value] : m) {
		w.write(std::string_view(name));
		w.write(to_string_view(value));
	}
	return res;
}

static std::uint32_t encoded_type(ssh_certificate const& cert) {
	if(cert.type == cert_type::user) return cert_type_user;
	if(cert.type == cert_type::host) return cert_type_host;
	return cert.raw_type;
}

byte_vector encode_certificate(ssh_certificate const& cert) {
	byte_vector principals;
	ssh_bf_writer pw(principals);
	for(auto&& p : cert.principals) {
		pw.write(std::string_view(p));
	}

	byte_vector res;
	ssh_bf_writer w(res);
	w.write(std::string_view(cert.algorithm));
	w.write(to_string_view(cert.nonce));
	w.write(const_span(cert.key_material));
	w.write(cert.serial);
	w.write(encoded_type(cert));
	w.write(std::string_view(cert.key_id));
	w.write(to_string_view(principals));
	w.write(cert.valid_after);
	w.write(cert.valid_before);
	w.write(to_string_view(encode_options(cert.critical_options)));
	w.write(to_string_view(encode_options(cert.extensions)));
	w.write(to_string_view(cert.reserved));
	w.write(to_string_view(cert.signature_key));
	w.write(to_string_view(cert.signature));
	return res;
}

}
