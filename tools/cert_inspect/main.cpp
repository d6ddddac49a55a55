#include "tools/common/command_parser.hpp"
#include "tools/common/util.hpp"

#include "certauth/auth/cert_auth_config.hpp"
#include "certauth/cert/cert_codec.hpp"
#include "certauth/cert/cert_keys.hpp"
#include "certauth/cert/cert_text.hpp"
#include "certauth/cert/cert_validator.hpp"
#include "certauth/cert/certified_key.hpp"
#include "certauth/cert/format_sniffer.hpp"
#include "certauth/common/logger.hpp"
#include "certauth/common/util.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace certauth {

struct inspect_commands : command_parser {
	bool help{};
	bool verbose{};
	std::string file;
	std::optional<std::string> user;
	std::optional<std::uint64_t> now;
	bool check_host_principals{};
	std::vector<std::string> trusted_ca;
	std::string private_key;

	inspect_commands() {
		add(help, "help", "h", "show help");
		add(verbose, "verbose", "v", "verbose logging");
		add(file, "file", "f", "certificate file, either openssh public key line or binary");
		add(user, "user", "u", "validate the certificate for the user name");
		add(now, "now", "", "unix time used for validation instead of current time");
		add(check_host_principals, "check-host-principals", "", "check principals also for host certificates");
		add(trusted_ca, "trusted-ca", "ca", "trusted certificate authority fingerprints (SHA256:...)");
		add(private_key, "key", "k", "openssh private key file that the certificate must match");
	}
};

static byte_vector certificate_blob(std::string const& file) {
	byte_vector data = read_file(file);
	if(is_certificate(data)) {
		return data;
	}

	std::string_view text = to_string_view(data);
	auto blob = parse_certificate_text(text.substr(0, text.find('\n')));
	if(!blob) {
		throw std::runtime_error(blob.error().message());
	}
	return std::move(blob).value();
}

static std::string time_string(std::uint64_t t) {
	if(t == 0) {
		return "always";
	}
	if(t == cert_valid_forever) {
		return "forever";
	}
	return std::to_string(t);
}

static void print_options(std::ostream& out, std::string_view title, cert_option_map const& m) {
	out << title << ":";
	if(m.empty()) {
		out << " (none)";
	}
	out << "\n";
	for(auto&& [name, value] : m) {
		out << "        " << name;
		if(!value.empty()) {
			out << " " << const_span(value);
		}
		out << "\n";
	}
}

static void print_certificate(std::ostream& out, ssh_certificate const& cert, std::string const& ca_fp, bool signature_ok) {
	out << "        Type: " << cert.algorithm << " " << to_string(cert.type) << " certificate\n";
	out << "        Key ID: \"" << cert.key_id << "\"\n";
	out << "        Serial: " << cert.serial << "\n";
	out << "        Valid: from " << time_string(cert.valid_after) << " to " << time_string(cert.valid_before) << "\n";
	out << "        Principals:";
	if(cert.principals.empty()) {
		out << " (none)";
	}
	out << "\n";
	for(auto&& p : cert.principals) {
		out << "                " << p << "\n";
	}
	out << "        Signing CA: " << ca_fp << " (signature " << (signature_ok ? "valid" : "INVALID") << ")\n";
	print_options(out, "        Critical Options", cert.critical_options);
	print_options(out, "        Extensions", cert.extensions);
}

static int run(inspect_commands const& cmd) {
	stdout_logger log(cmd.verbose ? logger::log_all : logger::error);
	crypto_context crypto = default_crypto_context();
	auto rand = crypto.construct_random();
	if(!rand) {
		throw std::runtime_error("failed to create random generator");
	}
	crypto_call_context call{log, *rand};

	std::string file = cmd.file;
	if(file.empty() && !cmd.positionals().empty()) {
		file = cmd.positionals().front();
	}
	if(file.empty()) {
		throw invalid_argument("certificate file not given");
	}

	byte_vector blob = certificate_blob(file);
	auto cert = decode_certificate(blob, log);
	if(!cert) {
		std::cerr << file << ": " << cert.error().message() << "\n";
		return 1;
	}

	std::string ca_fp = ca_fingerprint(*cert, crypto, call);
	bool signature_ok = verify_certificate_signature(blob, *cert, crypto, call);

	std::cout << file << ":\n";
	print_certificate(std::cout, *cert, ca_fp, signature_ok);

	int ret = signature_ok ? 0 : 2;

	if(!cmd.trusted_ca.empty()) {
		if(std::find(cmd.trusted_ca.begin(), cmd.trusted_ca.end(), ca_fp) == cmd.trusted_ca.end()) {
			std::cout << "Certificate authority not trusted: " << ca_fp << "\n";
			ret = 2;
		}
	}

	if(!cmd.private_key.empty()) {
		cert_auth_config config;
		config.private_key = read_text_file(cmd.private_key);
		config.certificate = blob;
		auto key = load_client_cert_key(config, crypto, call);
		if(key) {
			std::cout << "Certificate matches private key\n";
		} else {
			std::cout << "Certificate does not match private key: " << key.error().message() << "\n";
			ret = 2;
		}
	}

	if(cmd.user) {
		validation_policy policy;
		policy.check_host_principals = cmd.check_host_principals;
		auto verdict = validate_certificate(*cert, *cmd.user, cmd.now.value_or(current_unix_time()), policy);
		if(verdict) {
			std::cout << "Certificate is valid for \"" << *cmd.user << "\"\n";
		} else {
			std::cout << "Certificate is not valid: " << verdict.reason.value_or("") << "\n";
			ret = 2;
		}
	}

	return ret;
}

}

int main(int argc, char* argv[]) {
	try {
		using namespace certauth;
		inspect_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "certauth certificate inspector\n";
			std::cout << "usage: cert_inspect [options] <certificate file>\n";
			inspect_commands().print_help(std::cout);
			return 0;
		}
		return run(p);
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 1;
	}
}
