#include "cert_validator.hpp"

#include "certauth/common/util.hpp"

#include <algorithm>
#include <chrono>

namespace certauth {

std::uint64_t current_unix_time() {
	auto now = std::chrono::system_clock::now().time_since_epoch();
	return std::uint64_t(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

static validation_verdict invalid(std::string reason) {
	return validation_verdict{false, std::move(reason)};
}

validation_verdict validate_certificate(ssh_certificate const& cert, std::string_view username,
	std::uint64_t now, validation_policy const& policy)
{
	if(cert.valid_before != 0 && now >= cert.valid_before) {
		return invalid("Certificate has expired");
	}

	if(cert.valid_after != 0 && now < cert.valid_after) {
		return invalid("Certificate is not yet valid");
	}

	bool check_principals = cert.type == cert_type::user
		|| (cert.type == cert_type::host && policy.check_host_principals);

	if(check_principals && !cert.principals.empty()) {
		auto it = std::find(cert.principals.begin(), cert.principals.end(), username);
		if(it == cert.principals.end()) {
			return invalid("Username \"" + std::string(username) + "\" not in certificate principals: "
				+ join(cert.principals, ", "));
		}
	}

	return validation_verdict{true, std::nullopt};
}

validation_verdict validate_certificate(ssh_certificate const& cert, std::string_view username) {
	return validate_certificate(cert, username, current_unix_time());
}

validation_verdict validate_certificate(cert_result<ssh_certificate> const& cert, std::string_view username,
	std::uint64_t now, validation_policy const& policy)
{
	if(!cert) {
		return invalid(cert.error().message());
	}
	return validate_certificate(cert.value(), username, now, policy);
}

validation_verdict validate_certificate(cert_result<ssh_certificate> const& cert, std::string_view username) {
	return validate_certificate(cert, username, current_unix_time());
}

}
