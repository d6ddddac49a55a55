#ifndef CERTAUTH_CERT_CERT_VALIDATOR_HEADER
#define CERTAUTH_CERT_CERT_VALIDATOR_HEADER

#include "certificate.hpp"
#include "cert_error.hpp"

#include <optional>
#include <string>

namespace certauth {

struct validation_verdict {
	bool valid{};
	// only set when not valid
	std::optional<std::string> reason;

	explicit operator bool() const { return valid; }
};

struct validation_policy {
	// also require the name to be listed in host certificate principals
	bool check_host_principals{false};
};

// current wall clock as unix seconds
std::uint64_t current_unix_time();

/** \brief Check the validity window and principals of certificate
 *
 *  The checks are done in order and the first failing one is reported: expiration (valid_before),
 *  start of validity (valid_after) and the principals. Zero valid_after or valid_before means not set.
 *  Critical options and extensions are not checked.
 */
validation_verdict validate_certificate(ssh_certificate const& cert, std::string_view username,
	std::uint64_t now, validation_policy const& policy = {});

validation_verdict validate_certificate(ssh_certificate const& cert, std::string_view username);

// decode failure is reported as invalid verdict with the failure message
validation_verdict validate_certificate(cert_result<ssh_certificate> const& cert, std::string_view username,
	std::uint64_t now, validation_policy const& policy = {});

validation_verdict validate_certificate(cert_result<ssh_certificate> const& cert, std::string_view username);

}

#endif
