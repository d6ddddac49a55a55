#ifndef CERTAUTH_CERT_CERTIFIED_KEY_HEADER
#define CERTAUTH_CERT_CERTIFIED_KEY_HEADER

#include "certificate.hpp"
#include "cert_error.hpp"
#include "cert_text.hpp"

#include "certauth/core/base_key.hpp"

#include <memory>
#include <optional>

namespace certauth {

/** \brief Key that is backed by openssh certificate
 *
 *  All key operations are done by the base key, the certificate only adds the authorisation data.
 *  The original certificate blob is available with certificate_blob().
 */
class certified_key : public base_key {
public:
	certified_key(std::shared_ptr<base_key const> base, ssh_certificate cert, byte_vector blob);

	key_type type() const override;
	std::string comment() const override;
	bool is_private_key() const override;

	byte_vector sign(const_span data, std::string_view algorithm) const override;
	bool verify(const_span data, const_span signature, std::string_view algorithm) const override;
	byte_vector public_ssh(std::string_view algorithm) const override;
	std::optional<std::string> public_pem() const override;

	ssh_certificate const& certificate() const { return *cert_; }
	const_span certificate_blob() const { return blob_; }

	base_key const& base() const { return *base_; }

private:
	std::shared_ptr<base_key const> base_;
	std::shared_ptr<ssh_certificate const> cert_;
	byte_vector blob_;
};

/** \brief Combine key with certificate
 *
 *  Fails with not_a_buffer if the data is not binary, not_a_certificate if the data does not look like
 *  certificate, invalid_key if there is no base key, or with the decoding error.
 */
cert_result<certified_key> make_certified_key(std::shared_ptr<base_key const> base, certificate_data const& data);

/// the data as is if it looks like certificate, the data is not decoded
std::optional<byte_vector> extract_certificate_from_data(const_span data);

/// result of sniffing and decoding in one step
struct cert_load_result {
	enum status_type {
		not_a_certificate,
		invalid,
		ok
	} status{};

	// set when status is ok
	std::optional<ssh_certificate> certificate;
	// set when status is invalid
	cert_error error;
};

cert_load_result load_certificate(const_span data);

}

#endif
