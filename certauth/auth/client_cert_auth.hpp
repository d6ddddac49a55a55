#ifndef CERTAUTH_AUTH_CLIENT_CERT_AUTH_HEADER
#define CERTAUTH_AUTH_CLIENT_CERT_AUTH_HEADER

#include "certauth/cert/certified_key.hpp"

namespace certauth {

class logger;

/** \brief Build SSH_MSG_USERAUTH_REQUEST payload for publickey authentication with certificate
 *
 *  The public key blob is the original certificate blob and the signature is made by the certified key
 *  over the session id and the request. Empty signature algorithm uses the key type name.
 *  Returns empty payload on failure.
 */
byte_vector make_cert_userauth_request(const_span session_id, std::string_view username, std::string_view service,
	certified_key const& key, std::string_view signature_algorithm, logger& log);

/// query if the server would accept the certificate (no signature)
byte_vector make_cert_userauth_query(std::string_view username, std::string_view service,
	certified_key const& key, std::string_view signature_algorithm);

}

#endif
