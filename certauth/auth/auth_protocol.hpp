#ifndef CERTAUTH_AUTH_AUTH_PROTOCOL_HEADER
#define CERTAUTH_AUTH_AUTH_PROTOCOL_HEADER

#include "certauth/common/types.hpp"

#include <optional>
#include <string_view>

namespace certauth {

std::uint8_t const ssh_userauth_request = 50;

std::string_view const connection_service_name = "ssh-connection";
std::string_view const publickey_method_name = "publickey";

/*
	byte      SSH_MSG_USERAUTH_REQUEST
	string    user name in ISO-10646 UTF-8 encoding [RFC3629]
	string    service name in US-ASCII
	string    "publickey"
	boolean   FALSE = query, TRUE = authenticate
	string    public key algorithm name
	string    public key blob
	string    signature -- if above boolean is true otherwise nothing
*/
struct userauth_pk_request {
	std::string_view user;
	std::string_view service;
	std::string_view method;
	bool is_auth{};
	std::string_view pk_algorithm;
	std::string_view pk_blob;
	std::string_view signature;
	// size of the payload before the signature, this part is signed
	std::size_t signed_size{};
};

// the views point to the payload, nullopt if the payload is not valid public key request
std::optional<userauth_pk_request> parse_userauth_pk_request(const_span payload);

// the payload without signature
byte_vector serialise_userauth_pk_request(std::string_view user, std::string_view service, bool is_auth,
	std::string_view pk_algorithm, const_span pk_blob);

// the data that is signed: string session id followed by the request payload without signature
byte_vector pk_signature_data(const_span session_id, const_span request);

// algorithm name used in the request for the certificate with given signature algorithm, e.g. "rsa-sha2-256-cert-v01@openssh.com"
std::string cert_request_algorithm(std::string_view cert_algorithm, std::string_view signature_algorithm);

// signature algorithm for request algorithm, e.g. "rsa-sha2-256" for "rsa-sha2-256-cert-v01@openssh.com"
std::string_view cert_signature_algorithm(std::string_view request_algorithm);

}

#endif
