#ifndef CERTAUTH_CERT_CERT_TEXT_HEADER
#define CERTAUTH_CERT_CERT_TEXT_HEADER

#include "cert_error.hpp"

#include <variant>

namespace certauth {

/// certificate given in configuration, either not set, binary blob or openssh public key file line
using certificate_data = std::variant<std::monostate, byte_vector, std::string>;

/** \brief Parse openssh public key file line "type base64[ comment]"
 *
 *  The type must be certificate type and match the first field of the decoded blob.
 */
cert_result<byte_vector> parse_certificate_text(std::string_view);

/// turn the text form to binary, binary and empty are returned as is. Fails if the text cannot be parsed.
cert_result<certificate_data> to_certificate_blob(certificate_data const&);

}

#endif
