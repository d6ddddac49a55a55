#ifndef CERTAUTH_CERT_CERT_CODEC_HEADER
#define CERTAUTH_CERT_CERT_CODEC_HEADER

#include "certificate.hpp"
#include "cert_error.hpp"

namespace certauth {

class logger;

/** \brief Decode openssh certificate blob
 *
 *  Fails with invalid_certificate naming the truncated field, or with unsupported_key_type if the
 *  algorithm identifier is not known. Data after the signature is ignored.
 */
cert_result<ssh_certificate> decode_certificate(const_span data, logger& log);
cert_result<ssh_certificate> decode_certificate(const_span data);

/** \brief Encode certificate back to the wire format
 *
 *  The key material and reserved bytes are written as they were decoded, so the result is identical to
 *  the decoded data when the critical options and extensions were sorted and unique (as openssh requires).
 */
byte_vector encode_certificate(ssh_certificate const&);

}

#endif
