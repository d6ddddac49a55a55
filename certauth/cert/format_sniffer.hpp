#ifndef CERTAUTH_CERT_FORMAT_SNIFFER_HEADER
#define CERTAUTH_CERT_FORMAT_SNIFFER_HEADER

#include "certauth/common/types.hpp"

namespace certauth {

/** \brief Check if the data looks like openssh certificate blob
 *
 *  The first length prefixed field is taken as the algorithm identifier, it must fit in the data,
 *  be at most 64 bytes and contain "-cert-v". Nothing else is validated.
 */
bool is_certificate(const_span data) noexcept;

}

#endif
