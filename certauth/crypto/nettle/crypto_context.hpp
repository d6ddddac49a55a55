#ifndef CERTAUTH_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER
#define CERTAUTH_CRYPTO_NETTLE_CRYPTO_CONTEXT_HEADER

#include "certauth/crypto/crypto_context.hpp"

namespace certauth::nettle {

crypto_context create_nettle_context();

}

#endif
