#ifndef CERTAUTH_CRYPTO_RANDOM_HEADER
#define CERTAUTH_CRYPTO_RANDOM_HEADER

#include "certauth/common/types.hpp"

namespace certauth {

/// source of random bytes for signing (rsa blinding and ecdsa nonces)
class random {
public:
	virtual ~random() = default;

	virtual void random_bytes(span output) = 0;
};

}

#endif
