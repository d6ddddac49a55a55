#ifndef CERTAUTH_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER
#define CERTAUTH_CRYPTO_CRYPTO_CALL_CONTEXT_HEADER

#include "random.hpp"
#include "certauth/common/types.hpp"
#include "certauth/common/logger.hpp"

namespace certauth {

/// Context that is passed to crypto construct functions
struct crypto_call_context {
	logger& log;
	random& rand;
};

}

#endif
