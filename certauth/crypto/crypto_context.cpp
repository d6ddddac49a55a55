
#include "crypto_context.hpp"

#include "config.hpp"
#ifdef USE_NETTLE
#	include "certauth/crypto/nettle/crypto_context.hpp"
#endif

namespace certauth {

crypto_context default_crypto_context() {
#ifdef USE_NETTLE
	return nettle::create_nettle_context();
#else
#	error No default crypto context set
#endif
}

}
