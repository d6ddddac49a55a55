#ifndef CERTAUTH_CRYPTO_CRYPTO_CONTEXT_HEADER
#define CERTAUTH_CRYPTO_CRYPTO_CONTEXT_HEADER

#include "ids.hpp"
#include "crypto_call_context.hpp"
#include "public_key.hpp"
#include "private_key.hpp"
#include "hash.hpp"

#include <functional>
#include <memory>

namespace certauth {

template<typename Impl, typename... ExtraParams>
using ctor = std::function<std::shared_ptr<Impl> (ExtraParams const&..., crypto_call_context const&)>;

/// Context that is used to construct all crypto objects
struct crypto_context {

	/// construct random number generator suitable for cryptographic usage
	std::function<std::unique_ptr<random>()> construct_random{};

	/// construct public key from public key data (derived class to give the data which has the key type, the data is copied)
	ctor<public_key, public_key_data> construct_public_key{};
	/// construct private key from private key data (derived class to give the data which has the key type, the data is copied)
	ctor<private_key, private_key_data> construct_private_key{};
	/// construct hash algorithm
	std::function<std::unique_ptr<hash> (hash_type, crypto_call_context const&)> construct_hash{};
};

crypto_context default_crypto_context();

}

#endif
