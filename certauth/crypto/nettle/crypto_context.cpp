
#include "crypto_context.hpp"

namespace certauth::nettle {

std::unique_ptr<certauth::random> create_random();
std::shared_ptr<certauth::public_key> create_public_key(public_key_data const&, crypto_call_context const&);
std::shared_ptr<certauth::private_key> create_private_key(private_key_data const&, crypto_call_context const&);
std::unique_ptr<certauth::hash> create_hash(hash_type, crypto_call_context const&);

crypto_context create_nettle_context() {
	return crypto_context{
			create_random,
			create_public_key,
			create_private_key,
			create_hash
		};
}

}
