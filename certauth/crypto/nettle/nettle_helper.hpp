#ifndef CERTAUTH_CRYPTO_NETTLE_HELPER_HEADER
#define CERTAUTH_CRYPTO_NETTLE_HELPER_HEADER

#include "certauth/common/types.hpp"
#include "certauth/crypto/ids.hpp"
#include "certauth/crypto/random.hpp"

#include <cerrno>

#include <nettle/bignum.h>
#include <nettle/ecc-curve.h>

namespace certauth::nettle {

struct integer {
	integer() {
		mpz_init(handle);
	}

	integer(unsigned long int value) {
		mpz_init_set_ui(handle, value);
	}

	integer(mpz_t const v) {
		mpz_init_set(handle, v);
	}

	integer(const_span data) {
		nettle_mpz_init_set_str_256_u(handle, data.size(), to_uint8_ptr(data));
	}

	~integer() {
		mpz_clear(handle);
	}

	integer(integer const& i) {
		mpz_init_set(handle, i.handle);
	}

	integer& operator=(integer const& i) {
		mpz_set(handle, i.handle);
		return *this;
	}

	operator mpz_t const&() const {
		return handle;
	}

	operator mpz_t&() {
		return handle;
	}

	mpz_t handle;
};

// big endian unsigned bytes of the integer, padded with zeroes in front to given size
inline bool write_integer(mpz_t const v, span out) {
	if(nettle_mpz_sizeinbase_256_u(v) > out.size()) {
		return false;
	}
	nettle_mpz_get_str_256(out.size(), to_uint8_ptr(out), v);
	return true;
}

inline ecc_curve const* to_nettle_curve(key_type t) {
	using enum key_type;
	if(t == ecdsa_sha2_nistp256) return nettle_get_secp_256r1();
	if(t == ecdsa_sha2_nistp384) return nettle_get_secp_384r1();
	if(t == ecdsa_sha2_nistp521) return nettle_get_secp_521r1();
	return nullptr;
}

// fill the whole buffer from source that works like getrandom(2), interrupted calls are retried
template<typename Source>
bool fill_entropy(span out, Source&& source) {
	std::size_t got = 0;
	while(got != out.size()) {
		auto res = source(out.data()+got, out.size()-got);
		if(res < 0) {
			if(errno == EINTR) {
				continue;
			}
			return false;
		}
		if(res == 0) {
			return false;
		}
		got += std::size_t(res);
	}
	return true;
}

// adapter for nettle_random_func
inline void extract_rand(void* ctx, size_t length, uint8_t* dst) {
	random& r = *(random*)ctx;
	r.random_bytes(span((std::byte*)dst, length));
}

}

#endif
