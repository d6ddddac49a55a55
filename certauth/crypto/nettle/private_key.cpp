#include "nettle_helper.hpp"
#include "certauth/crypto/crypto_call_context.hpp"
#include "certauth/crypto/private_key.hpp"
#include "certauth/crypto/public_key.hpp"
#include "certauth/crypto/hash.hpp"
#include "certauth/crypto/ids.hpp"
#include "certauth/common/util.hpp"

#include <memory>

#include <nettle/bignum.h>
#include <nettle/ecdsa.h>
#include <nettle/eddsa.h>
#include <nettle/dsa.h>
#include <nettle/rsa.h>

namespace certauth::nettle {

std::shared_ptr<certauth::public_key> create_public_key(public_key_data const&, crypto_call_context const&);
std::unique_ptr<certauth::hash> create_hash(hash_type, crypto_call_context const&);

static byte_vector digest_of(signature_type t, const_span in, crypto_call_context const& call) {
	auto h = create_hash(signature_hash(t), call);
	if(!h) {
		return {};
	}
	h->process(in);
	return h->digest();
}

class ed25519_private_key : public private_key {
public:
	ed25519_private_key(ed25519_private_key_data const& d, crypto_call_context const& call)
	: privkey_(d.privkey.begin(), d.privkey.end())
	, call_(call)
	{
		if(d.pubkey) {
			pubkey_.assign(d.pubkey->begin(), d.pubkey->end());
		} else if(privkey_.size() == ed25519_key_size) {
			pubkey_.resize(ed25519_key_size);
			nettle_ed25519_sha512_public_key(to_uint8_ptr(pubkey_), to_uint8_ptr(privkey_));
		}
	}

	bool valid() const {
		return privkey_.size() == ed25519_key_size && pubkey_.size() == ed25519_key_size;
	}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	std::shared_ptr<certauth::public_key> public_key() const override {
		return create_public_key(ed25519_public_key_data{pubkey_}, call_);
	}

	byte_vector sign(signature_type t, const_span in) const override {
		if(t != signature_type::ssh_ed25519) {
			return {};
		}
		byte_vector res(ED25519_SIGNATURE_SIZE);
		nettle_ed25519_sha512_sign(to_uint8_ptr(pubkey_), to_uint8_ptr(privkey_),
			in.size(), to_uint8_ptr(in), to_uint8_ptr(res));
		return res;
	}

private:
	byte_vector privkey_;
	byte_vector pubkey_;
	crypto_call_context call_;
};

using rsa_digest_signer = int (*)(::rsa_public_key const*, ::rsa_private_key const*,
	void*, nettle_random_func*, std::uint8_t const*, mpz_t);

static rsa_digest_signer rsa_signer(signature_type t) {
	using enum signature_type;
	if(t == ssh_rsa) return nettle_rsa_sha1_sign_digest_tr;
	if(t == rsa_sha2_256) return nettle_rsa_sha256_sign_digest_tr;
	if(t == rsa_sha2_512) return nettle_rsa_sha512_sign_digest_tr;
	return nullptr;
}

class rsa_private_key : public private_key {
public:
	rsa_private_key(rsa_private_key_data const& d, crypto_call_context const& call)
	: call_(call)
	, e_(d.e.data.begin(), d.e.data.end())
	, n_(d.n.data.begin(), d.n.data.end())
	{
		nettle_rsa_public_key_init(&pub_);
		nettle_rsa_private_key_init(&key_);

		nettle_mpz_set_str_256_u(pub_.e, d.e.data.size(), to_uint8_ptr(d.e.data));
		nettle_mpz_set_str_256_u(pub_.n, d.n.data.size(), to_uint8_ptr(d.n.data));
		nettle_mpz_set_str_256_u(key_.d, d.d.data.size(), to_uint8_ptr(d.d.data));
		nettle_mpz_set_str_256_u(key_.p, d.p.data.size(), to_uint8_ptr(d.p.data));
		nettle_mpz_set_str_256_u(key_.q, d.q.data.size(), to_uint8_ptr(d.q.data));
		nettle_mpz_set_str_256_u(key_.c, d.iqmp.data.size(), to_uint8_ptr(d.iqmp.data));

		// openssh keeps only d, nettle wants the crt exponents d mod (p-1) and d mod (q-1)
		integer p1, q1;
		mpz_sub_ui(p1, key_.p, 1);
		mpz_sub_ui(q1, key_.q, 1);
		mpz_mod(key_.a, key_.d, p1);
		mpz_mod(key_.b, key_.d, q1);

		valid_ = mpz_sgn(key_.c) != 0
			&& nettle_rsa_public_key_prepare(&pub_) == 1
			&& nettle_rsa_private_key_prepare(&key_) == 1;
	}

	~rsa_private_key() {
		nettle_rsa_private_key_clear(&key_);
		nettle_rsa_public_key_clear(&pub_);
	}

	bool valid() const {
		return valid_;
	}

	key_type type() const override {
		return key_type::ssh_rsa;
	}

	std::shared_ptr<certauth::public_key> public_key() const override {
		return create_public_key(rsa_public_key_data{to_umpint(e_), to_umpint(n_)}, call_);
	}

	byte_vector sign(signature_type t, const_span in) const override {
		auto signer = rsa_signer(t);
		if(!signer) {
			return {};
		}
		byte_vector digest = digest_of(t, in, call_);
		if(digest.empty()) {
			return {};
		}

		integer sig;
		if(signer(&pub_, &key_, &call_.rand, extract_rand, to_uint8_ptr(digest), sig) != 1) {
			call_.log.log(logger::error, "rsa signing failed");
			return {};
		}

		// pkcs#1 signature has always the size of the modulus (I2OSP)
		byte_vector res(pub_.size);
		if(!write_integer(sig, res)) {
			return {};
		}
		return res;
	}

private:
	crypto_call_context call_;
	bool valid_{};
	::rsa_public_key pub_;
	::rsa_private_key key_;
	byte_vector e_;
	byte_vector n_;
};

class ecdsa_private_key : public private_key {
public:
	ecdsa_private_key(ecdsa_private_key_data const& d, crypto_call_context const& call)
	: call_(call)
	, type_(d.ecdsa_type)
	, ecc_point_(d.ecc_point.begin(), d.ecc_point.end())
	{
		auto curve = to_nettle_curve(type_);
		if(!curve) {
			return;
		}
		nettle_ecc_scalar_init(&key_, curve);
		has_scalar_ = true;

		std::size_t csize = ecdsa_coordinate_size(type_);
		bool sizes_ok = d.privkey.data.size() <= csize
			&& d.ecc_point.size() == 2*csize+1
			&& d.ecc_point[0] == std::byte{0x04};

		if(sizes_ok) {
			integer z(d.privkey.data);
			valid_ = nettle_ecc_scalar_set(&key_, z) == 1;
		}
	}

	~ecdsa_private_key() {
		if(has_scalar_) {
			nettle_ecc_scalar_clear(&key_);
		}
	}

	bool valid() const {
		return valid_;
	}

	key_type type() const override {
		return type_;
	}

	std::shared_ptr<certauth::public_key> public_key() const override {
		return create_public_key(ecdsa_public_key_data{type_, ecc_point_}, call_);
	}

	// fixed size r || s
	byte_vector sign(signature_type t, const_span in) const override {
		if(!is_compatible(type_, t)) {
			return {};
		}
		byte_vector digest = digest_of(t, in, call_);
		if(digest.empty()) {
			return {};
		}

		std::size_t csize = ecdsa_coordinate_size(type_);
		byte_vector res(2*csize);

		dsa_signature sig;
		nettle_dsa_signature_init(&sig);
		nettle_ecdsa_sign(&key_, &call_.rand, extract_rand, digest.size(), to_uint8_ptr(digest), &sig);

		bool ok = write_integer(sig.r, span(res).subspan(0, csize))
			&& write_integer(sig.s, span(res).subspan(csize, csize));

		nettle_dsa_signature_clear(&sig);
		return ok ? res : byte_vector{};
	}

private:
	crypto_call_context call_;
	key_type type_;
	byte_vector ecc_point_;
	ecc_scalar key_;
	bool has_scalar_{};
	bool valid_{};
};

template<typename Key, typename Data>
static std::shared_ptr<certauth::private_key> make_key(private_key_data const& d, crypto_call_context const& call) {
	auto key = std::make_shared<Key>(static_cast<Data const&>(d), call);
	if(!key->valid()) {
		call.log.log(logger::debug, "Invalid {} private key", to_string(d.type()));
		return nullptr;
	}
	return key;
}

std::shared_ptr<certauth::private_key> create_private_key(private_key_data const& d, crypto_call_context const& call) {
	auto t = d.type();
	if(t == key_type::ssh_ed25519) {
		return make_key<ed25519_private_key, ed25519_private_key_data>(d, call);
	} else if(t == key_type::ssh_rsa) {
		return make_key<rsa_private_key, rsa_private_key_data>(d, call);
	} else if(is_ecdsa(t)) {
		return make_key<ecdsa_private_key, ecdsa_private_key_data>(d, call);
	}
	call.log.log(logger::error, "Unsupported private key type: {}", to_string(t));
	return nullptr;
}

}
