#include "nettle_helper.hpp"
#include "certauth/crypto/crypto_call_context.hpp"
#include "certauth/crypto/public_key.hpp"
#include "certauth/crypto/hash.hpp"
#include "certauth/crypto/ids.hpp"
#include <memory>

#include <nettle/bignum.h>
#include <nettle/ecdsa.h>
#include <nettle/eddsa.h>
#include <nettle/dsa.h>
#include <nettle/rsa.h>
#include <nettle/ecc-curve.h>

namespace certauth::nettle {

std::unique_ptr<certauth::hash> create_hash(hash_type, crypto_call_context const&);

class ed25519_public_key : public public_key {
public:
	ed25519_public_key(ed25519_public_key_data const& d, crypto_call_context const&)
	: pubkey_(d.pubkey.begin(), d.pubkey.end())
	{
	}

	bool valid() const {
		return pubkey_.size() == ed25519_key_size;
	}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	bool verify(signature_type t, const_span msg, const_span signature) const override {
		if(t != signature_type::ssh_ed25519 || signature.size() != ED25519_SIGNATURE_SIZE) {
			return false;
		}

		return nettle_ed25519_sha512_verify(
			to_uint8_ptr(pubkey_),
			msg.size(),
			to_uint8_ptr(msg),
			to_uint8_ptr(signature) ) == 1;
	}

	bool fill_data(public_key_data& data) const override {
		bool ret = data.type() == type();
		if(ret) {
			auto& d = static_cast<ed25519_public_key_data&>(data);
			d.pubkey = const_span(pubkey_);
		}
		return ret;
	}

private:
	byte_vector pubkey_;
};


using rsa_digest_verifier = int (*)(::rsa_public_key const*, std::uint8_t const*, mpz_t const);

static rsa_digest_verifier rsa_verifier(signature_type t) {
	using enum signature_type;
	if(t == ssh_rsa) return nettle_rsa_sha1_verify_digest;
	if(t == rsa_sha2_256) return nettle_rsa_sha256_verify_digest;
	if(t == rsa_sha2_512) return nettle_rsa_sha512_verify_digest;
	return nullptr;
}

class rsa_public_key : public public_key {
public:
	rsa_public_key(rsa_public_key_data const& d, crypto_call_context const& call)
	: e_(d.e.data.begin(), d.e.data.end())
	, n_(d.n.data.begin(), d.n.data.end())
	, call_(call)
	{
		nettle_rsa_public_key_init(&public_key_);
		nettle_mpz_set_str_256_u(public_key_.e, d.e.data.size(), to_uint8_ptr(d.e.data));
		nettle_mpz_set_str_256_u(public_key_.n, d.n.data.size(), to_uint8_ptr(d.n.data));
		is_valid_ = nettle_rsa_public_key_prepare(&public_key_) == 1;
	}

	~rsa_public_key() {
		nettle_rsa_public_key_clear(&public_key_);
	}

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return key_type::ssh_rsa;
	}

	bool verify(signature_type t, const_span in, const_span signature) const override {
		// PKCS#1 signature is always the size of the modulus
		if(signature.size() != public_key_.size) {
			return false;
		}

		auto verifier = rsa_verifier(t);
		if(!verifier) {
			return false;
		}
		auto h = create_hash(signature_hash(t), call_);
		if(!h) {
			return false;
		}
		h->process(in);
		byte_vector digest = h->digest();

		integer sig(signature);
		return verifier(&public_key_, to_uint8_ptr(digest), sig) == 1;
	}

	bool fill_data(public_key_data& data) const override {
		bool ret = data.type() == type();
		if(ret) {
			auto& d = static_cast<rsa_public_key_data&>(data);
			d.e.data = const_span(e_);
			d.n.data = const_span(n_);
		}
		return ret;
	}

private:
	bool is_valid_{};
	byte_vector e_;
	byte_vector n_;
	crypto_call_context call_;
	::rsa_public_key public_key_;
};


class ecdsa_public_key : public public_key {
public:
	ecdsa_public_key(ecdsa_public_key_data const& d, crypto_call_context const& call)
	: type_(d.ecdsa_type)
	, pubkey_(d.ecc_point.begin(), d.ecc_point.end())
	, call_(call)
	{
		auto curve = to_nettle_curve(type_);
		std::size_t csize = ecdsa_coordinate_size(type_);
		if(curve) {
			ecc_point_init(&ecc_point_, curve);
			has_point_ = true;
			// see the size is correct and it is uncompressed ecc point, otherwise don't bother
			if(d.ecc_point.size() == 2*csize+1 && d.ecc_point[0] == std::byte{0x04}) {
				integer x(d.ecc_point.subspan(1, csize));
				integer y(d.ecc_point.subspan(1+csize, csize));
				is_valid_ = nettle_ecc_point_set(&ecc_point_, x, y) == 1;
			}
		}
	}

	~ecdsa_public_key() {
		if(has_point_) {
			ecc_point_clear(&ecc_point_);
		}
	}

	bool valid() const {
		return is_valid_;
	}

	key_type type() const override {
		return type_;
	}

	bool verify(signature_type t, const_span msg, const_span signature) const override {
		std::size_t csize = ecdsa_coordinate_size(type_);
		if(!is_compatible(type_, t) || signature.size() != 2*csize) {
			return false;
		}

		// ecdsa signs the digest of the message, the hash is given by the curve size
		auto h = create_hash(signature_hash(t), call_);
		if(!h) {
			return false;
		}
		h->process(msg);
		byte_vector digest = h->digest();

		dsa_signature sig;
		nettle_dsa_signature_init(&sig);
		nettle_mpz_set_str_256_u(sig.r, csize, to_uint8_ptr(signature));
		nettle_mpz_set_str_256_u(sig.s, csize, to_uint8_ptr(signature)+csize);
		bool res = nettle_ecdsa_verify(&ecc_point_, digest.size(), to_uint8_ptr(digest), &sig) == 1;
		nettle_dsa_signature_clear(&sig);
		return res;
	}

	bool fill_data(public_key_data& data) const override {
		bool ret = data.type() == type();
		if(ret) {
			auto& d = static_cast<ecdsa_public_key_data&>(data);
			d.ecc_point = const_span(pubkey_);
		}
		return ret;
	}

private:
	bool is_valid_{};
	bool has_point_{};
	key_type type_;
	byte_vector pubkey_;
	crypto_call_context call_;
	ecc_point ecc_point_;
};


template<typename Key, typename Data>
static std::shared_ptr<certauth::public_key> make_key(public_key_data const& d, crypto_call_context const& call) {
	auto key = std::make_shared<Key>(static_cast<Data const&>(d), call);
	if(!key->valid()) {
		call.log.log(logger::debug, "Invalid {} public key", to_string(d.type()));
		return nullptr;
	}
	return key;
}

std::shared_ptr<certauth::public_key> create_public_key(public_key_data const& d, crypto_call_context const& call) {
	auto t = d.type();
	if(t == key_type::ssh_ed25519) {
		return make_key<ed25519_public_key, ed25519_public_key_data>(d, call);
	} else if(t == key_type::ssh_rsa) {
		return make_key<rsa_public_key, rsa_public_key_data>(d, call);
	} else if(is_ecdsa(t)) {
		return make_key<ecdsa_public_key, ecdsa_public_key_data>(d, call);
	}
	call.log.log(logger::error, "Unsupported public key type: {}", to_string(t));
	return nullptr;
}

}
