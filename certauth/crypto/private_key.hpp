#ifndef CERTAUTH_CRYPTO_PRIVATE_KEY_HEADER
#define CERTAUTH_CRYPTO_PRIVATE_KEY_HEADER

#include "ids.hpp"
#include <memory>
#include <optional>

namespace certauth {

class public_key;

struct private_key_data {
	virtual key_type type() const = 0;
protected:
	~private_key_data() = default;
};

class private_key {
public:
	virtual ~private_key() = default;

	virtual key_type type() const = 0;
	virtual std::shared_ptr<certauth::public_key> public_key() const = 0;

	/// raw signature of the data, without the ssh encoding, empty on failure
	virtual byte_vector sign(signature_type, const_span in) const = 0;
};

struct ed25519_private_key_data : private_key_data {
	ed25519_private_key_data() = default;
	ed25519_private_key_data(const_span priv, std::optional<const_span> pub = std::nullopt)
	: privkey(priv)
	, pubkey(pub)
	{}

	key_type type() const override {
		return key_type::ssh_ed25519;
	}

	const_span privkey;
	std::optional<const_span> pubkey;
};

struct rsa_private_key_data : private_key_data {
	rsa_private_key_data() = default;
	rsa_private_key_data(const_mpint_span e, const_mpint_span n, const_mpint_span d, const_mpint_span p, const_mpint_span q, const_mpint_span iqmp)
	: e(e), n(n), d(d), p(p), q(q), iqmp(iqmp)
	{
	}

	const_mpint_span e;
	const_mpint_span n;
	const_mpint_span d;
	const_mpint_span p;
	const_mpint_span q;
	// this can be empty, just for optimisation (inverse of q modulo p)
	const_mpint_span iqmp;

	key_type type() const override {
		return key_type::ssh_rsa;
	}
};

struct ecdsa_private_key_data : private_key_data {
	ecdsa_private_key_data() = default;
	ecdsa_private_key_data(key_type t, const_span ecc_point = {}, const_mpint_span privkey = {})
	: ecdsa_type(t)
	, ecc_point(ecc_point)
	, privkey(privkey)
	{
	}

	key_type ecdsa_type{};

	const_span ecc_point;
	const_mpint_span privkey;

	key_type type() const override {
		return ecdsa_type;
	}
};

}

#endif
