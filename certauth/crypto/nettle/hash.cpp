#include "nettle_helper.hpp"
#include "certauth/crypto/crypto_call_context.hpp"
#include "certauth/crypto/ids.hpp"
#include "certauth/crypto/hash.hpp"

#include <algorithm>
#include <memory>

#include <nettle/nettle-meta.h>

namespace certauth::nettle {

/// any hash nettle has a descriptor for, the context is kept in opaque buffer
class meta_hash : public hash {
public:
	meta_hash(nettle_hash const& desc)
	: hash(desc.digest_size)
	, desc_(desc)
	, ctx_(desc.context_size)
	{
		desc_.init(ctx_.data());
	}

	void process(const_span in) override {
		desc_.update(ctx_.data(), in.size(), to_uint8_ptr(in));
	}

	void digest(span out) override {
		CERTAUTH_ASSERT(out.size() >= size(), "invalid out buffer size");
		desc_.digest(ctx_.data(), std::min(size(), out.size()), to_uint8_ptr(out));
	}

private:
	nettle_hash const& desc_;
	byte_vector ctx_;
};

static nettle_hash const* descriptor(hash_type t) {
	using enum hash_type;
	if(t == sha1) return &nettle_sha1;
	if(t == sha2_256) return &nettle_sha256;
	if(t == sha2_384) return &nettle_sha384;
	if(t == sha2_512) return &nettle_sha512;
	return nullptr;
}

std::unique_ptr<certauth::hash> create_hash(hash_type t, crypto_call_context const& call) {
	auto desc = descriptor(t);
	if(!desc) {
		call.log.log(logger::error, "Unsupported hash type: {}", to_string(t));
		return nullptr;
	}
	return std::make_unique<meta_hash>(*desc);
}

}
