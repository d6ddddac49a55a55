
#include "ssh_public_key.hpp"
#include "ssh_binary_util.hpp"
#include "keys/public_key_op.hpp"
#include "keys/pem.hpp"

namespace certauth {

ssh_public_key::ssh_public_key(std::shared_ptr<public_key> pkey)
: key_impl_(std::move(pkey))
{
}

key_type ssh_public_key::type() const {
	return key_impl_ ? key_impl_->type() : key_type::unknown;
}

bool ssh_public_key::valid() const {
	return static_cast<bool>(key_impl_);
}

std::optional<ssh_signature> parse_ssh_signature(const_span signature) {
	ssh_bf_reader r(signature);
	std::string_view algorithm;
	std::string_view payload;
	if(!r.read(algorithm) || !r.read(payload)) {
		return std::nullopt;
	}
	return ssh_signature{from_string(type_tag<signature_type>{}, algorithm), algorithm, to_span(payload)};
}

bool ssh_public_key::verify(const_span msg, const_span signature) const {
	auto t = type();
	if(t == key_type::unknown) {
		return false;
	}

	auto sig = parse_ssh_signature(signature);
	if(!sig || !is_compatible(t, sig->type)) {
		return false;
	}

	if(is_ecdsa(t)) {
		auto raw = from_ecdsa_signature_blob(t, sig->payload);
		return !raw.empty() && key_impl_->verify(sig->type, msg, raw);
	}
	return key_impl_->verify(sig->type, msg, sig->payload);
}

bool ssh_public_key::serialise(binout& out) const {
	if(!valid()) {
		return false;
	}
	ssh_bf_binout_writer w(out);
	return w.write(to_string(type())) && write_public_key_fields(w, *key_impl_);
}

std::string ssh_public_key::fingerprint(crypto_context const& crypto, crypto_call_context const& call) const {
	std::string res;
	if(valid()) {
		auto sha256 = crypto.construct_hash(hash_type::sha2_256, call);
		if(sha256) {
			hash_binout bo(*sha256);
			if(serialise(bo)) {
				res = "SHA256:" + encode_base64(sha256->digest());
			}
		}
	}
	return res;
}

std::optional<std::string> ssh_public_key::pem() const {
	if(!valid()) {
		return std::nullopt;
	}
	return public_key_pem(*key_impl_);
}

ssh_public_key load_ssh_public_key(const_span data, crypto_context const& crypto, crypto_call_context const& call) {
	ssh_bf_reader r(data);
	std::string_view name;
	if(!r.read(name)) {
		call.log.log(logger::debug_trace, "Failed to read public key type");
		return {};
	}
	return ssh_public_key(read_public_key_fields(r, from_string(type_tag<key_type>{}, name), crypto, call));
}

ssh_public_key load_base64_ssh_public_key(std::string_view s, crypto_context const& crypto, crypto_call_context const& call) {
	return load_ssh_public_key(decode_base64(s), crypto, call);
}

byte_vector to_byte_vector(ssh_public_key const& k) {
	byte_vector v;
	byte_vector_binout s(v);
	return k.serialise(s) ? v : byte_vector{};
}

}
