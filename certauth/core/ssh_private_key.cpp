#include "ssh_private_key.hpp"
#include "ssh_binary_util.hpp"
#include "keys/private_key_op.hpp"

#include "certauth/crypto/private_key.hpp"

namespace certauth {

ssh_private_key::ssh_private_key(std::shared_ptr<private_key> i, std::string_view comment)
: key_impl_(std::move(i))
, comment_(comment)
{
}

key_type ssh_private_key::type() const {
	return key_impl_ ? key_impl_->type() : key_type::unknown;
}

ssh_public_key ssh_private_key::public_key() const {
	return key_impl_ ? ssh_public_key{key_impl_->public_key()} : ssh_public_key{};
}

bool ssh_private_key::valid() const {
	return static_cast<bool>(key_impl_);
}

byte_vector ssh_private_key::sign(signature_type st, const_span in) const {
	auto t = type();
	if(!is_compatible(t, st)) {
		return {};
	}

	byte_vector res;
	byte_vector signature = key_impl_->sign(st, in);

	if(!signature.empty()) {
		byte_vector_binout out(res);
		ssh_bf_binout_writer w(out);

		bool ok = w.write(to_string(st));
		if(is_ecdsa(t)) {
			ok = ok && w.write(to_ecdsa_signature_blob(signature));
		} else {
			ok = ok && w.write(to_string_view(signature));
		}
		if(!ok) {
			res.clear();
		}
	}
	return res;
}

byte_vector ssh_private_key::sign(const_span in) const {
	return sign(default_signature_type(type()), in);
}

ssh_private_key load_ssh_private_key(std::string_view text, crypto_context const& crypto, crypto_call_context const& call) {
	if(!is_openssh_private_key(text)) {
		call.log.log(logger::error, "unknown private key format");
		return {};
	}
	auto key = decode_openssh_private_key(text, crypto, call);
	if(key.valid()) {
		call.log.log(logger::debug, "Loaded {} private key [{}]", to_string(key.type()), key.comment());
	}
	return key;
}

}
