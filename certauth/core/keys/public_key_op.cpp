#include "public_key_op.hpp"

#include "certauth/core/ssh_binary_util.hpp"
#include "certauth/crypto/crypto_context.hpp"
#include "certauth/crypto/public_key.hpp"

namespace certauth {

byte_vector from_ecdsa_signature_blob(key_type t, const_span payload) {
	std::size_t csize = ecdsa_coordinate_size(t);
	ssh_bf_reader r(payload);
	std::string_view rs, ss;
	if(!csize || !r.read(rs) || !r.read(ss)) {
		return {};
	}
	auto ri = to_umpint(rs);
	auto si = to_umpint(ss);
	if(ri.data.size() > csize || si.data.size() > csize) {
		return {};
	}
	// right align both integers in their half
	byte_vector sig(2*csize);
	std::copy(ri.data.begin(), ri.data.end(), sig.begin() + (csize - ri.data.size()));
	std::copy(si.data.begin(), si.data.end(), sig.end() - si.data.size());
	return sig;
}

bool write_public_key_fields(ssh_bf_binout_writer& w, public_key const& key) {
	auto t = key.type();
	if(t == key_type::ssh_ed25519) {
		ed25519_public_key_data data;
		return key.fill_data(data) && w.write(to_string_view(data.pubkey));
	} else if(t == key_type::ssh_rsa) {
		rsa_public_key_data data;
		return key.fill_data(data) && w.write(data.e) && w.write(data.n);
	} else if(is_ecdsa(t)) {
		ecdsa_public_key_data data{t};
		return key.fill_data(data) && w.write(to_curve_name(t)) && w.write(to_string_view(data.ecc_point));
	}
	return false;
}

std::shared_ptr<public_key> read_public_key_fields(ssh_bf_reader& r, key_type t, crypto_context const& crypto, crypto_call_context const& call) {
	if(t == key_type::ssh_ed25519) {
		std::string_view pubkey;
		if(r.read(pubkey) && pubkey.size() == ed25519_key_size) {
			return crypto.construct_public_key(ed25519_public_key_data{to_span(pubkey)}, call);
		}
	} else if(t == key_type::ssh_rsa) {
		std::string_view e, n;
		if(r.read(e) && r.read(n)) {
			return crypto.construct_public_key(rsa_public_key_data{to_umpint(e), to_umpint(n)}, call);
		}
	} else if(is_ecdsa(t)) {
		std::string_view curve, point;
		if(r.read(curve) && r.read(point)) {
			if(curve == to_curve_name(t)) {
				return crypto.construct_public_key(ecdsa_public_key_data{t, to_span(point)}, call);
			}
			call.log.log(logger::debug_trace, "Curve {} does not match key type {}", curve, to_string(t));
			return nullptr;
		}
	} else {
		call.log.log(logger::debug_trace, "Unsupported public key type: {}", to_string(t));
		return nullptr;
	}
	call.log.log(logger::debug_trace, "Invalid {} public key fields", to_string(t));
	return nullptr;
}

}
