#include "ssh_key.hpp"

namespace certauth {

signature_type signature_type_for(key_type t, std::string_view algorithm) {
	signature_type st = algorithm.empty()
		? default_signature_type(t)
		: from_string(type_tag<signature_type>{}, algorithm);
	return is_compatible(t, st) ? st : signature_type::unknown;
}

ssh_key::ssh_key(ssh_private_key key)
: private_(std::move(key))
, public_(private_.public_key())
, comment_(private_.comment())
{
}

ssh_key::ssh_key(ssh_public_key key, std::string comment)
: public_(std::move(key))
, comment_(std::move(comment))
{
}

bool ssh_key::valid() const {
	return public_.valid();
}

key_type ssh_key::type() const {
	return public_.type();
}

std::string ssh_key::comment() const {
	return comment_;
}

bool ssh_key::is_private_key() const {
	return private_.valid();
}

byte_vector ssh_key::sign(const_span data, std::string_view algorithm) const {
	if(!is_private_key()) {
		return {};
	}
	auto st = signature_type_for(type(), algorithm);
	if(st == signature_type::unknown) {
		return {};
	}
	return private_.sign(st, data);
}

bool ssh_key::verify(const_span data, const_span signature, std::string_view algorithm) const {
	if(!algorithm.empty()) {
		auto sig = parse_ssh_signature(signature);
		if(!sig || sig->algorithm != algorithm) {
			return false;
		}
	}
	return public_.verify(data, signature);
}

byte_vector ssh_key::public_ssh(std::string_view) const {
	return to_byte_vector(public_);
}

std::optional<std::string> ssh_key::public_pem() const {
	return public_.pem();
}

std::shared_ptr<base_key const> make_ssh_key(ssh_private_key key) {
	auto res = std::make_shared<ssh_key>(std::move(key));
	if(res->valid() && res->is_private_key()) {
		return res;
	}
	return nullptr;
}

std::shared_ptr<base_key const> make_ssh_key(ssh_public_key key, std::string comment) {
	auto res = std::make_shared<ssh_key>(std::move(key), std::move(comment));
	if(res->valid()) {
		return res;
	}
	return nullptr;
}

}
