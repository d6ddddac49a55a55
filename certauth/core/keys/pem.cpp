#include "pem.hpp"

#include "certauth/common/util.hpp"
#include "certauth/crypto/public_key.hpp"

namespace certauth {

namespace {

std::uint8_t const der_integer    = 0x02;
std::uint8_t const der_bit_string = 0x03;
std::uint8_t const der_null       = 0x05;
std::uint8_t const der_oid        = 0x06;
std::uint8_t const der_sequence   = 0x30;

// object identifiers without the tag and length
std::uint8_t const oid_rsa_encryption[] = {0x2a, 0x86, 0x48, 0x86, 0xf7, 0x0d, 0x01, 0x01, 0x01}; // 1.2.840.113549.1.1.1
std::uint8_t const oid_ec_public_key[]  = {0x2a, 0x86, 0x48, 0xce, 0x3d, 0x02, 0x01};             // 1.2.840.10045.2.1
std::uint8_t const oid_secp256r1[]      = {0x2a, 0x86, 0x48, 0xce, 0x3d, 0x03, 0x01, 0x07};       // 1.2.840.10045.3.1.7
std::uint8_t const oid_secp384r1[]      = {0x2b, 0x81, 0x04, 0x00, 0x22};                         // 1.3.132.0.34
std::uint8_t const oid_secp521r1[]      = {0x2b, 0x81, 0x04, 0x00, 0x23};                         // 1.3.132.0.35
std::uint8_t const oid_ed25519[]        = {0x2b, 0x65, 0x70};                                     // 1.3.101.112

template<std::size_t S>
const_span oid(std::uint8_t const (&v)[S]) {
	return const_span((std::byte const*)v, S);
}

void append_length(byte_vector& out, std::size_t size) {
	if(size < 0x80) {
		out.push_back(std::byte(size));
	} else {
		std::byte buf[sizeof(std::size_t)];
		std::size_t count = 0;
		for(; size; size >>= 8) {
			buf[count++] = std::byte(size & 0xff);
		}
		out.push_back(std::byte(0x80 | count));
		while(count) {
			out.push_back(buf[--count]);
		}
	}
}

void append_tlv(byte_vector& out, std::uint8_t tag, const_span content) {
	out.push_back(std::byte{tag});
	append_length(out, content.size());
	out.insert(out.end(), content.begin(), content.end());
}

// unsigned integer, a zero is added in front if the high bit is set
void append_integer(byte_vector& out, const_span v) {
	while(v.size() > 1 && v[0] == std::byte{0}) {
		v = v.subspan(1);
	}
	byte_vector content;
	if(v.empty() || (std::to_integer<std::uint8_t>(v[0]) & 0x80)) {
		content.push_back(std::byte{0});
	}
	content.insert(content.end(), v.begin(), v.end());
	append_tlv(out, der_integer, content);
}

// bit string with zero unused bits
void append_bit_string(byte_vector& out, const_span v) {
	byte_vector content;
	content.reserve(v.size()+1);
	content.push_back(std::byte{0});
	content.insert(content.end(), v.begin(), v.end());
	append_tlv(out, der_bit_string, content);
}

byte_vector spki(const_span algorithm_identifier, const_span key_bits) {
	byte_vector content;
	append_tlv(content, der_sequence, algorithm_identifier);
	append_bit_string(content, key_bits);

	byte_vector res;
	append_tlv(res, der_sequence, content);
	return res;
}

byte_vector ed25519_spki(public_key const& key) {
	ed25519_public_key_data data;
	if(!key.fill_data(data)) {
		return {};
	}
	byte_vector alg;
	append_tlv(alg, der_oid, oid(oid_ed25519));
	return spki(alg, data.pubkey);
}

byte_vector rsa_spki(public_key const& key) {
	rsa_public_key_data data;
	if(!key.fill_data(data)) {
		return {};
	}
	byte_vector alg;
	append_tlv(alg, der_oid, oid(oid_rsa_encryption));
	append_tlv(alg, der_null, {});

	byte_vector ints;
	append_integer(ints, data.n.data);
	append_integer(ints, data.e.data);
	byte_vector rsa_key;
	append_tlv(rsa_key, der_sequence, ints);

	return spki(alg, rsa_key);
}

byte_vector ecdsa_spki(public_key const& key) {
	ecdsa_public_key_data data{key.type()};
	if(!key.fill_data(data)) {
		return {};
	}

	const_span curve;
	if(data.ecdsa_type == key_type::ecdsa_sha2_nistp256) {
		curve = oid(oid_secp256r1);
	} else if(data.ecdsa_type == key_type::ecdsa_sha2_nistp384) {
		curve = oid(oid_secp384r1);
	} else if(data.ecdsa_type == key_type::ecdsa_sha2_nistp521) {
		curve = oid(oid_secp521r1);
	} else {
		return {};
	}

	byte_vector alg;
	append_tlv(alg, der_oid, oid(oid_ec_public_key));
	append_tlv(alg, der_oid, curve);
	return spki(alg, data.ecc_point);
}

}

byte_vector public_key_spki(public_key const& key) {
	auto t = key.type();
	if(t == key_type::ssh_ed25519) {
		return ed25519_spki(key);
	} else if(t == key_type::ssh_rsa) {
		return rsa_spki(key);
	} else if(is_ecdsa(t)) {
		return ecdsa_spki(key);
	}
	return {};
}

std::optional<std::string> public_key_pem(public_key const& key) {
	byte_vector der = public_key_spki(key);
	if(der.empty()) {
		return std::nullopt;
	}
	return to_pem("PUBLIC KEY", der);
}

std::string to_pem(std::string_view label, const_span der) {
	std::string res = "-----BEGIN " + std::string(label) + "-----\n";
	std::string_view enc;
	std::string b64 = encode_base64(der, true);
	enc = b64;
	while(!enc.empty()) {
		res += enc.substr(0, 64);
		res += "\n";
		enc = enc.substr(std::min<std::size_t>(enc.size(), 64));
	}
	res += "-----END " + std::string(label) + "-----\n";
	return res;
}

}
