#include "cert_error.hpp"

namespace certauth {

std::string_view to_string(cert_errc c) {
	using enum cert_errc;
	switch(c) {
		case none: return "none";
		case not_a_buffer: return "not a buffer";
		case not_a_certificate: return "not a certificate";
		case invalid_certificate: return "invalid certificate";
		case unsupported_key_type: return "unsupported key type";
		case invalid_key: return "invalid key";
	}
	return "unknown";
}

}
