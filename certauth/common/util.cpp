
#include "util.hpp"
#include <ostream>
#include <iomanip>

#include <nettle/base64.h>

namespace certauth {

char const pad_char = '=';

// padding is optional, whitespace is not accepted
byte_vector decode_base64(std::string_view s) {
	if(s.empty() || s.find_first_of(" \t\r\n") != std::string_view::npos) {
		return {};
	}

	std::string padded(s);
	if(s.size() % 4) {
		if(s.size() % 4 == 1 || s.find(pad_char) != std::string_view::npos) {
			return {};
		}
		padded.append(4 - s.size() % 4, pad_char);
	}

	byte_vector res(BASE64_DECODE_LENGTH(padded.size()));
	std::size_t size = res.size();

	base64_decode_ctx ctx;
	base64_decode_init(&ctx);
	if(!base64_decode_update(&ctx, &size, reinterpret_cast<std::uint8_t*>(res.data()), padded.size(), padded.data())
		|| !base64_decode_final(&ctx))
	{
		return {};
	}
	res.resize(size);
	return res;
}

std::string encode_base64(const_span s, bool pad) {
	std::string res(BASE64_ENCODE_RAW_LENGTH(s.size()), '\0');
	base64_encode_raw(res.data(), s.size(), reinterpret_cast<std::uint8_t const*>(s.data()));
	if(!pad) {
		while(!res.empty() && res.back() == pad_char) {
			res.pop_back();
		}
	}
	return res;
}

std::ostream& operator<<(std::ostream& out, const_span s) {
	auto flags = out.flags();
	bool first = true;
	for(auto v : s) {
		if(!first) {
			out << ":";
		}
		out << std::hex << std::setw(2) << std::setfill('0') << int(v);
		first = false;
	}
	out.flags(flags);
	return out;
}

}
