#ifndef CERTAUTH_COMMON_UTIL_HEADER
#define CERTAUTH_COMMON_UTIL_HEADER

#include "types.hpp"

#include <algorithm>
#include <concepts>
#include <cstring>
#include <iosfwd>
#include <string_view>
#include <type_traits>
#include <vector>

namespace certauth {

byte_vector decode_base64(std::string_view);
std::string encode_base64(const_span, bool pad = false);

// big endian (network order) unsigned integers
template<std::unsigned_integral T>
inline void store_be(T v, std::byte* out) {
	for(std::size_t i = sizeof(T); i != 0; --i) {
		out[i-1] = std::byte(v & 0xff);
		v >>= 8;
	}
}

template<std::unsigned_integral T>
inline T load_be(std::byte const* in) {
	T v{};
	for(std::size_t i = 0; i != sizeof(T); ++i) {
		v = (v << 8) | std::to_integer<T>(in[i]);
	}
	return v;
}

inline void u32ton(std::uint32_t v, std::byte* out) { store_be(v, out); }
inline void u64ton(std::uint64_t v, std::byte* out) { store_be(v, out); }
inline std::uint32_t ntou32(std::byte const* in) { return load_be<std::uint32_t>(in); }
inline std::uint64_t ntou64(std::byte const* in) { return load_be<std::uint64_t>(in); }

// as per rfc4251 the unsigned mpint has leading 0 byte if the high bit is set, this removes that
inline const_mpint_span to_umpint(const_span mpint) {
	while(!mpint.empty() && mpint[0] == std::byte{0x0}) {
		mpint = mpint.subspan(1);
	}
	return const_mpint_span{mpint};
}

inline const_mpint_span to_umpint(std::string_view mpint) {
	return to_umpint(to_span(mpint));
}

template<class T> concept Byte = std::is_same_v<std::remove_cv_t<T>, std::byte>;

/// std::span doesn't clamp the count to the size-offset which is what we want
template<Byte T>
inline std::span<T> safe_subspan(std::span<T> s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	if(offset >= s.size()) {
		return {};
	}
	if(count != std::dynamic_extent) {
		count = std::min(count, s.size()-offset);
	}
	return s.subspan(offset, count);
}

inline const_span safe_subspan(byte_vector const& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(const_span(s), offset, count);
}

/// join strings with separator, used for human readable lists
template<typename Container>
std::string join(Container const& c, std::string_view separator) {
	std::string res;
	bool first = true;
	for(auto&& v : c) {
		if(!first) {
			res += separator;
		}
		res += v;
		first = false;
	}
	return res;
}

std::ostream& operator<<(std::ostream&, const_span);

}

#endif
