#ifndef CERTAUTH_CORE_SSH_BINARY_UTIL_HEADER
#define CERTAUTH_CORE_SSH_BINARY_UTIL_HEADER

#include "util.hpp"
#include "certauth/common/types.hpp"
#include "certauth/common/util.hpp"

#include <cstring>

namespace certauth {

/** \brief rfc4251 data types written to a byte sink
 *
 *  Sink derives from this and provides bool put(const_span) that appends the bytes.
 */
template<typename Sink>
class ssh_bf_basic_writer {
public:
	bool write(std::uint64_t v) {
		std::byte arr[8];
		u64ton(v, arr);
		return put(arr);
	}

	bool write(std::uint32_t v) {
		std::byte arr[4];
		u32ton(v, arr);
		return put(arr);
	}

	bool write(std::uint8_t v) {
		std::byte b{v};
		return put(const_span(&b, 1));
	}

	bool write(bool v) {
		return write(std::uint8_t{v});
	}

	bool write(std::string_view v) {
		return write(std::uint32_t(v.size())) && put(to_span(v));
	}

	// raw bytes without length prefix
	bool write(const_span s) {
		return put(s);
	}

	// leading zeroes are dropped, unsigned value with the high bit set gets one zero in front
	bool write(const_mpint_span mpint) {
		const_span d = mpint.data;
		while(!d.empty() && d[0] == std::byte{0x0}) {
			d = d.subspan(1);
		}
		bool pad = !d.empty()
			&& mpint.sign == const_mpint_span::unsigned_t
			&& (std::to_integer<std::uint8_t>(d[0]) & 0x80);

		if(pad) {
			return write(std::uint32_t(d.size()+1))
				&& write(std::uint8_t{0x0})
				&& put(d);
		}
		return write(std::uint32_t(d.size())) && put(d);
	}

private:
	bool put(const_span s) {
		return static_cast<Sink&>(*this).put(s);
	}
};

/// writes to byte_vector starting from pos, the vector grows as needed
class ssh_bf_writer : public ssh_bf_basic_writer<ssh_bf_writer> {
public:
	ssh_bf_writer(byte_vector& out, std::size_t pos = 0)
	: out_(out)
	, pos_(pos)
	{
	}

	std::size_t used_size() const {
		return pos_;
	}

	bool put(const_span s) {
		if(out_.size() < pos_ + s.size()) {
			out_.resize(pos_ + s.size());
		}
		if(!s.empty()) {
			std::memcpy(out_.data()+pos_, s.data(), s.size());
		}
		pos_ += s.size();
		return true;
	}

private:
	byte_vector& out_;
	std::size_t pos_{};
};

/// writes to binout, e.g. directly to hash
class ssh_bf_binout_writer : public ssh_bf_basic_writer<ssh_bf_binout_writer> {
public:
	ssh_bf_binout_writer(binout& out)
	: out_(out)
	{}

	bool put(const_span s) {
		return out_.process(s);
	}

private:
	binout& out_;
};

/// bound checked reader, a failed read never moves the position
class ssh_bf_reader {
public:
	ssh_bf_reader(const_span in)
	: in_(in)
	{
	}

	const_span rest_of_span() const {
		return in_.subspan(pos_);
	}

	std::size_t used_size() const {
		return pos_;
	}

	std::size_t size_left() const {
		return in_.size() - pos_;
	}

	bool read(std::uint64_t& v) {
		const_span s;
		bool ret = take(8, s);
		if(ret) {
			v = ntou64(s.data());
		}
		return ret;
	}

	bool read(std::uint32_t& v) {
		const_span s;
		bool ret = take(4, s);
		if(ret) {
			v = ntou32(s.data());
		}
		return ret;
	}

	bool read(std::uint8_t& v) {
		const_span s;
		bool ret = take(1, s);
		if(ret) {
			v = std::to_integer<std::uint8_t>(s[0]);
		}
		return ret;
	}

	bool read(bool& v) {
		std::uint8_t b{};
		bool ret = read(b);
		if(ret) {
			v = b != 0;
		}
		return ret;
	}

	bool read(std::string_view& v) {
		if(size_left() < 4) {
			return false;
		}
		std::uint32_t size = ntou32(in_.data() + pos_);
		if(size_left() - 4 < size) {
			return false;
		}
		pos_ += 4;
		const_span s;
		take(size, s);
		v = to_string_view(s);
		return true;
	}

	bool read(const_mpint_span& mpint) {
		std::string_view s;
		bool ret = read(s);
		if(ret) {
			if(s.empty()) {
				mpint = const_mpint_span{};
			} else if(std::uint8_t(s[0]) & 0x80) {
				mpint = const_mpint_span{to_span(s), const_mpint_span::signed_t};
			} else {
				mpint = to_umpint(s);
			}
		}
		return ret;
	}

	/// raw bytes without length prefix
	bool read_bytes(std::size_t size, const_span& out) {
		return take(size, out);
	}

private:
	bool take(std::size_t size, const_span& out) {
		if(size_left() < size) {
			return false;
		}
		out = in_.subspan(pos_, size);
		pos_ += size;
		return true;
	}

private:
	const_span in_;
	std::size_t pos_{};
};

}

#endif
