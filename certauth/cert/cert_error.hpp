#ifndef CERTAUTH_CERT_CERT_ERROR_HEADER
#define CERTAUTH_CERT_CERT_ERROR_HEADER

#include "certauth/common/types.hpp"

#include <string>
#include <utility>
#include <variant>

namespace certauth {

enum class cert_errc : std::uint32_t {
	none = 0,
	not_a_buffer,          // certificate data was not binary
	not_a_certificate,     // data does not look like openssh certificate
	invalid_certificate,   // truncated or malformed field
	unsupported_key_type,  // unknown certificate algorithm identifier
	invalid_key            // base key missing or not usable
};

std::string_view to_string(cert_errc);

class cert_error {
public:
	cert_error() = default;
	cert_error(cert_errc code, std::string msg)
	: code_(code)
	, message_(std::move(msg))
	{}

	cert_errc code() const { return code_; }
	std::string const& message() const { return message_; }

	/// this is an error if error code is not none
	explicit operator bool() const {
		return code_ != cert_errc::none;
	}

	bool operator==(cert_error const&) const = default;

private:
	cert_errc code_{};
	std::string message_;
};

/// either the value or the error why it could not be produced
template<typename T>
class cert_result {
public:
	cert_result(T v)
	: value_(std::move(v))
	{}

	cert_result(cert_error e)
	: value_(std::move(e))
	{
		CERTAUTH_ASSERT(std::get<cert_error>(value_), "result error without error code");
	}

	bool has_value() const {
		return std::holds_alternative<T>(value_);
	}

	explicit operator bool() const {
		return has_value();
	}

	T const& value() const& {
		return std::get<T>(value_);
	}

	T&& value() && {
		return std::get<T>(std::move(value_));
	}

	T const& operator*() const& {
		return value();
	}

	T const* operator->() const {
		return &value();
	}

	/// error, or empty error if there is value
	cert_error error() const {
		if(auto e = std::get_if<cert_error>(&value_)) {
			return *e;
		}
		return {};
	}

private:
	std::variant<T, cert_error> value_;
};

}

#endif
