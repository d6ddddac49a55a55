#ifndef CERTAUTH_CORE_UTIL_HEADER
#define CERTAUTH_CORE_UTIL_HEADER

#include "certauth/common/types.hpp"
#include "certauth/crypto/hash.hpp"

namespace certauth {

/// output sink for binary serialisation
class binout {
public:
	virtual bool process(const_span data) = 0;
protected:
	~binout() = default;
};

struct hash_binout : binout {
	hash_binout(certauth::hash& hash);

	bool process(const_span data) override;

public:
	certauth::hash& hash;
};

/// appends to byte_vector or std::string
template<typename Container>
struct append_binout : binout {
	append_binout(Container& buf)
	: buf(buf)
	{}

	bool process(const_span data) override {
		auto p = reinterpret_cast<typename Container::value_type const*>(data.data());
		buf.insert(buf.end(), p, p + data.size());
		return true;
	}

public:
	Container& buf;
};

using byte_vector_binout = append_binout<byte_vector>;
using string_binout = append_binout<std::string>;

}

#endif
