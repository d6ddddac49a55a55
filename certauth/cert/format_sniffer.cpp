#include "format_sniffer.hpp"
#include "certificate.hpp"

#include "certauth/common/util.hpp"

namespace certauth {

bool is_certificate(const_span data) noexcept {
	if(data.size() < 4) {
		return false;
	}
	std::uint32_t size = ntou32(data.data());
	if(size > max_cert_algorithm_size || data.size() - 4 < size) {
		return false;
	}
	return to_string_view(data.subspan(4, size)).find("-cert-v") != std::string_view::npos;
}

}
