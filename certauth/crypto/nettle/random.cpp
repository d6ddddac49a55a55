#include "nettle_helper.hpp"
#include "certauth/crypto/random.hpp"

#include <memory>

#include <nettle/yarrow.h>
#include <sys/random.h>

namespace certauth::nettle {

class random : public certauth::random {
public:
	random() {
		nettle_yarrow256_init(&ctx_, 0, nullptr);
	}

	// yarrow needs seed before it produces output
	bool seed() {
		std::byte buf[YARROW256_SEED_FILE_SIZE];
		bool ok = fill_entropy(buf, [](std::byte* p, std::size_t size) {
				return ::getrandom(p, size, 0);
			});
		if(!ok) {
			return false;
		}
		nettle_yarrow256_seed(&ctx_, sizeof(buf), to_uint8_ptr(span(buf)));
		return nettle_yarrow256_is_seeded(&ctx_) != 0;
	}

	void random_bytes(span output) override {
		nettle_yarrow256_random(&ctx_, output.size(), to_uint8_ptr(output));
	}

private:
	yarrow256_ctx ctx_;
};

// nullptr if the kernel entropy pool is not available
std::unique_ptr<certauth::random> create_random() {
	auto r = std::make_unique<random>();
	if(!r->seed()) {
		return nullptr;
	}
	return r;
}

}
