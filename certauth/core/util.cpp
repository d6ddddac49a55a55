
#include "util.hpp"

namespace certauth {

hash_binout::hash_binout(certauth::hash& hash)
: hash(hash)
{
}

bool hash_binout::process(const_span data) {
	hash.process(data);
	return true;
}

}
