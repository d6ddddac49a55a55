#ifndef CERTAUTH_TOOLS_COMMON_UTIL_HEADER
#define CERTAUTH_TOOLS_COMMON_UTIL_HEADER

#include "certauth/common/types.hpp"

#include <string>

namespace certauth {

// throws invalid_argument if the file cannot be read
byte_vector read_file(std::string const& file);

// the file content as text, trailing new lines removed
std::string read_text_file(std::string const& file);

}

#endif
