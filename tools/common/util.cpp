#include "util.hpp"
#include "command_parser.hpp"

#include <fstream>

namespace certauth {

byte_vector read_file(std::string const& file) {
	byte_vector b;
	std::ifstream f(file, std::ios_base::binary);
	if(!f) {
		throw invalid_argument("failed to open file '" + file + "'");
	}
	f.seekg(0, std::ios_base::end);
	auto size = f.tellg();
	f.seekg(0, std::ios_base::beg);
	b.resize(size);
	if(!f.read((char*)b.data(), size)) {
		throw invalid_argument("failed to read file '" + file + "'");
	}
	return b;
}

std::string read_text_file(std::string const& file) {
	byte_vector b = read_file(file);
	std::string s(to_string_view(b));
	while(!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
		s.pop_back();
	}
	return s;
}

}
