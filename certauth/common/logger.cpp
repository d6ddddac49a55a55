
#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace certauth {

char const* to_string(logger::type t) {
	switch(t) {
		case logger::error: return "error";
		case logger::info: return "info";
		case logger::debug: return "debug";
		case logger::debug_verbose: return "verbose";
		case logger::debug_trace: return "trace";
		default: break;
	}
	return "unknown";
}

void stdout_logger::do_log_line(logger::type t, std::string const& s, std::source_location&&) {
	std::printf("[%s] %s\n", to_string(t), s.c_str());
}

session_logger::session_logger(logger& l, std::string tag)
: log_(l)
, tag_(std::move(tag))
{}

void session_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

bool memory_logger::contains(std::string_view s) const {
	for(auto&& l : lines_) {
		if(l.find(s) != std::string::npos) {
			return true;
		}
	}
	return false;
}

void memory_logger::do_log_line(logger::type, std::string const& s, std::source_location&&) {
	lines_.push_back(s);
}

}
