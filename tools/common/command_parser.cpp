#include "command_parser.hpp"

#include <iomanip>

namespace certauth {

namespace {

struct flag_value : option_value {
	flag_value(bool& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(!args.empty()) {
			throw invalid_argument("flag does not take arguments");
		}
		value_ = true;
	}

	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool takes_arguments() const override {
		return false;
	}

	bool& value_;
};

bool is_option(std::string const& s) {
	// negative numbers are arguments
	return s.size() > 1 && s[0] == '-' && !(s[1] >= '0' && s[1] <= '9');
}

}

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<flag_value>(var), std::move(name), std::move(alias), std::move(info));
}

void command_parser::add_option(std::unique_ptr<option_value> v, std::string name, std::string alias, std::string info) {
	auto p = std::make_shared<option>(option{name, alias, std::move(info), std::move(v)});
	if(!name.empty()) {
		options_.insert({"--" + name, p});
	}
	if(!alias.empty()) {
		options_.insert({"-" + alias, p});
	}
}

option& command_parser::find(std::string const& arg) {
	auto it = options_.find(arg);
	if(it == options_.end()) {
		throw invalid_argument("no parameter named '" + arg + "'");
	}
	return *it->second;
}

void command_parser::parse(int argc, char* argv[]) {
	std::vector<std::string> args;
	for(int i = 1; i < argc; ++i) {
		args.emplace_back(argv[i]);
	}
	parse(args);
}

void command_parser::parse(std::vector<std::string> const& args) {
	for(std::size_t i = 0; i != args.size();) {
		if(!is_option(args[i])) {
			positionals_.push_back(args[i++]);
			continue;
		}

		option& opt = find(args[i++]);
		std::vector<std::string> values;
		if(opt.value->takes_arguments()) {
			for(; i != args.size() && !is_option(args[i]); ++i) {
				values.push_back(args[i]);
			}
		}
		opt.value->parse(values);
	}
}

void command_parser::print_help(std::ostream& out) const {
	for(auto&& [key, opt] : options_) {
		if(key.starts_with("--")) {
			std::string names = key;
			if(!opt->alias.empty()) {
				names += ", -" + opt->alias;
			}
			out << "  " << std::left << std::setw(36) << names << " " << opt->info;

			std::ostringstream value;
			opt->value->print(value);
			if(!value.str().empty()) {
				out << " (" << value.str() << ")";
			}
			out << "\n";
		}
	}
}

}
