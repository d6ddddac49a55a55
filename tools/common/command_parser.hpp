#ifndef CERTAUTH_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define CERTAUTH_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace certauth {

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

template<typename Container>
std::ostream& print_list(std::ostream& out, Container const& c, std::string_view separator) {
	bool first = true;
	for(auto&& v : c) {
		if(!first) {
			out << separator;
		}
		first = false;
		out << v;
	}
	return out;
}

struct option_value {
	virtual ~option_value() = default;
	virtual void parse(std::vector<std::string> const&) = 0;
	virtual void print(std::ostream&) const = 0;
	// flags do not take arguments
	virtual bool takes_arguments() const { return true; }
};

struct option {
	std::string name;
	std::string alias;
	std::string info;
	std::unique_ptr<option_value> value;
};

/** \brief Command line options of the tools
 *
 *  Options are given as "--name [args...]" or "-alias [args...]", the arguments run until the next
 *  option. Arguments before the first option are positionals.
 */
class command_parser {
public:
	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);
	template<typename T>
	void add(std::vector<T>& var, std::string name, std::string alias, std::string info);
	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);
	void add(bool& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char* argv[]);
	void parse(std::vector<std::string> const& args);

	std::vector<std::string> const& positionals() const { return positionals_; }

	void print_help(std::ostream&) const;

private:
	void add_option(std::unique_ptr<option_value>, std::string name, std::string alias, std::string info);
	option& find(std::string const& arg);

private:
	std::map<std::string, std::shared_ptr<option>> options_;
	std::vector<std::string> positionals_;
};

template<typename T>
void read_value(std::string const& arg, T& out) {
	if constexpr(std::is_same_v<std::string, T>) {
		out = arg;
	} else {
		std::istringstream in(arg);
		if(!(in >> out) || !(in >> std::ws).eof()) {
			throw invalid_argument("failed to interpret argument '" + arg + "'");
		}
	}
}

template<typename T>
struct single_value : option_value {
	single_value(T& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		if(args.size() != 1) {
			std::ostringstream out;
			print_list(out, args, ",");
			throw invalid_argument("invalid amount of arguments: [" + out.str() + "]");
		}
		read_value(args[0], value_);
	}

	void print(std::ostream& o) const override {
		o << value_;
	}

	T& value_;
};

template<typename T>
struct list_value : option_value {
	list_value(std::vector<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		for(auto&& a : args) {
			T temp{};
			read_value(a, temp);
			value_.push_back(std::move(temp));
		}
	}

	void print(std::ostream& o) const override {
		print_list(o, value_, ", ");
	}

	std::vector<T>& value_;
};

template<typename T>
struct optional_value : option_value {
	optional_value(std::optional<T>& v)
	: value_(v)
	{}

	void parse(std::vector<std::string> const& args) override {
		T temp{};
		single_value<T>(temp).parse(args);
		value_ = std::move(temp);
	}

	void print(std::ostream& o) const override {
		if(value_) {
			o << *value_;
		}
	}

	std::optional<T>& value_;
};

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<single_value<T>>(var), std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::vector<T>& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<list_value<T>>(var), std::move(name), std::move(alias), std::move(info));
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_option(std::make_unique<optional_value<T>>(var), std::move(name), std::move(alias), std::move(info));
}

}

#endif
