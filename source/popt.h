/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_POPT_H)
#define INCLUDE_POPT_H

#include <vector>
#include <string>

struct ProcessEnvironment;
class ECMA48Output;

/// \brief Command-line option processing
///
/// Options are described by tables of definitions.
/// A top table adds -?, --help, and --usage to whatever it contains.
namespace popt {

	enum text_style { PLAIN, UNDERLINED, ITALIC };
	/// Write text to std::cout, with the given rendition when colouring.
	extern void put(ECMA48Output &, bool do_colour, text_style, const std::string &);

	struct error {
		error(const char * a, const char * m) : arg(a), msg(m) {}
		const char * arg, * msg;
	};

	struct processor {
		processor(const char * n, const ProcessEnvironment & e) : name(n), envs(e), is_stopped(false) {}
		virtual ~processor();
		const char * name;
		const ProcessEnvironment & envs;
		void stop() { is_stopped = true; }
		bool stopped() const { return is_stopped; }
	protected:
		bool is_stopped;
	};

	struct definition {
		virtual ~definition() = 0;
		virtual bool execute(processor &, char c) = 0;
		virtual bool execute(processor &, const char * s) = 0;
	};

	struct named_definition : public definition {
		named_definition(char s, const char * l, const char * a, const char * d) : short_name(s), long_name(l), args_description(a), description(d) {}
		virtual ~named_definition() = 0;
		char query_short_name() const { return short_name; }
		const char * query_long_name() const { return long_name; }
		const char * query_args_description() const { return args_description; }
		const char * query_description() const { return description; }
	protected:
		char short_name;
		const char * long_name, * args_description, * description;
	};

	/// An option that takes no argument.
	struct simple_named_definition : public named_definition {
		simple_named_definition(char s, const char * l, const char * d) : named_definition(s, l, nullptr, d), set(false) {}
		virtual ~simple_named_definition() = 0;
		bool is_set() const { return set; }
		virtual bool execute(processor &, char c);
		virtual bool execute(processor &, const char * s);
	protected:
		virtual void action(processor &) = 0;
		bool set;
	};

	struct bool_definition : public simple_named_definition {
		bool_definition(char s, const char * l, const char * d, bool & v) : simple_named_definition(s, l, d), value(v) {}
		virtual ~bool_definition();
	protected:
		virtual void action(processor &);
		bool & value;
	};

	struct table_definition : public definition {
		table_definition(unsigned c, definition * const * v, const char * d) : count(c), array(v), description(d) {}
		virtual ~table_definition();
		virtual bool execute(processor &, char c);
		virtual bool execute(processor &, const char * s);
		void help(ECMA48Output &, bool do_colour);
		void long_usage(ECMA48Output &, bool do_colour);
		void gather_combining_shorts(std::string &);
	protected:
		unsigned count;
		definition * const * array;
		const char * description;
	};

	struct top_table_definition : public table_definition {
		top_table_definition(unsigned c, definition * const * v, const char * d, const char * a) : table_definition(c, v, d), arguments_description(a) {}
		virtual ~top_table_definition();
		virtual bool execute(processor &, char c);
		virtual bool execute(processor &, const char * s);
	protected:
		const char * arguments_description;
		void write_usage(processor &, ECMA48Output &, bool do_colour);
		void do_help(processor &);
		void do_usage(processor &);
	};

	/// \brief Process a range of arguments against a definition
	///
	/// Non-option arguments are appended to the file vector.
	/// A "--" ends option processing, as does (optionally) the first non-option argument.
	template <class InputIterator>
	struct arg_processor : public processor {
		arg_processor(InputIterator b, InputIterator e, const char * n, const ProcessEnvironment & v, definition & d, std::vector<const char *> & f) : processor(n, v), current(b), end(e), def(d), file_vector(f) {}
		void process(bool strictly_options_before_arguments);
	protected:
		InputIterator current, end;
		definition & def;
		std::vector<const char *> & file_vector;
	};

	template <class InputIterator>
	void
	arg_processor<InputIterator>::process(
		bool strictly_options_before_arguments
	) {
		while (current != end && !stopped()) {
			const char * arg(*current++);
			if ('-' != arg[0] || '\0' == arg[1]) {
				file_vector.push_back(arg);
				if (strictly_options_before_arguments) break;
				continue;
			}
			if ('-' == arg[1]) {
				if ('\0' == arg[2]) break;
				if (!def.execute(*this, arg + 2))
					throw error(arg, "unknown option");
			} else
			{
				for (const char * p(arg + 1); *p && !stopped(); ++p)
					if (!def.execute(*this, *p))
						throw error(arg, "unknown option");
			}
		}
		while (current != end)
			file_vector.push_back(*current++);
	}

}

#endif
