/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <vector>
#include <cstdio>
#include <cstdlib>
#include "popt.h"
#include "utils.h"
#include "VisEncoder.h"
#include "TerminalResetSequences.h"

/* Main function ************************************************************
// **************************************************************************
*/

void
fix_terminal_sequences [[gnu::noreturn]] (
	const char * & next_prog,
	std::vector<const char *> & args,
	ProcessEnvironment & envs
) {
	const char * prog(basename_of(args[0]));
	bool names_only(false), long_format(false), raw(false);
	try {
		popt::bool_definition names_option('n', "names", "List only the names of the sequences.", names_only);
		popt::bool_definition long_option('l', "long", "Also list the description of each sequence.", long_format);
		popt::bool_definition raw_option('r', "raw", "Output the sequences themselves instead of a list.", raw);
		popt::definition * top_table[] = {
			&names_option,
			&long_option,
			&raw_option
		};
		popt::top_table_definition main_option(sizeof top_table/sizeof *top_table, top_table, "Main options", "[name(s)]");

		std::vector<const char *> new_args;
		popt::arg_processor<const char **> p(args.data() + 1, args.data() + args.size(), prog, envs, main_option, new_args);
		p.process(true /* strictly options before arguments */);
		args = new_args;
		next_prog = arg0_of(args);
		if (p.stopped()) throw EXIT_SUCCESS;
	} catch (const popt::error & e) {
		die(prog, envs, e);
	}
	if (raw && (names_only || long_format))
		die_usage(prog, envs, "--raw", "Cannot be combined with --names or --long.");

	std::vector<const reset_sequence *> selected;
	if (args.empty()) {
		for ( const reset_sequence * s(reset_sequences); s != reset_sequences + num_reset_sequences; ++s )
			selected.push_back(s);
	} else
	{
		for (std::vector<const char *>::const_iterator b(args.begin()), e(args.end()), i(b); e != i; ++i) {
			const reset_sequence * s(find_reset_sequence(*i));
			if (!s) die_invalid_argument(prog, envs, *i, "Unknown sequence name.");
			selected.push_back(s);
		}
	}

	for (std::vector<const reset_sequence *>::const_iterator b(selected.begin()), e(selected.end()), i(b); e != i; ++i) {
		const reset_sequence & s(**i);
		if (raw)
			std::fputs(s.bytes, stdout);
		else
		if (names_only)
			std::fprintf(stdout, "%s\n", s.name);
		else
		{
			std::fprintf(stdout, "%s\t%s", s.name, VisEncoder::process(s.bytes).c_str());
			if (long_format)
				std::fprintf(stdout, "\t%s", s.description);
			std::fputc('\n', stdout);
		}
	}
	if (0 != std::fflush(stdout) || std::ferror(stdout))
		die_errno(prog, envs, "<stdout>");

	throw EXIT_SUCCESS;
}
