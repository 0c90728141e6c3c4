/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <vector>
#include <cstdio>
#include <cstdlib>
#include "utils.h"
#include "TerminalResetSequences.h"

/* Main function ************************************************************
// **************************************************************************
*/

void
fix_terminal [[gnu::noreturn]] (
	const char * & /*next_prog*/,
	std::vector<const char *> & args,
	ProcessEnvironment & envs
) {
	const char * prog(basename_of(args[0]));
	// There are no options, not even --help; any arguments are ignored.
	if (!write_terminal_reset(stdout))
		die_errno(prog, envs, "<stdout>");
	throw EXIT_SUCCESS;
}
