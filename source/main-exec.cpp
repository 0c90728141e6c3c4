/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <vector>
#include <cstdlib>
#include <cstring>
#include "utils.h"
#include "builtins.h"
#include "ProcessEnvironment.h"

/* Utilities ****************************************************************
// **************************************************************************
*/

namespace {

inline
const command *
find (
	const char * prog
) {
	for ( const command * c(commands); c != commands + num_commands; ++c )
		if (0 == std::strcmp(c->name, prog))
			return c;
	return nullptr;
}

}

/* Main function ************************************************************
// **************************************************************************
*/

int
main (
	int argc,
	const char * argv[],
	const char * envp[]
) {
	if (argc < 1) return EXIT_USAGE;
	std::vector<const char *> args(argv, argv + argc);
	ProcessEnvironment envs(envp);
	const char * next_prog(arg0_of(args));
	const char * prog(basename_of(next_prog));
	try {
		const command * c(find(prog));
		if (!c) die_usage(prog, envs, "Unknown command personality.");
		// Commands exit by throwing their exit status.
		c->func(next_prog, args, envs);
	} catch (int r) {
		return r;
	}
	return EXIT_SUCCESS;
}
