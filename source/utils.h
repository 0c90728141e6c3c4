/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_UTILS_H)
#define INCLUDE_UTILS_H

#include <vector>
#include <cstdlib>

enum {
	EXIT_USAGE = EXIT_FAILURE
};

struct ProcessEnvironment;

extern
const char *
basename_of (
	const char * s
) ;
extern inline
const char *
arg0_of (
	std::vector<const char *> & args
) {
	return args.empty() ? nullptr : args[0];
}
extern
bool
query_use_colours (
	const ProcessEnvironment & envs,
	int fd
) ;
extern
void
message_fatal_errno (
	const char * prog,
	const ProcessEnvironment & envs,
	int error,
	const char * what
) ;
extern
void
die_errno [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const char * what
) ;
extern
void
die_usage [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const char * how
) ;
extern
void
die_usage [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const char * what,
	const char * how
) ;
extern
void
die_invalid_argument [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const char * what,
	const char * how
) ;
namespace popt { struct error; }
extern
void
die [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const popt::error & e
) ;

#endif
