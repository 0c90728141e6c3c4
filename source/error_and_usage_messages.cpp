/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <vector>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include "utils.h"
#include "ECMA48Output.h"
#include "ProcessEnvironment.h"
#include "popt.h"

/* Message composition ******************************************************
// **************************************************************************
*/

namespace {

inline
bool
use_colours (
	int fd
) {
	return isatty(fd);
}

/// Print "prog: FATAL: what: how" with optional what, colouring it when standard error is a terminal.
void
fatal_message (
	const char * prog,
	const char * what,
	const char * how
) {
	ECMA48Output o(stderr);
	const bool colours(use_colours(o.fd()));
	std::fprintf(stderr, "%s: ", prog);
	if (colours) o.SGRColour256(true /* foreground */, COLOUR_LIGHT_ORANGE);
	std::fputs("FATAL", stderr);
	if (colours) o.SGRColour(true /* foreground */);
	std::fputs(": ", stderr);
	if (what) {
		if (colours) o.SGRColour256(true /* foreground */, COLOUR_DARK_ORANGE);
		std::fputs(what, stderr);
		if (colours) o.SGRColour(true /* foreground */);
		std::fputs(": ", stderr);
	}
	if (colours) o.set_italics(true);
	std::fputs(how, stderr);
	if (colours) o.set_italics(false);
	std::fputc('\n', stderr);
}

}

/* Common usage messages throwing EXIT_USAGE ********************************
// **************************************************************************
*/

void
die [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & /*envs*/,
	const popt::error & e
) {
	fatal_message(prog, e.arg, e.msg);
	throw static_cast<int>(EXIT_USAGE);
}

void
die_usage [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & /*envs*/,
	const char * how
) {
	fatal_message(prog, nullptr, how);
	throw static_cast<int>(EXIT_USAGE);
}

void
die_usage [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & /*envs*/,
	const char * what,
	const char * how
) {
	fatal_message(prog, what, how);
	throw static_cast<int>(EXIT_USAGE);
}

void
die_invalid_argument [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const char * what,
	const char * how
) {
	die_usage(prog, envs, what, how);
}

/* Common fatal messages throwing EXIT_FAILURE ******************************
// **************************************************************************
*/

void
message_fatal_errno (
	const char * prog,
	const ProcessEnvironment & /*envs*/,
	int error,
	const char * what
) {
	fatal_message(prog, what, std::strerror(error));
}

void
die_errno [[gnu::noreturn]] (
	const char * prog,
	const ProcessEnvironment & envs,
	const char * what
) {
	message_fatal_errno(prog, envs, errno, what);
	throw static_cast<int>(EXIT_FAILURE);
}
