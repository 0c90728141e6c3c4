/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <vector>
#include <cstddef>
#include "builtins.h"

/* Table of commands ********************************************************
// **************************************************************************
*/

// The binary is invoked by these names, usually through links.

extern void fix_terminal ( const char * &, std::vector<const char *> &, ProcessEnvironment & );
extern void fix_terminal_sequences ( const char * &, std::vector<const char *> &, ProcessEnvironment & );

const
struct command
commands[] = {
	{	"fix-terminal",			fix_terminal			},
	{	"fix-terminal-sequences",	fix_terminal_sequences		},
};
const std::size_t num_commands = sizeof commands/sizeof *commands;
