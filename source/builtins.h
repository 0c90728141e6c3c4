/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_BUILTINS_H)
#define INCLUDE_BUILTINS_H

#include <vector>
#include <cstddef>

/* The table of built-in commands *******************************************
// **************************************************************************
*/

struct ProcessEnvironment;

struct command {
	const char * name;
	void (*func) ( const char * &, std::vector<const char *> &, ProcessEnvironment & );
} ;

extern const command commands[];
extern const std::size_t num_commands;

#endif
