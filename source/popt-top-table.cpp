/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <iostream>
#include <cstring>
#include <cstdio>

#include "popt.h"
#include "utils.h"
#include "ECMA48Output.h"

using namespace popt;

top_table_definition::~top_table_definition() {}

bool top_table_definition::execute(processor & proc, char c)
{
	if ('?' != c) return table_definition::execute(proc, c);
	do_help(proc);
	return true;
}

bool top_table_definition::execute(processor & proc, const char * s)
{
	if (0 == std::strcmp(s, "help"))
		do_help(proc);
	else
	if (0 == std::strcmp(s, "usage"))
		do_usage(proc);
	else
		return table_definition::execute(proc, s);
	return true;
}

/// One line: the program name, the combined short flags, then every long option, then the arguments.
void top_table_definition::write_usage(processor & proc, ECMA48Output & o, bool do_colour)
{
	std::string shorts("?");
	gather_combining_shorts(shorts);
	std::cout << "Usage: " << proc.name << " [-";
	put(o, do_colour, UNDERLINED, shorts);
	std::cout << "] [";
	put(o, do_colour, UNDERLINED, "--help");
	std::cout << "] [";
	put(o, do_colour, UNDERLINED, "--usage");
	std::cout << "] ";
	long_usage(o, do_colour);
	put(o, do_colour, ITALIC, arguments_description);
	std::cout.put('\n');
}

void top_table_definition::do_usage(processor & proc)
{
	ECMA48Output o(stdout);
	write_usage(proc, o, query_use_colours(proc.envs, o.fd()));
	std::cout.flush();
	proc.stop();
}

void top_table_definition::do_help(processor & proc)
{
	ECMA48Output o(stdout);
	const bool do_colour(query_use_colours(proc.envs, o.fd()));
	write_usage(proc, o, do_colour);
	std::cout.put('\n');
	help(o, do_colour);
	std::cout.flush();
	proc.stop();
}
