/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <cstring>
#include "popt.h"

using namespace popt;

processor::~processor() {}

definition::~definition() {}

named_definition::~named_definition() {}

simple_named_definition::~simple_named_definition() {}
bool simple_named_definition::execute(processor & proc, char c)
{
	if (!short_name || short_name != c) return false;
	action(proc);
	set = true;
	return true;
}
bool simple_named_definition::execute(processor & proc, const char * s)
{
	if (!long_name || 0 != std::strcmp(long_name, s)) return false;
	action(proc);
	set = true;
	return true;
}

bool_definition::~bool_definition() {}
void bool_definition::action(processor &)
{
	value = true;
}
