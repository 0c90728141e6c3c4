/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <iostream>
#include <cstring>

#include "popt.h"
#include "ECMA48Output.h"

using namespace popt;

namespace {

	std::size_t
	width_of (
		const named_definition & n
	) {
		std::size_t l(0U);
		if (n.query_short_name()) l += 2U;
		if (const char * long_name = n.query_long_name()) {
			if (n.query_short_name()) l += 2U;
			l += 2U + std::strlen(long_name);
		}
		if (const char * args_description = n.query_args_description())
			l += 1U + std::strlen(args_description);
		return l;
	}

}

/// std::cout and the ECMA48Output share the underlying stdout, so each is flushed before the other is used.
void
popt::put (
	ECMA48Output & out,
	bool do_colour,
	text_style style,
	const std::string & text
) {
	if (do_colour && PLAIN != style) {
		std::cout.flush();
		if (UNDERLINED == style) out.set_underline(true); else out.set_italics(true);
		out.flush();
	}
	std::cout << text;
	if (do_colour && PLAIN != style) {
		std::cout.flush();
		if (UNDERLINED == style) out.set_underline(false); else out.set_italics(false);
		out.flush();
	}
}

table_definition::~table_definition() {}
bool table_definition::execute(processor & proc, char c)
{
	for (unsigned i(0); i < count; ++i)
		if (array[i]->execute(proc, c))
			return true;
	return false;
}
bool table_definition::execute(processor & proc, const char * s)
{
	for (unsigned i(0); i < count; ++i)
		if (array[i]->execute(proc, s))
			return true;
	return false;
}
void table_definition::help(ECMA48Output & out, bool do_colour)
{
	std::size_t w(0U);
	bool any(false);
	for (unsigned i(0); i < count; ++i)
		if (const named_definition * n = dynamic_cast<const named_definition *>(array[i])) {
			const std::size_t l(width_of(*n));
			if (l > w) w = l;
			any = true;
		}
	if (any)
		std::cout << description << ":\n";
	for (unsigned i(0); i < count; ++i)
		if (const named_definition * n = dynamic_cast<const named_definition *>(array[i])) {
			std::cout.put('\t');
			if (char short_name = n->query_short_name()) {
				put(out, do_colour, UNDERLINED, std::string(1, '-') + short_name);
				if (n->query_long_name())
					std::cout << ", ";
			}
			if (const char * long_name = n->query_long_name())
				put(out, do_colour, UNDERLINED, std::string("--") + long_name);
			if (const char * args_description = n->query_args_description()) {
				std::cout.put(' ');
				put(out, do_colour, ITALIC, args_description);
			}
			for (std::size_t l(width_of(*n)); l < w; ++l)
				std::cout.put(' ');
			if (const char * entry_description = n->query_description())
				std::cout.put(' ') << entry_description;
			std::cout.put('\n');
		}
	for (unsigned i(0); i < count; ++i)
		if (table_definition * t = dynamic_cast<table_definition *>(array[i]))
			t->help(out, do_colour);
}
void table_definition::long_usage(ECMA48Output & out, bool do_colour)
{
	for (unsigned i(0); i < count; ++i)
		if (const named_definition * n = dynamic_cast<const named_definition *>(array[i])) {
			const char * long_name = n->query_long_name();
			const char * args_description = n->query_args_description();
			if (!long_name && !args_description) continue;
			std::cout.put('[');
			if (args_description && n->query_short_name()) {
				put(out, do_colour, UNDERLINED, std::string(1, '-') + n->query_short_name());
				if (long_name) std::cout.put('|');
			}
			if (long_name)
				put(out, do_colour, UNDERLINED, std::string("--") + long_name);
			if (args_description) {
				std::cout.put(' ');
				put(out, do_colour, ITALIC, args_description);
			}
			std::cout << "] ";
		}
	for (unsigned i(0); i < count; ++i)
		if (table_definition * t = dynamic_cast<table_definition *>(array[i]))
			t->long_usage(out, do_colour);
}
void table_definition::gather_combining_shorts(std::string & shorts)
{
	for (unsigned i(0); i < count; ++i)
		if (const named_definition * n = dynamic_cast<const named_definition *>(array[i])) {
			if (!n->query_args_description()) {
				if (char short_name = n->query_short_name())
					shorts += short_name;
			}
		}
	for (unsigned i(0); i < count; ++i)
		if (table_definition * t = dynamic_cast<table_definition *>(array[i]))
			t->gather_combining_shorts(shorts);
}
