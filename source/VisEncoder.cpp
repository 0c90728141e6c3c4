/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <string>
#include "VisEncoder.h"

namespace {

	// This is the subset of vis() with VIS_WHITE that control sequences need.
	// Whitespace is always encoded; backslash is doubled.
	void
	vis (
		std::string & r,
		unsigned char c
	) {
		if ('\\' == c) {
			r += "\\\\";
			return;
		}
		if (c > 0x20 && c < 0x7F) {
			r += static_cast<char>(c);
			return;
		}
		r += '\\';
		if (0xA0 == c) {
			r += "240";
			return;
		}
		if (0x20 == c) {
			r += "040";
			return;
		}
		if (0x80 <= c) {
			r += 'M';
			c -= 0x80;
		}
		if (c < 0x20) {
			r += '^';
			r += static_cast<char>(c + 0x40);
		} else
		if (0x7F == c) {
			r += "^?";
		} else
		{
			r += '-';
			r += static_cast<char>(c);
		}
	}

}

std::string
VisEncoder::process (
	const std::string & s
) {
	std::string r;
	for (std::string::const_iterator p(s.begin()), e(s.end()); p != e; ++p)
		vis(r, static_cast<unsigned char>(*p));
	return r;
}
