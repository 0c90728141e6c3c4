/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include "ECMA48Output.h"

void
ECMA48Output::print_control_character(
	unsigned char character
) const {
	if (character >= 0x80) {
		std::putc(ESC, out);
		character -= 0x40;
	}
	std::putc(character, out);
}

void
ECMA48Output::SGR(
	unsigned int attribute
) const {
	csi();
	std::fprintf(out, "%um", attribute);
}

void
ECMA48Output::SGRColour(
	bool is_fg
) const {
	SGR(is_fg ? 39U : 49U);
}

void
ECMA48Output::SGRColour256(
	bool is_fg,
	uint_least8_t index
) const {
	csi();
	std::fprintf(out, "%u;5;%um", is_fg ? 38U : 48U, static_cast<unsigned int>(index));
}
