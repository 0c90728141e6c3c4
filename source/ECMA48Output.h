/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_ECMA48OUTPUT_H)
#define INCLUDE_ECMA48OUTPUT_H

#include <cstdio>
#include <stdint.h>
#include "ControlCharacters.h"

/// \brief Output ECMA-48 graphic rendition to a stdio stream
///
/// C1 characters are always written as their 7-bit ESC aliases, which is what diagnostics and option help need.
class ECMA48Output
{
public:
	explicit ECMA48Output(FILE * f) : out(f) {}

	void print_control_character(unsigned char) const;
	void csi() const { print_control_character(CSI); }

	/// \name Select Graphic Rendition
	/// @{
	void SGR(unsigned int) const;
	void set_italics(bool v) const { SGR(v ? 3U : 23U); }
	void set_underline(bool v) const { SGR(v ? 4U : 24U); }
	void SGRColour(bool is_fg) const;
	void SGRColour256(bool is_fg, uint_least8_t) const;
	/// @}

	void flush() const { std::fflush(out); }
	int fd() const { return fileno(out); }
protected:
	FILE * out;
};

/// Indexes into the XTerm 256-colour palette that diagnostics use.
enum {
	COLOUR_DARK_ORANGE = 208U,
	COLOUR_LIGHT_ORANGE = 214U,
};

#endif
