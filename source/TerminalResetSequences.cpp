/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <cstring>
#include "TerminalResetSequences.h"

const
struct reset_sequence
reset_sequences[] = {
	// Mouse reporting and coordinate encodings
	{	"disable-mouse-tracking",		"\x1b[?1000l",	"Disable mouse tracking (mode 1000)"			},
	{	"disable-mouse-button-tracking",	"\x1b[?1002l",	"Disable mouse button-event tracking (mode 1002)"	},
	{	"disable-mouse-any-event-tracking",	"\x1b[?1003l",	"Disable mouse any-event tracking (mode 1003)"		},
	{	"disable-mouse-sgr-mode",		"\x1b[?1006l",	"Disable SGR extended mouse mode (mode 1006)"		},
	{	"disable-mouse-urxvt-mode",		"\x1b[?1015l",	"Disable URXVT mouse mode (mode 1015)"			},

	// Cursor, attributes, and screen buffer
	{	"show-cursor",				"\x1b[?25h",	"Show cursor"						},
	{	"reset-colours",			"\x1b[0m",	"Reset colors/attributes"				},
	{	"disable-alt-screen",			"\x1b[?1049l",	"Disable alternate screen buffer (mode 1049)"		},

	// Erasure, scrollback first
	{	"clear-scrollback",			"\x1b[3J",	"Clear scrollback buffer"				},
	{	"clear-screen",				"\x1b[2J",	"Clear visible screen"					},
	{	"home-cursor",				"\x1b[H",	"Move cursor to home position"				},
};
const std::size_t num_reset_sequences = sizeof reset_sequences/sizeof *reset_sequences;

const char reset_complete_message[] = "Terminal state reset complete";

const reset_sequence *
find_reset_sequence (
	const char * name
) {
	for ( const reset_sequence * s(reset_sequences); s != reset_sequences + num_reset_sequences; ++s )
		if (0 == std::strcmp(s->name, name))
			return s;
	return nullptr;
}

std::string
reset_sequence_block (
) {
	std::string r;
	for ( const reset_sequence * s(reset_sequences); s != reset_sequences + num_reset_sequences; ++s )
		r += s->bytes;
	return r;
}

// The whole block goes out in one write ahead of the message, so that it forms the first line of output.
bool
write_terminal_reset (
	FILE * f
) {
	const std::string block(reset_sequence_block());
	if (1U != std::fwrite(block.data(), block.length(), 1U, f))
		return false;
	if (EOF == std::fputs(reset_complete_message, f) || EOF == std::fputc('\n', f))
		return false;
	return 0 == std::fflush(f) && !std::ferror(f);
}
