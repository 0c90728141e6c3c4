/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_TERMINALRESETSEQUENCES_H)
#define INCLUDE_TERMINALRESETSEQUENCES_H

#include <string>
#include <cstddef>
#include <cstdio>

/* The table of terminal reset control sequences ****************************
// **************************************************************************
*/

struct reset_sequence {
	const char * name;	///< a command-line-friendly identifier
	const char * bytes;	///< the control sequence itself, 7-bit
	const char * description;
} ;

/// The sequences in the order that they are output.
/// None of them toggles anything; each sets a mode or attribute to an absolute value.
extern const reset_sequence reset_sequences[];
extern const std::size_t num_reset_sequences;

extern const char reset_complete_message[];

extern
const reset_sequence *
find_reset_sequence (
	const char * name
) ;
extern
std::string
reset_sequence_block (
) ;
extern
bool
write_terminal_reset (
	FILE * f
) ;

#endif
