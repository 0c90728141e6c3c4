/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <cstring>
#include "utils.h"

/* Program names ************************************************************
// **************************************************************************
*/

const char *
basename_of (
	const char * s
) {
	if (const char * slash = std::strrchr(s, '/'))
		return slash + 1;
	return s;
}
