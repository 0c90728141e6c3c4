/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <cstring>
#include "ProcessEnvironment.h"

ProcessEnvironment::ProcessEnvironment(
	const char * const * envp
) {
	if (envp)
		for (const char * const * p(envp); *p; ++p)
			vars.push_back(*p);
}

const char *
ProcessEnvironment::query(
	const char * name
) const {
	const std::size_t len(std::strlen(name));
	for (std::vector<const char *>::const_iterator b(vars.begin()), e(vars.end()), p(b); e != p; ++p) {
		const char * v(*p);
		if (0 == std::strncmp(v, name, len) && '=' == v[len])
			return v + len + 1;
	}
	return nullptr;
}
