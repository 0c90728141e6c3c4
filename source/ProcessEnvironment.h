/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_PROCESSENVIRONMENT_H)
#define INCLUDE_PROCESSENVIRONMENT_H

#include <vector>

/// \brief A read-only view of the environment that a process was started with
struct ProcessEnvironment {
	ProcessEnvironment(const char * const * envp);
	const char * query(const char * name) const;
protected:
	std::vector<const char *> vars;
};

#endif
