/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#if !defined(INCLUDE_CONTROLCHARACTERS_H)
#define INCLUDE_CONTROLCHARACTERS_H

	/// \brief Control character constants.
	/// These are not character constants because C1 characters are above the signed char range.
	enum {
		ESC = 0x1b,
		CSI = 0x9b,
	};

#endif
