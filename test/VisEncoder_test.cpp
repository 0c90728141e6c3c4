/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <gtest/gtest.h>
#include <string>
#include "VisEncoder.h"

namespace {

TEST(VisEncoderTest, PrintableTextIsUnchanged) {
	EXPECT_EQ("[?1049l", VisEncoder::process("[?1049l"));
}

TEST(VisEncoderTest, EscapeIsCaretBracket) {
	EXPECT_EQ("\\^[[H", VisEncoder::process("\x1b[H"));
}

TEST(VisEncoderTest, WhitespaceIsEncoded) {
	EXPECT_EQ("a\\040b\\^Ic\\^J", VisEncoder::process("a b\tc\n"));
}

TEST(VisEncoderTest, DeleteBackslashAndHighBytes) {
	EXPECT_EQ("\\^?", VisEncoder::process("\x7f"));
	EXPECT_EQ("\\\\", VisEncoder::process("\\"));
	EXPECT_EQ("\\M^[", VisEncoder::process("\x9b"));
	EXPECT_EQ("\\M-A", VisEncoder::process("\xc1"));
	EXPECT_EQ("\\240", VisEncoder::process("\xa0"));
}

}
