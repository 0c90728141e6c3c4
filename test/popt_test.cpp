/* COPYING ******************************************************************
For copyright and licensing terms, see the file named COPYING.
// **************************************************************************
*/

#include <gtest/gtest.h>
#include <vector>
#include <cstring>
#include "popt.h"
#include "ProcessEnvironment.h"

namespace {

class PoptTest : public ::testing::Test {
protected:
	PoptTest() :
		envs(envp),
		alpha(false),
		beta(false),
		alpha_option('a', "alpha", "The first.", alpha),
		beta_option('\0', "beta", "The second.", beta)
	{
	}

	// Returns whether processing was stopped by --help or --usage.
	bool Process(std::vector<const char *> args, bool strictly) {
		return Process(args, strictly, envs);
	}
	bool Process(std::vector<const char *> args, bool strictly, const ProcessEnvironment & e) {
		popt::definition * top_table[] = {
			&alpha_option,
			&beta_option
		};
		popt::top_table_definition main_option(sizeof top_table/sizeof *top_table, top_table, "Main options", "[args]");
		popt::arg_processor<const char **> p(args.data(), args.data() + args.size(), "test", e, main_option, remaining);
		p.process(strictly);
		return p.stopped();
	}

	static const char * const envp[];
	ProcessEnvironment envs;
	bool alpha, beta;
	popt::bool_definition alpha_option, beta_option;
	std::vector<const char *> remaining;
};

const char * const PoptTest::envp[] = { nullptr };

TEST_F(PoptTest, ShortAndLongOptions) {
	EXPECT_FALSE(Process({ "-a", "--beta" }, true));
	EXPECT_TRUE(alpha);
	EXPECT_TRUE(beta);
	EXPECT_TRUE(alpha_option.is_set());
	EXPECT_TRUE(remaining.empty());
}

TEST_F(PoptTest, UnsetOptionsStayFalse) {
	EXPECT_FALSE(Process({ "--alpha" }, true));
	EXPECT_TRUE(alpha);
	EXPECT_FALSE(beta);
	EXPECT_FALSE(beta_option.is_set());
}

TEST_F(PoptTest, OptionsStopAtFirstArgumentWhenStrict) {
	EXPECT_FALSE(Process({ "one", "-a", "two" }, true));
	EXPECT_FALSE(alpha);
	ASSERT_EQ(3U, remaining.size());
	EXPECT_STREQ("one", remaining[0]);
	EXPECT_STREQ("-a", remaining[1]);
	EXPECT_STREQ("two", remaining[2]);
}

TEST_F(PoptTest, OptionsMayFollowArgumentsWhenNotStrict) {
	EXPECT_FALSE(Process({ "one", "-a", "two" }, false));
	EXPECT_TRUE(alpha);
	ASSERT_EQ(2U, remaining.size());
	EXPECT_STREQ("one", remaining[0]);
	EXPECT_STREQ("two", remaining[1]);
}

TEST_F(PoptTest, DoubleDashEndsOptions) {
	EXPECT_FALSE(Process({ "--", "--beta" }, true));
	EXPECT_FALSE(beta);
	ASSERT_EQ(1U, remaining.size());
	EXPECT_STREQ("--beta", remaining[0]);
}

TEST_F(PoptTest, SingleDashIsAnArgument) {
	EXPECT_FALSE(Process({ "-" }, true));
	ASSERT_EQ(1U, remaining.size());
	EXPECT_STREQ("-", remaining[0]);
}

TEST_F(PoptTest, UnknownLongOptionThrows) {
	try {
		Process({ "--gamma" }, true);
		FAIL() << "no popt::error thrown";
	} catch (const popt::error & e) {
		EXPECT_STREQ("--gamma", e.arg);
		EXPECT_STREQ("unknown option", e.msg);
	}
}

TEST_F(PoptTest, UnknownShortOptionInClusterThrows) {
	EXPECT_THROW(Process({ "-az" }, true), popt::error);
	EXPECT_TRUE(alpha);
}

TEST_F(PoptTest, UsageStopsProcessing) {
	testing::internal::CaptureStdout();
	const bool stopped(Process({ "--usage", "--beta" }, true));
	const std::string out(testing::internal::GetCapturedStdout());
	EXPECT_TRUE(stopped);
	EXPECT_FALSE(beta);
	EXPECT_EQ("Usage: test [-?a] [--help] [--usage] [--alpha] [--beta] [args]\n", out);
}

TEST_F(PoptTest, HelpListsTheOptionTable) {
	testing::internal::CaptureStdout();
	EXPECT_TRUE(Process({ "-?" }, true));
	const std::string out(testing::internal::GetCapturedStdout());
	EXPECT_NE(std::string::npos, out.find("Usage: test "));
	EXPECT_NE(std::string::npos, out.find("Main options:\n"));
	EXPECT_NE(std::string::npos, out.find("\t-a, --alpha The first.\n"));
	EXPECT_NE(std::string::npos, out.find("\t--beta      The second.\n"));
}

TEST_F(PoptTest, ForcedColourUsageUnderlinesOptionsAndItalicisesArguments) {
	const char * const coloured[] = { "CLICOLOR=1", "CLICOLOR_FORCE=1", nullptr };
	const ProcessEnvironment colour_envs(coloured);
	testing::internal::CaptureStdout();
	EXPECT_TRUE(Process({ "--usage" }, true, colour_envs));
	const std::string out(testing::internal::GetCapturedStdout());
	EXPECT_EQ(
		"Usage: test [-\x1b[4m?a\x1b[24m] [\x1b[4m--help\x1b[24m] [\x1b[4m--usage\x1b[24m] "
		"[\x1b[4m--alpha\x1b[24m] [\x1b[4m--beta\x1b[24m] \x1b[3m[args]\x1b[23m\n",
		out
	);
}

TEST_F(PoptTest, ColourNeedsClicolorEvenWhenForced) {
	const char * const forced_only[] = { "CLICOLOR_FORCE=1", nullptr };
	const ProcessEnvironment forced_envs(forced_only);
	testing::internal::CaptureStdout();
	EXPECT_TRUE(Process({ "--usage" }, true, forced_envs));
	EXPECT_EQ("Usage: test [-?a] [--help] [--usage] [--alpha] [--beta] [args]\n", testing::internal::GetCapturedStdout());
}

}
