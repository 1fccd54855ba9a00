#define PCRE2_CODE_UNIT_WIDTH 8
#include "Regexp.h"
#include <gtest/gtest.h>
#include <pcre2.h>
#include <cctype>
#include <string>
#include <vector>

namespace {

std::unique_ptr<Regexp> compileWith(const std::string &pattern, EngineChoice engine) {
	CompileOptions options;
	options.engine = engine;
	return Regexp::compile(pattern, options);
}

}

TEST(RegexpTest, LiteralMatch) {
	auto re = Regexp::compile("hello");
	EXPECT_EQ(EngineKind::Native, re->engineKind());
	EXPECT_FALSE(re->isBacktracking());
	EXPECT_EQ("hello", re->pattern());

	EXPECT_TRUE(re->test(std::string("hello world")));
	EXPECT_EQ((MatchSpan{0, 5}), re->findIndex(std::string("hello world")));
	EXPECT_EQ("hello", re->find(std::string("hello world")));
}

TEST(RegexpTest, LookaheadRoutesToBacktracking) {
	auto re = Regexp::compile("foo(?=bar)");
	EXPECT_TRUE(re->isBacktracking());

	EXPECT_EQ("foo", re->find(std::string("foobar")));
	EXPECT_FALSE(re->test(std::string("foobaz")));
	EXPECT_EQ(MatchSpan(), re->findIndex(std::string("foobaz")));
	EXPECT_EQ("", re->find(std::string("foobaz")));
}

TEST(RegexpTest, BackReference) {
	auto re = Regexp::compile("(\\w+)\\s+\\1");
	EXPECT_TRUE(re->isBacktracking());
	EXPECT_EQ(1u, re->numSubexp());

	const std::string subject = "hello hello world";
	EXPECT_EQ("hello hello", re->find(subject));
	EXPECT_EQ((std::vector<std::string>{"hello hello", "hello"}), re->findSubmatch(subject));
	EXPECT_EQ((MatchOffsets{0, 11, 0, 5}), re->findSubmatchIndex(subject));
}

TEST(RegexpTest, ReplaceAllWithTemplate) {
	auto re = Regexp::compile("(foo)(bar)");
	EXPECT_EQ("barfoo", re->replaceAll(std::string("foobar"), "$2$1"));
	EXPECT_EQ("<barfoo> <barfoo>", re->replaceAll(std::string("<foobar> <foobar>"), "$2$1"));
	EXPECT_EQ("$", re->replaceAll(std::string("foobar"), "$$"));
}

TEST(RegexpTest, Split) {
	auto re = Regexp::compile("\\s+");
	EXPECT_EQ((std::vector<std::string>{"foo", "bar", "baz"}), re->split(std::string("foo bar baz"), -1));
	EXPECT_EQ((std::vector<std::string>{""}), re->split(std::string(""), -1));
	EXPECT_EQ((std::vector<std::string>{"foo", "bar baz"}), re->split(std::string("foo bar baz"), 2));
	EXPECT_EQ(std::vector<std::string>(), re->split(std::string("foo bar baz"), 0));
}

TEST(RegexpTest, FindAllWithLimit) {
	auto re = Regexp::compile("p([a-z]+)ch");
	const std::string subject = "peach punch pinch";

	EXPECT_EQ((std::vector<std::string>{"peach", "punch"}), re->findAll(subject, 2));
	EXPECT_EQ((std::vector<std::string>{"peach", "punch", "pinch"}), re->findAll(subject, -1));
	EXPECT_EQ((std::vector<MatchSpan>{{0, 5}, {6, 11}, {12, 17}}), re->findAllIndex(subject, -1));
	EXPECT_EQ((std::vector<std::vector<std::string>>{{"peach", "ea"}, {"punch", "un"}}), re->findAllSubmatch(subject, 2));
	EXPECT_EQ((std::vector<MatchOffsets>{{0, 5, 1, 3}}), re->findAllSubmatchIndex(subject, 1));
	EXPECT_TRUE(re->findAll(subject, 0).empty());
}

TEST(RegexpTest, EmptyMatchesAgreeAcrossEngines) {
	const std::string subject = "baaac";
	const std::vector<MatchSpan> expected = {{0, 0}, {1, 4}, {4, 4}, {5, 5}};

	EXPECT_EQ(expected, compileWith("a*", EngineChoice::Native)->findAllIndex(subject, -1));
	EXPECT_EQ(expected, compileWith("a*", EngineChoice::Backtracking)->findAllIndex(subject, -1));
}

TEST(RegexpTest, NativePatternsBehaveTheSameOnBothEngines) {
	const std::vector<std::string> patterns = {
		"a+b", "[0-9]{2,3}", "(foo|bar)baz", "^abc", "x*", "\\bword\\b", "colou?r", "(a)(b)?c"
	};

	const std::vector<std::string> subjects = {
		"", "aab", "abc", "12345", "barbaz", "xxabc", "a word here", "colour color", "ac abc", "swordfish"
	};

	for (const std::string &pattern : patterns) {
		auto native      = compileWith(pattern, EngineChoice::Native);
		auto backtracker = compileWith(pattern, EngineChoice::Backtracking);

		for (const std::string &subject : subjects) {
			EXPECT_EQ(native->test(subject), backtracker->test(subject)) << pattern << " on \"" << subject << "\"";
			EXPECT_EQ(native->findAllSubmatchIndex(subject, -1), backtracker->findAllSubmatchIndex(subject, -1)) << pattern << " on \"" << subject << "\"";
		}
	}
}

TEST(RegexpTest, SubexpNames) {
	auto native = Regexp::compile("(?P<year>\\d{4})-(\\d{2})");
	EXPECT_EQ(2u, native->numSubexp());
	EXPECT_EQ((std::vector<std::string>{"", "year", ""}), native->subexpNames());
	EXPECT_EQ(1, native->subexpIndex("year"));
	EXPECT_EQ(-1, native->subexpIndex("month"));
	EXPECT_EQ(-1, native->subexpIndex(""));

	auto backtracking = Regexp::compile("(?<a>x)(?<b>y)\\k<a>");
	EXPECT_TRUE(backtracking->isBacktracking());
	EXPECT_EQ((std::vector<std::string>{"", "a", "b"}), backtracking->subexpNames());
	EXPECT_EQ(2, backtracking->subexpIndex("b"));
}

TEST(RegexpTest, ReplaceVariants) {
	auto re = Regexp::compile("[aeiou]");
	const std::string subject = "banana";

	EXPECT_EQ("b$1n$1n$1", re->replaceAllLiteral(subject, "$1"));
	EXPECT_EQ("bAnAnA", re->replaceAllFunc(subject, [](const std::string &m) {
		return std::string(1, static_cast<char>(toupper(static_cast<unsigned char>(m[0]))));
	}));
	EXPECT_EQ("b[a]n[a]n[a]", re->replace(subject, Replacement::expand("[$0]")));
}

TEST(RegexpTest, Expand) {
	auto re = Regexp::compile("(\\w+)@(\\w+)");
	const std::string subject = "mail bob@example now";

	const MatchOffsets offsets = re->findSubmatchIndex(subject);
	ASSERT_EQ(6u, offsets.size());
	EXPECT_EQ("example:bob", re->expand("$2:$1", subject, offsets));
}

TEST(RegexpTest, PointerAndLengthSubjects) {
	auto re = Regexp::compile("b+");
	const char subject[] = "abbbc and more";

	// only the first four bytes are the subject
	EXPECT_EQ("bbb", re->find(subject, 4));
	EXPECT_EQ((std::vector<std::string>{"a", "c"}), re->split(subject, 5, -1));
	EXPECT_FALSE(re->test(subject, 1));

	MatchResult result;
	ASSERT_TRUE(re->firstMatch(subject, 4, &result));
	EXPECT_EQ(1, result.whole().start);
	EXPECT_EQ(4, result.whole().end);
	EXPECT_EQ(1u, re->allMatches(subject, 4, -1).size());
}

TEST(RegexpTest, ForcedEngine) {
	auto forced = compileWith("hello", EngineChoice::Backtracking);
	EXPECT_TRUE(forced->isBacktracking());
	EXPECT_TRUE(forced->test(std::string("oh hello")));

	EXPECT_THROW(compileWith("foo(?=bar)", EngineChoice::Native), CompileError);
}

TEST(RegexpTest, CompileErrorsPropagate) {
	try {
		Regexp::compile("a(b");
		FAIL() << "expected a CompileError";
	} catch (const CompileError &e) {
		EXPECT_EQ(EngineKind::Native, e.engine());
	}

	try {
		Regexp::compile("(?<=a)(b");
		FAIL() << "expected a CompileError";
	} catch (const CompileError &e) {
		EXPECT_EQ(EngineKind::Backtracking, e.engine());
		EXPECT_EQ(PCRE2_ERROR_MISSING_CLOSING_PARENTHESIS, e.code());
	}
}

TEST(RegexpTest, ReleaseIsIdempotent) {
	auto re = Regexp::compile("(a)(?=b)");
	EXPECT_FALSE(re->isReleased());

	re->release();
	EXPECT_TRUE(re->isReleased());
	re->release();
	EXPECT_TRUE(re->isReleased());

	EXPECT_FALSE(re->test(std::string("ab")));
	EXPECT_TRUE(re->findAll(std::string("abab"), -1).empty());
	EXPECT_EQ("ab", re->replaceAll(std::string("ab"), "x"));
	EXPECT_EQ(1u, re->numSubexp());
	EXPECT_EQ("(a)(?=b)", re->pattern());
}

TEST(RegexpTest, EmptySubjectWithoutStorage) {
	EXPECT_TRUE(Regexp::compile("")->test(nullptr, 0));
	EXPECT_TRUE(Regexp::compile("^(?=$)")->test(nullptr, 0));
	EXPECT_FALSE(Regexp::compile("a")->test(nullptr, 0));

	auto re = Regexp::compile("x*");
	EXPECT_EQ((std::vector<std::string>{""}), re->findAll(nullptr, 0, -1));
	EXPECT_EQ("-", re->replaceAll(nullptr, 0, "-$0"));
}

TEST(RegexpTest, LiteralPrefix) {
	bool complete = false;

	EXPECT_EQ("hello", Regexp::compile("hello")->literalPrefix(&complete));
	EXPECT_TRUE(complete);

	EXPECT_EQ("p", Regexp::compile("p([a-z]+)ch")->literalPrefix(&complete));
	EXPECT_FALSE(complete);

	EXPECT_EQ("", Regexp::compile("foo(?=bar)")->literalPrefix(&complete));
	EXPECT_FALSE(complete);

	EXPECT_EQ("", Regexp::compile("")->literalPrefix());
}
