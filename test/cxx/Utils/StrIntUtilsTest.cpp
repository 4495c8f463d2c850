#include <TestSupport.h>
#include <Utils/StrIntUtils.h>
#include <sstream>

using namespace Testbed;
using namespace std;

namespace tut {
	struct StrIntUtilsTest {
	};

	DEFINE_TEST_GROUP(StrIntUtilsTest);


	/***** Test truncateBeforeTokens() *****/

	void testTruncate(const char* str, const char *tokens, int maxBetweenTokens, const char* expected) {
		std::stringstream sstream;
		truncateBeforeTokens(str, tokens, maxBetweenTokens, sstream);
		ensure_equals(sstream.str(), expected);
	}

	TEST_METHOD(1) {
		set_test_name("no change should occur");
		testTruncate("", "", 0, "");
		testTruncate("testwithout/tokens", "", 2, "testwithout/tokens");
		testTruncate("", "/", 2, "");
		testTruncate("/", "", 2, "/");
		testTruncate("/", "/", 2, "/");
		testTruncate("hello", "/", 2, "hello");
	}

	TEST_METHOD(2) {
		set_test_name("exact truncation and multiple split tokens");
		testTruncate("hello/world/Main.cpp", "/", 2, "he/wo/Main.cpp");
		testTruncate("hello/world\\Main.cpp", "/\\", 1, "h/w\\Main.cpp");
		testTruncate("src/testbed/SitePool/Pool.h", "/", 3, "src/tes/Sit/Pool.h");
	}


	/***** Test case-insensitive comparison *****/

	TEST_METHOD(3) {
		set_test_name("equalsIgnoreCase");
		ensure(equalsIgnoreCase("w3wp", "W3WP"));
		ensure(equalsIgnoreCase("", ""));
		ensure(!equalsIgnoreCase("w3wp", "w3wp.exe"));
		ensure(!equalsIgnoreCase("w3wp", "w3wq"));
	}

	TEST_METHOD(4) {
		set_test_name("containsIgnoreCase");
		ensure(containsIgnoreCase("D:\\Program Files\\KRE.Host.DLL", "kre.host.dll"));
		ensure(containsIgnoreCase("anything", ""));
		ensure(!containsIgnoreCase("kre.host.exe", "kre.host.dll"));
		ensure(!containsIgnoreCase("", "a"));
	}


	/***** Test string to number conversion *****/

	TEST_METHOD(5) {
		ensure_equals(stringToUint("0"), 0u);
		ensure_equals(stringToUint("  42abc"), 42u);
		ensure_equals(stringToUint("abc"), 0u);
		ensure_equals(stringToLL("-12"), -12ll);
		ensure_equals(stringToLL(" -9000000000"), -9000000000ll);
	}

	TEST_METHOD(6) {
		ensure(looksLikePositiveNumber("5"));
		ensure(looksLikePositiveNumber("0"));
		ensure(!looksLikePositiveNumber(""));
		ensure(!looksLikePositiveNumber("-1"));
		ensure(!looksLikePositiveNumber("5 "));
		ensure(!looksLikePositiveNumber("five"));
	}

	TEST_METHOD(7) {
		ensure_equals(toString(12), "12");
		ensure_equals(toString(7u), "7");
	}
}
