/*
 *  Testbed - reusable test site pool
 *  Copyright (c) 2026 The Testbed authors
 *
 *  Permission is hereby granted, free of charge, to any person obtaining a copy
 *  of this software and associated documentation files (the "Software"), to deal
 *  in the Software without restriction, including without limitation the rights
 *  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 *  copies of the Software, and to permit persons to whom the Software is
 *  furnished to do so, subject to the following conditions:
 *
 *  The above copyright notice and this permission notice shall be included in
 *  all copies or substantial portions of the Software.
 *
 *  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 *  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 *  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 *  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 *  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 *  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 *  THE SOFTWARE.
 */
#ifndef _TESTBED_STR_INT_UTILS_H_
#define _TESTBED_STR_INT_UTILS_H_

#include <string>
#include <sstream>
#include <ostream>

namespace Testbed {

using namespace std;


/**
 * Checks whether <tt>str</tt> starts with <tt>substr</tt>.
 */
bool startsWith(const string &str, const string &substr);

/**
 * Compares two strings, ignoring the case of ASCII letters.
 */
bool equalsIgnoreCase(const string &a, const string &b);

/**
 * Checks whether <tt>str</tt> contains <tt>substr</tt>, ignoring the case
 * of ASCII letters. An empty <tt>substr</tt> is contained in every string.
 */
bool containsIgnoreCase(const string &str, const string &substr);

/**
 * Returns a copy of <tt>str</tt> with all ASCII letters in lower case.
 */
string lowercase(const string &str);

/**
 * Writes <tt>str</tt> to <tt>sstream</tt>, but shortens every component
 * between two of the given tokens to at most <tt>maxBetweenTokens</tt>
 * characters. Used for shortening source paths in log entries,
 * e.g. "src/testbed/SitePool/Pool.h" becomes "src/tes/Sit/Pool.h" with a
 * limit of 3.
 */
void truncateBeforeTokens(const char *str, const string &tokens, int maxBetweenTokens,
	ostream &sstream);

/**
 * Convert anything to a string.
 */
template<typename T> inline string
toString(T something) {
	stringstream s;
	s << something;
	return s.str();
}

/**
 * Converts the given string to an unsigned integer. Leading spaces are
 * skipped; conversion stops at the first non-digit. Returns 0 if the
 * string does not start with a number. Does not check for overflow.
 */
unsigned int stringToUint(const string &str);

/**
 * Like stringToUint() but also accepts a leading minus sign.
 */
long long stringToLL(const string &str);

/**
 * Checks whether the given string consists only of digits and
 * is not empty.
 */
bool looksLikePositiveNumber(const string &str);

} // namespace Testbed

#endif /* _TESTBED_STR_INT_UTILS_H_ */
