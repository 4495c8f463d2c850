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
#ifndef _TESTBED_SYSTEM_TIME_H_
#define _TESTBED_SYSTEM_TIME_H_

#include <sys/time.h>
#include <ctime>
#include <cerrno>
#include <Exceptions.h>

namespace Testbed {

namespace SystemTimeData {
	extern bool hasForcedMsecValue;
	extern unsigned long long forcedMsecValue;
}

/**
 * Obtains the system time, similar to gettimeofday(). A certain time can be
 * forced, which is useful for testing code that depends on the system time
 * (e.g. up time reporting).
 */
class SystemTime {
public:
	/**
	 * Returns the time since the Epoch, measured in milliseconds. Or, if a
	 * time was forced with forceMsec(), then the forced time is returned instead.
	 *
	 * @param real Whether to get the real time, even if a value was forced.
	 * @throws SystemException Something went wrong while retrieving the time.
	 */
	static unsigned long long getMsec(bool real = false) {
		if (SystemTimeData::hasForcedMsecValue && !real) {
			return SystemTimeData::forcedMsecValue;
		} else {
			struct timeval t;
			int ret;

			do {
				ret = gettimeofday(&t, NULL);
			} while (ret == -1 && errno == EINTR);
			if (ret == -1) {
				int e = errno;
				throw SystemException("Unable to retrieve the system time", e);
			}
			return (unsigned long long) t.tv_sec * 1000 + t.tv_usec / 1000;
		}
	}

	/**
	 * Force getMsec() to return the given value.
	 */
	static void forceMsec(unsigned long long value) {
		SystemTimeData::hasForcedMsecValue = true;
		SystemTimeData::forcedMsecValue = value;
	}

	/**
	 * Release all previously forced values, so that getMsec()
	 * returns the system time once again.
	 */
	static void releaseAll() {
		SystemTimeData::hasForcedMsecValue = false;
	}
};

} // namespace Testbed

#endif /* _TESTBED_SYSTEM_TIME_H_ */
