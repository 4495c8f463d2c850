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
#ifndef _TESTBED_LOGGING_H_
#define _TESTBED_LOGGING_H_

#include <oxt/thread.hpp>
#include <oxt/backtrace.hpp>
#include <oxt/macros.hpp>

#include <sys/types.h>
#include <unistd.h>
#include <pthread.h>
#include <string>
#include <exception>
#include <ostream>
#include <sstream>
#include <cstdlib>
#include <csignal>


namespace Testbed {

using namespace std;


/********** Debug logging facilities **********/

struct AssertionFailureInfo {
	const char *filename;
	const char *function; // May be NULL.
	const char *expression;
	unsigned int line;
};

extern volatile sig_atomic_t _logLevel;
// If TB_BUG() is triggered, we attempt to store its information here.
extern AssertionFailureInfo lastAssertionFailure;

inline OXT_FORCE_INLINE int
getLogLevel() {
	return (int) _logLevel;
}

void setLogLevel(int value);
bool setLogFile(const char *path); // Sets errno on error
string getLogFile();
void _prepareLogEntry(std::stringstream &sstream, const char *file, unsigned int line);
void _writeLogEntry(const std::string &str);
const char *_strdupStringStream(const std::stringstream &stream);


enum TestbedLogLevel {
	LVL_CRIT   = 0,
	LVL_ERROR  = 1,
	LVL_WARN   = 2,
	LVL_NOTICE = 3,
	LVL_INFO   = 4,
	LVL_DEBUG  = 5,
	LVL_DEBUG2 = 6,
	LVL_DEBUG3 = 7
};

/**
 * Write the given expression to the log stream.
 */
#define TB_LOG(level, file, line, expr) \
	do { \
		if (Testbed::getLogLevel() >= (level)) { \
			std::stringstream sstream; \
			Testbed::_prepareLogEntry(sstream, file, line); \
			sstream << expr << "\n"; \
			Testbed::_writeLogEntry(sstream.str()); \
		} \
	} while (false)

#define TB_LOG_UNLIKELY(level, file, line, expr) \
	do { \
		if (OXT_UNLIKELY(Testbed::getLogLevel() >= (level))) { \
			std::stringstream sstream; \
			Testbed::_prepareLogEntry(sstream, file, line); \
			sstream << expr << "\n"; \
			Testbed::_writeLogEntry(sstream.str()); \
		} \
	} while (false)

/**
 * Write the given expression, which represents a warning,
 * to the log stream.
 */
#define TB_WARN(expr) TB_LOG(Testbed::LVL_WARN, __FILE__, __LINE__, expr)

/**
 * Write the given expression, which represents a notice (important information),
 * to the log stream.
 */
#define TB_NOTICE(expr) TB_LOG(Testbed::LVL_NOTICE, __FILE__, __LINE__, expr)

/**
 * Write the given expression, which represents a normal information message,
 * to the log stream.
 */
#define TB_INFO(expr) TB_LOG(Testbed::LVL_INFO, __FILE__, __LINE__, expr)

/**
 * Write the given expression, which represents an error,
 * to the log stream.
 */
#define TB_ERROR(expr) TB_LOG(Testbed::LVL_ERROR, __FILE__, __LINE__, expr)

/**
 * Write the given expression, which represents a critical non-recoverable error,
 * to the log stream.
 */
#define TB_CRITICAL(expr) TB_LOG(Testbed::LVL_CRIT, __FILE__, __LINE__, expr)

/**
 * Write the given expression, which represents a debugging message,
 * to the log stream.
 */
#define TB_DEBUG(expr) TB_LOG_UNLIKELY(Testbed::LVL_DEBUG, __FILE__, __LINE__, expr)

#ifdef TESTBED_DEBUG
	#define TB_TRACE(level, expr) TB_LOG_UNLIKELY(Testbed::LVL_INFO + level, __FILE__, __LINE__, expr)
#else
	#define TB_TRACE(level, expr) do { /* nothing */ } while (false)
#endif

/** Print a [BUG] error message and abort. */
#define TB_BUG(expr) \
	do { \
		TRACE_POINT(); \
		const char *_exprStr; \
		std::stringstream sstream; \
		sstream << expr; \
		_exprStr = Testbed::_strdupStringStream(sstream); \
		Testbed::lastAssertionFailure.filename = __FILE__; \
		Testbed::lastAssertionFailure.line = __LINE__; \
		Testbed::lastAssertionFailure.function = __PRETTY_FUNCTION__; \
		Testbed::lastAssertionFailure.expression = _exprStr; \
		TB_CRITICAL("[BUG] " << _exprStr); \
		abort(); \
	} while (false)

} // namespace Testbed

#endif /* _TESTBED_LOGGING_H_ */
