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
#include <iomanip>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>
#include <sys/time.h>

#include <boost/atomic.hpp>
#include <Logging.h>
#include <Constants.h>
#include <Exceptions.h>
#include <Utils/StrIntUtils.h>

namespace Testbed {

volatile sig_atomic_t _logLevel = DEFAULT_LOG_LEVEL;
AssertionFailureInfo lastAssertionFailure;
static char *logFile = NULL;

#define TRUNCATE_LOGPATHS_TO_MAXCHARS 3 // set to 0 to disable truncation

void
setLogLevel(int value) {
	_logLevel = value;
	boost::atomic_signal_fence(boost::memory_order_seq_cst);
}

bool
setLogFile(const char *path) {
	int fd = open(path, O_WRONLY | O_CREAT | O_APPEND, 0644);
	if (fd != -1) {
		char *newLogFile = strdup(path);
		if (newLogFile == NULL) {
			TB_CRITICAL("Cannot allocate memory");
			abort();
		}

		dup2(fd, STDERR_FILENO);
		close(fd);

		if (logFile != NULL) {
			free(logFile);
		}
		logFile = newLogFile;
		return true;
	} else {
		return false;
	}
}

string
getLogFile() {
	if (logFile == NULL) {
		return string();
	} else {
		return string(logFile);
	}
}

void
_prepareLogEntry(std::stringstream &sstream, const char *file, unsigned int line) {
	time_t the_time;
	struct tm the_tm;
	char datetime_buf[60];
	struct timeval tv;

	the_time = time(NULL);
	localtime_r(&the_time, &the_tm);
	strftime(datetime_buf, sizeof(datetime_buf) - 1, "%F %H:%M:%S", &the_tm);
	gettimeofday(&tv, NULL);
	sstream <<
		"[ " << datetime_buf << "." << std::setfill('0') << std::setw(4) <<
			(unsigned long) (tv.tv_usec / 100) <<
		" " << std::dec << getpid() << "/" <<
			std::hex << pthread_self() << std::dec <<
		" ";

	if (startsWith(file, "src/")) { // most code resides in src/testbed
		file += sizeof("src/") - 1;
		if (startsWith(file, "testbed/")) {
			file += sizeof("testbed/") - 1;
		}
	}

	if (TRUNCATE_LOGPATHS_TO_MAXCHARS > 0) {
		truncateBeforeTokens(file, "/\\", TRUNCATE_LOGPATHS_TO_MAXCHARS, sstream);
	} else {
		sstream << file;
	}

	sstream << ":" << line <<
		" ]: ";
}

static void
writeExact(int fd, const char *data, size_t size) {
	size_t written = 0;
	while (written < size) {
		ssize_t ret = write(fd, data + written, size - written);
		if (ret == -1) {
			if (errno != EINTR) {
				int e = errno;
				throw SystemException("write() failed", e);
			}
		} else {
			written += ret;
		}
	}
}

void
_writeLogEntry(const std::string &str) {
	try {
		writeExact(STDERR_FILENO, str.data(), str.size());
	} catch (const SystemException &) {
		/* The most likely reason why this fails is when stderr is a pipe
		 * whose reader has gone away. Losing a log line is not a reason
		 * to abort a test run.
		 */
	}
}

const char *
_strdupStringStream(const std::stringstream &stream) {
	string str = stream.str();
	char *buf = (char *) malloc(str.size() + 1);
	memcpy(buf, str.data(), str.size());
	buf[str.size()] = '\0';
	return buf;
}

} // namespace Testbed
