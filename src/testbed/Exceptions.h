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
#ifndef _TESTBED_EXCEPTIONS_H_
#define _TESTBED_EXCEPTIONS_H_

#include <oxt/tracable_exception.hpp>
#include <string>
#include <exception>
#include <sstream>
#include <cstring>

/**
 * @defgroup Exceptions Exceptions
 */

namespace Testbed {

using namespace std;

/**
 * Represents an error returned by a system call or a standard library call.
 *
 * Use the code() method to find out the value of <tt>errno</tt> at the time
 * the error occured.
 *
 * @ingroup Exceptions
 */
class SystemException: public oxt::tracable_exception {
private:
	string briefMessage;
	string systemMessage;
	string fullMessage;
	int m_code;
public:
	/**
	 * Create a new SystemException.
	 *
	 * @param briefMessage A brief message describing the error.
	 * @param errorCode The error code, i.e. the value of errno right after the error occured.
	 * @note A system description of the error will be appended to the given message.
	 * @post code() == errorCode
	 * @post brief() == briefMessage
	 */
	SystemException(const string &briefMessage, int errorCode) {
		stringstream str;

		str << strerror(errorCode) << " (errno=" << errorCode << ")";
		systemMessage = str.str();

		setBriefMessage(briefMessage);
		m_code = errorCode;
	}

	virtual ~SystemException() throw() {}

	virtual const char *what() const throw() {
		return fullMessage.c_str();
	}

	void setBriefMessage(const string &message) {
		briefMessage = message;
		fullMessage = briefMessage + ": " + systemMessage;
	}

	/**
	 * The value of <tt>errno</tt> at the time the error occured.
	 */
	int code() const throw() {
		return m_code;
	}

	/**
	 * Returns a brief version of the exception message. This message does
	 * not include the system error description.
	 */
	string brief() const throw() {
		return briefMessage;
	}

	string sys() const throw() {
		return systemMessage;
	}
};

/**
 * Indicates that a specified argument is incorrect or violates a requirement.
 *
 * @ingroup Exceptions
 */
class ArgumentException: public oxt::tracable_exception {
private:
	string msg;
public:
	ArgumentException(const string &message): msg(message) {}
	virtual ~ArgumentException() throw() {}
	virtual const char *what() const throw() { return msg.c_str(); }
};

/**
 * Thrown when an invalid configuration is given.
 *
 * @ingroup Exceptions
 */
class ConfigurationException: public oxt::tracable_exception {
private:
	string msg;
public:
	ConfigurationException(const string &message): msg(message) {}
	virtual ~ConfigurationException() throw() {}
	virtual const char *what() const throw() { return msg.c_str(); }
};

/**
 * A generic runtime exception.
 *
 * @ingroup Exceptions
 */
class RuntimeException: public oxt::tracable_exception {
private:
	string msg;
public:
	RuntimeException(const string &message): msg(message) {}
	virtual ~RuntimeException() throw() {}
	virtual const char *what() const throw() { return msg.c_str(); }
};

/**
 * A site backend was unable to look up, create or otherwise manage a site.
 *
 * @ingroup Exceptions
 */
class ProvisioningException: public oxt::tracable_exception {
private:
	string msg;
	string siteName;
public:
	ProvisioningException(const string &message, const string &_siteName = string())
		: msg(message),
		  siteName(_siteName)
		{ }

	virtual ~ProvisioningException() throw() {}
	virtual const char *what() const throw() { return msg.c_str(); }

	/** The name of the site that the operation was about. May be empty. */
	const string &getSiteName() const throw() {
		return siteName;
	}
};

/**
 * A request to a site's HTTP service failed. The status is the HTTP status
 * code that the service responded with; what() contains the full message,
 * for example "Response status code does not indicate success: 502 (Bad Gateway)."
 *
 * @ingroup Exceptions
 */
class HttpRequestException: public oxt::tracable_exception {
private:
	string msg;
	int status;
public:
	HttpRequestException(const string &message, int _status)
		: msg(message),
		  status(_status)
		{ }

	virtual ~HttpRequestException() throw() {}
	virtual const char *what() const throw() { return msg.c_str(); }

	int getStatus() const throw() {
		return status;
	}
};

/**
 * Thrown when the site pool needs a slot but every slot is checked out
 * or has been discarded.
 *
 * @ingroup Exceptions
 */
class NoFreeSlotException: public oxt::tracable_exception {
private:
	string msg;
public:
	NoFreeSlotException(const string &message): msg(message) {}
	virtual ~NoFreeSlotException() throw() {}
	virtual const char *what() const throw() { return msg.c_str(); }
};

} // namespace Testbed

#endif /* _TESTBED_EXCEPTIONS_H_ */
