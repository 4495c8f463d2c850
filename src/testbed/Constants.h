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
#ifndef _TESTBED_CONSTANTS_H_
#define _TESTBED_CONSTANTS_H_

/* Don't forget to update the defaults in SitePool/Options.h if you change these. */

#define TESTBED_VERSION "1.0.0"

#define DEFAULT_LOG_LEVEL 3

#define DEFAULT_SITE_POOL_SIZE 5
#define MAX_SITE_POOL_SIZE 1000
#define DEFAULT_SITE_PREFIX "testbed-site"
#define DEFAULT_WORKER_PROCESS_NAME "w3wp"
#define DEFAULT_STALE_MODULE_NAME "kre.host.dll"
#define DEFAULT_MARKER_FILE_NAME "hostingstart.html"
#define DEFAULT_MARKER_CONTENT "<h1>This web site has been successfully created</h1>"

/* The HTTP status with which a backend reports that its gateway is not ready yet. */
#define BAD_GATEWAY_STATUS 502

#define DEFAULT_PREPARER_THREAD_STACK_SIZE (1024 * 128)

#define TESTBED_ENV_PREFIX "TESTBED_"

#endif /* _TESTBED_CONSTANTS_H_ */
