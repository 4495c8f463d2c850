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
#ifndef _TESTBED_SITE_POOL_PROVISIONER_H_
#define _TESTBED_SITE_POOL_PROVISIONER_H_

#include <boost/shared_ptr.hpp>
#include <string>
#include <SitePool/Common.h>
#include <SitePool/Options.h>
#include <SitePool/Backends.h>
#include <SitePool/Application.h>

namespace Testbed {
namespace SitePool {

using namespace std;
using namespace boost;


/**
 * Turns a slot index into a ready-to-use Application.
 *
 * If no site exists for the slot yet, a new one is created. Otherwise the
 * existing site is reused, after bringing it back into a known state:
 *
 *  1. Worker processes that still hold the stale runtime module open are
 *     killed. Failures are logged and ignored.
 *  2. The repository, including the web root, is deleted. Failures are
 *     logged and ignored.
 *  3. The marker file is written into the web root, so that every reused
 *     site starts with the same content. If the site's HTTP service reports
 *     a 502 Bad Gateway, the exception is rethrown with the service's up time
 *     appended, if that can be obtained.
 *
 * Provisioner has no state of its own besides its configuration and is
 * safe to use from multiple threads, provided the SiteManager is.
 */
class Provisioner {
private:
	friend struct tut::SitePool_ProvisionerTest;

	SiteManagerPtr siteManager;
	Options options;

	void killStaleProcesses(const ApplicationPtr &app, const string &operationName);
	void wipeRepository(const ApplicationPtr &app, const string &operationName);
	void writeMarkerFile(const ApplicationPtr &app);

public:
	Provisioner(const SiteManagerPtr &_siteManager, const Options &_options)
		: siteManager(_siteManager),
		  options(_options)
		{ }

	/**
	 * Returns an Application for the site belonging to the given slot,
	 * creating or cleaning up the site as necessary.
	 *
	 * @throws ProvisioningException
	 * @throws HttpRequestException Writing the marker file failed.
	 * @throws tracable_exception Anything else the site backend throws.
	 * @throws boost::thread_interrupted
	 */
	ApplicationPtr provision(SlotIndex index);

	const Options &getOptions() const {
		return options;
	}

	const SiteManagerPtr &getSiteManager() const {
		return siteManager;
	}
};


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_PROVISIONER_H_ */
