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
#ifndef _TESTBED_SITE_POOL_OPTIONS_H_
#define _TESTBED_SITE_POOL_OPTIONS_H_

#include <string>
#include <Constants.h>
#include <Exceptions.h>
#include <Utils/VariantMap.h>
#include <Utils/StrIntUtils.h>
#include <SitePool/Common.h>

namespace Testbed {
namespace SitePool {

using namespace std;


/**
 * Configuration for a site pool and the provisioner that it uses.
 *
 * The defaults describe a pool of 5 reusable sites named
 * "testbed-site1" ... "testbed-site5". When such a site is reused, worker
 * processes named "w3wp" that still have the runtime host module
 * "kre.host.dll" open are killed, the repository is wiped, and
 * "hostingstart.html" is written into the web root.
 *
 * Options can be constructed from a VariantMap, which in turn can be
 * populated from the environment, e.g. <tt>TESTBED_SITE_POOL_SIZE=3</tt>.
 * The recognized keys are:
 *
 *   site_pool_size           -> maxSlots
 *   site_prefix              -> sitePrefix
 *   worker_process_name      -> workerProcessName
 *   stale_module_name        -> staleModuleName
 *   marker_file_name         -> markerFileName
 *   marker_content           -> markerContent
 *   prefetch_on_start        -> prefetchOnStart ("true" or "false")
 */
class Options {
public:
	/** The number of slots in the pool. Slots are numbered 1 to maxSlots. */
	unsigned int maxSlots;

	/** Site names are formed by appending the slot index to this prefix. */
	string sitePrefix;

	/**
	 * When reusing a site, only processes with this name (compared
	 * case-insensitively) are inspected for stale module handles.
	 */
	string workerProcessName;

	/**
	 * A worker process that has an open file handle whose path contains
	 * this string (case-insensitively) is considered stale and is killed
	 * before the site is reused.
	 */
	string staleModuleName;

	/** Path, relative to the web root, of the file written into every reused site. */
	string markerFileName;
	string markerContent;

	/** Whether Pool::initialize() immediately starts preparing the first application. */
	bool prefetchOnStart;

	Options() {
		maxSlots          = DEFAULT_SITE_POOL_SIZE;
		sitePrefix        = DEFAULT_SITE_PREFIX;
		workerProcessName = DEFAULT_WORKER_PROCESS_NAME;
		staleModuleName   = DEFAULT_STALE_MODULE_NAME;
		markerFileName    = DEFAULT_MARKER_FILE_NAME;
		markerContent     = DEFAULT_MARKER_CONTENT;
		prefetchOnStart   = false;
	}

	/**
	 * @throws ConfigurationException One of the values is invalid.
	 */
	Options(const VariantMap &config) {
		Options defaults;
		string poolSize = config.get("site_pool_size", false);
		if (poolSize.empty()) {
			maxSlots = defaults.maxSlots;
		} else if (!looksLikePositiveNumber(poolSize)) {
			throw ConfigurationException("site_pool_size must be a positive number, got '"
				+ poolSize + "'");
		} else if (poolSize.size() > toString(MAX_SITE_POOL_SIZE).size()) {
			throw ConfigurationException("site_pool_size may be at most "
				+ toString(MAX_SITE_POOL_SIZE) + ", got '" + poolSize + "'");
		} else {
			maxSlots = stringToUint(poolSize);
		}
		sitePrefix        = config.get("site_prefix", false, defaults.sitePrefix);
		workerProcessName = config.get("worker_process_name", false, defaults.workerProcessName);
		staleModuleName   = config.get("stale_module_name", false, defaults.staleModuleName);
		markerFileName    = config.get("marker_file_name", false, defaults.markerFileName);
		markerContent     = config.get("marker_content", false, defaults.markerContent);
		prefetchOnStart   = config.getBool("prefetch_on_start", false, defaults.prefetchOnStart);
		verify();
	}

	/**
	 * @throws ConfigurationException
	 */
	void verify() const {
		if (maxSlots == 0) {
			throw ConfigurationException("The site pool size must be at least 1");
		}
		if (maxSlots > MAX_SITE_POOL_SIZE) {
			throw ConfigurationException("The site pool size may be at most "
				+ toString(MAX_SITE_POOL_SIZE));
		}
		if (sitePrefix.empty()) {
			throw ConfigurationException("The site prefix may not be empty");
		}
		if (markerFileName.empty()) {
			throw ConfigurationException("The marker file name may not be empty");
		}
	}

	string getSiteName(SlotIndex index) const {
		return sitePrefix + toString(index);
	}

	string inspect() const {
		stringstream stream;
		stream << "maxSlots=" << maxSlots
			<< " sitePrefix=" << sitePrefix
			<< " workerProcessName=" << workerProcessName
			<< " staleModuleName=" << staleModuleName
			<< " markerFileName=" << markerFileName
			<< " prefetchOnStart=" << (prefetchOnStart ? "true" : "false");
		return stream.str();
	}
};


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_OPTIONS_H_ */
