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
#ifndef _TESTBED_SITE_POOL_BACKENDS_H_
#define _TESTBED_SITE_POOL_BACKENDS_H_

#include <string>
#include <vector>
#include <sys/types.h>
#include <SitePool/Common.h>

namespace Testbed {
namespace SitePool {

using namespace std;


/**
 * A deployed site, as reported by the site backend.
 */
struct Site {
	string name;
	/** Human-readable description of the primary binding, e.g. "http://localhost:8081/". */
	string primarySiteBinding;
	string siteUrl;
	string serviceUrl;

	Site() { }

	Site(const string &_name, const string &binding, const string &_siteUrl,
		const string &_serviceUrl)
		: name(_name),
		  primarySiteBinding(binding),
		  siteUrl(_siteUrl),
		  serviceUrl(_serviceUrl)
		{ }
};

/**
 * A process running on behalf of a site. getProcesses() only fills in
 * <tt>id</tt> and <tt>name</tt>; getProcess() also fills in
 * <tt>openFileHandles</tt>.
 */
struct ProcessInfo {
	pid_t id;
	string name;
	vector<string> openFileHandles;

	ProcessInfo()
		: id(0)
		{ }

	ProcessInfo(pid_t _id, const string &_name)
		: id(_id),
		  name(_name)
		{ }
};


/**
 * Inspects and kills the processes that belong to a single site.
 * Implementations must be thread-safe.
 */
class ProcessManager {
public:
	virtual ~ProcessManager() { }

	virtual vector<ProcessInfo> getProcesses() = 0;

	/**
	 * Returns detailed information about the process with the given ID,
	 * including its open file handles.
	 */
	virtual ProcessInfo getProcess(pid_t id) = 0;

	/**
	 * Kills the given process. If <tt>throwOnError</tt> is false then
	 * failures are not reported.
	 */
	virtual void killProcess(pid_t id, bool throwOnError) = 0;
};

/**
 * Manages the source repository of a single site.
 */
class RepositoryManager {
public:
	virtual ~RepositoryManager() { }

	/**
	 * Deletes the repository working tree. If <tt>deleteWebRoot</tt> is true
	 * then the deployed web root is deleted too. If <tt>ignoreErrors</tt> is
	 * true then the deletion is best-effort and failures are not reported.
	 */
	virtual void deleteRepository(bool deleteWebRoot, bool ignoreErrors) = 0;
};

/**
 * Writes files into a site's web root over the site's HTTP service.
 */
class VfsManager {
public:
	virtual ~VfsManager() { }

	/**
	 * @throws HttpRequestException The service responded with an error status.
	 *     A 502 status means that the service gateway is not available yet.
	 */
	virtual void writeAllText(const string &path, const string &content) = 0;
};

/**
 * The site provisioning backend. Looks up and creates sites, and hands out
 * the per-site collaborators. Implementations must be thread-safe.
 */
class SiteManager {
public:
	virtual ~SiteManager() { }

	/**
	 * Returns the site with the given name, or a NULL pointer if no such
	 * site exists.
	 *
	 * @throws ProvisioningException
	 */
	virtual SitePtr getSite(const string &name) = 0;

	/**
	 * @throws ProvisioningException
	 */
	virtual SitePtr createSite(const string &name) = 0;

	virtual ProcessManagerPtr getProcessManager(const SitePtr &site) = 0;
	virtual RepositoryManagerPtr getRepositoryManager(const SitePtr &site) = 0;
	virtual VfsManagerPtr getVfsWebRootManager(const SitePtr &site) = 0;

	/**
	 * Asks the site's HTTP service how long it has been running.
	 * Used for annotating gateway errors.
	 */
	virtual string getServiceUpTime(const SitePtr &site) = 0;
};


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_BACKENDS_H_ */
