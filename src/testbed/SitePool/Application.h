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
#ifndef _TESTBED_SITE_POOL_APPLICATION_H_
#define _TESTBED_SITE_POOL_APPLICATION_H_

#include <boost/noncopyable.hpp>
#include <string>
#include <SitePool/Common.h>
#include <SitePool/Backends.h>

namespace Testbed {
namespace SitePool {

using namespace std;


/**
 * A provisioned site that has been handed out by the Pool (or is waiting
 * in the Pool to be handed out). Tests talk to the site through the
 * managers returned here.
 *
 * The Application does not own the site: when the test is done, the owner
 * calls Pool::report() which releases the slot index so that the same site
 * can be cleaned up and handed out again later.
 */
class Application: public boost::noncopyable {
private:
	SiteManagerPtr siteManager;
	SitePtr site;
	string name;
	SlotIndex slotIndex;

	ProcessManagerPtr processManager;
	RepositoryManagerPtr repositoryManager;
	VfsManagerPtr vfsWebRootManager;

public:
	Application(const SiteManagerPtr &_siteManager, const SitePtr &_site,
		const string &_name, SlotIndex _slotIndex)
		: siteManager(_siteManager),
		  site(_site),
		  name(_name),
		  slotIndex(_slotIndex)
	{
		processManager = siteManager->getProcessManager(site);
		repositoryManager = siteManager->getRepositoryManager(site);
		vfsWebRootManager = siteManager->getVfsWebRootManager(site);
	}

	const string &getName() const {
		return name;
	}

	SlotIndex getSlotIndex() const {
		return slotIndex;
	}

	const SitePtr &getSite() const {
		return site;
	}

	const string &getPrimarySiteBinding() const {
		return site->primarySiteBinding;
	}

	const ProcessManagerPtr &getProcessManager() const {
		return processManager;
	}

	const RepositoryManagerPtr &getRepositoryManager() const {
		return repositoryManager;
	}

	const VfsManagerPtr &getVfsWebRootManager() const {
		return vfsWebRootManager;
	}

	string getUpTime() const {
		return siteManager->getServiceUpTime(site);
	}
};


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_APPLICATION_H_ */
