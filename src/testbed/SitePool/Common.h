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
#ifndef _TESTBED_SITE_POOL_COMMON_H_
#define _TESTBED_SITE_POOL_COMMON_H_

#include <boost/shared_ptr.hpp>
#include <oxt/tracable_exception.hpp>
#include <vector>

namespace tut {
	struct SitePool_PoolTest;
	struct SitePool_ProvisionerTest;
}

namespace Testbed {
namespace SitePool {

using namespace std;
using namespace boost;
using namespace oxt;

class Pool;
class Provisioner;
class Application;
class SiteManager;
class ProcessManager;
class RepositoryManager;
class VfsManager;
struct Site;

/**
 * Identifies one of the reusable sites in the pool. Valid slot indices are
 * 1 up to and including Options::maxSlots.
 */
typedef unsigned int SlotIndex;

typedef boost::shared_ptr<Pool> PoolPtr;
typedef boost::shared_ptr<Provisioner> ProvisionerPtr;
typedef boost::shared_ptr<Application> ApplicationPtr;
typedef boost::shared_ptr<SiteManager> SiteManagerPtr;
typedef boost::shared_ptr<ProcessManager> ProcessManagerPtr;
typedef boost::shared_ptr<RepositoryManager> RepositoryManagerPtr;
typedef boost::shared_ptr<VfsManager> VfsManagerPtr;
typedef boost::shared_ptr<Site> SitePtr;

/**
 * Who asked for an application to be provisioned. Only used for logging
 * and for the debugging counters.
 */
enum ProvisionReason {
	// acquire() found nothing in the cache and provisions while the caller waits.
	PR_FOREGROUND,
	// The pool prepares the next application in the background.
	PR_PREFETCH
};

const char *provisionReasonToString(ProvisionReason reason);

} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_COMMON_H_ */
