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
#include <string>
#include <vector>
#include <boost/make_shared.hpp>
#include <boost/bind.hpp>
#include <oxt/backtrace.hpp>
#include <SitePool/Pool.h>
#include <SitePool/Provisioner.h>
#include <SitePool/Application.h>
#include <Constants.h>
#include <Exceptions.h>
#include <Logging.h>
#include <Utils/ScopeGuard.h>
#include <Utils/StrIntUtils.h>

namespace Testbed {
namespace SitePool {

using namespace std;
using namespace boost;
using namespace oxt;


const char *
provisionReasonToString(ProvisionReason reason) {
	switch (reason) {
	case PR_FOREGROUND:
		return "foreground";
	case PR_PREFETCH:
		return "prefetch";
	default:
		return "unknown";
	}
}


ApplicationPtr
Provisioner::provision(SlotIndex index) {
	TRACE_POINT();
	string name = options.getSiteName(index);
	string operationName = "SitePool.provision " + name;

	SitePtr site = siteManager->getSite(name);
	if (site == NULL) {
		UPDATE_TRACE_POINT();
		TB_INFO(operationName << ": Creating new site");
		site = siteManager->createSite(name);
		if (site == NULL) {
			throw ProvisioningException("The site backend did not return site '"
				+ name + "' after creating it", name);
		}
		TB_INFO(operationName << ": Created new site at " << site->primarySiteBinding);
		return boost::make_shared<Application>(siteManager, site, name, index);
	}

	TB_INFO(operationName << ": Site already exists at " << site->primarySiteBinding
		<< ". Reusing site");
	ApplicationPtr app = boost::make_shared<Application>(siteManager, site, name, index);

	UPDATE_TRACE_POINT();
	killStaleProcesses(app, operationName);
	UPDATE_TRACE_POINT();
	wipeRepository(app, operationName);
	UPDATE_TRACE_POINT();
	writeMarkerFile(app);

	TB_INFO(operationName << ": completed");
	return app;
}

void
Provisioner::killStaleProcesses(const ApplicationPtr &app, const string &operationName) {
	TRACE_POINT();
	const ProcessManagerPtr &processManager = app->getProcessManager();
	vector<ProcessInfo> processes;
	try {
		processes = processManager->getProcesses();
	} catch (const tracable_exception &e) {
		TB_WARN(operationName << ": cannot list worker processes: " << e.what()
			<< "\n  Backtrace:\n" << e.backtrace());
		return;
	}

	vector<ProcessInfo>::const_iterator it;
	for (it = processes.begin(); it != processes.end(); it++) {
		if (!equalsIgnoreCase(it->name, options.workerProcessName)) {
			continue;
		}

		// Failures are per process; the remaining processes are still checked.
		UPDATE_TRACE_POINT();
		try {
			ProcessInfo details = processManager->getProcess(it->id);
			vector<string>::const_iterator handle;
			for (handle = details.openFileHandles.begin();
			     handle != details.openFileHandles.end();
			     handle++)
			{
				if (containsIgnoreCase(*handle, options.staleModuleName)) {
					TB_DEBUG(operationName << ": killing process " << it->id
						<< " which still holds " << *handle);
					processManager->killProcess(it->id, false);
					break;
				}
			}
		} catch (const tracable_exception &e) {
			TB_WARN(operationName << ": cannot clean up worker process " << it->id
				<< ": " << e.what() << "\n  Backtrace:\n" << e.backtrace());
		}
	}
}

void
Provisioner::wipeRepository(const ApplicationPtr &app, const string &operationName) {
	TRACE_POINT();
	try {
		app->getRepositoryManager()->deleteRepository(true, true);
	} catch (const tracable_exception &e) {
		TB_WARN(operationName << ": cannot delete the repository: " << e.what()
			<< "\n  Backtrace:\n" << e.backtrace());
	}
}

void
Provisioner::writeMarkerFile(const ApplicationPtr &app) {
	TRACE_POINT();
	try {
		app->getVfsWebRootManager()->writeAllText(options.markerFileName,
			options.markerContent);
	} catch (const HttpRequestException &e) {
		if (e.getStatus() != BAD_GATEWAY_STATUS) {
			throw;
		}

		UPDATE_TRACE_POINT();
		string upTime;
		try {
			upTime = app->getUpTime();
		} catch (const tracable_exception &e2) {
			TB_WARN("Cannot determine the up time of " << app->getName() << ": "
				<< e2.what() << "\n  Backtrace:\n" << e2.backtrace());
		}

		if (upTime.empty()) {
			throw;
		} else {
			throw HttpRequestException(string(e.what()) + " Up Time: " + upTime,
				e.getStatus());
		}
	}
}


ApplicationPtr
Pool::provisionNewApplication(ProvisionReason reason) {
	TRACE_POINT();
	SlotIndex index;
	{
		// Slots change hands only under syncher; report() depends on a stable count.
		LockGuard l(syncher);
		if (!registry.tryTake(index)) {
			throw NoFreeSlotException("All " + toString(options.maxSlots)
				+ " site pool slots are in use or have been discarded");
		}
	}

	TB_DEBUG("SitePool: provisioning slot " << index << " ("
		<< provisionReasonToString(reason) << ")");
	ScopeGuard guard(boost::bind(&Pool::releaseFailedSlot, this, index));
	ApplicationPtr app;
	try {
		app = provisioner->provision(index);
	} catch (const boost::thread_interrupted &) {
		// Interrupted by destroy(). Nothing is known to be wrong with the site.
		guard.clear();
		releaseInterruptedSlot(index);
		throw;
	}
	guard.clear();

	if (reason == PR_FOREGROUND) {
		LockGuard l(syncher);
		if (debugSupport != NULL) {
			debugSupport->foregroundProvisions++;
		}
	}
	return app;
}

void
Pool::startPreparationUnlocked() {
	if (lifeStatus != ALIVE || preparing || nextApplication != NULL) {
		return;
	}
	if (registry.count() == 0) {
		TB_DEBUG("SitePool: no free slot, not preparing an application in advance");
		if (debugSupport != NULL) {
			debugSupport->preparationsSkipped++;
		}
		return;
	}

	preparing = true;
	if (debugSupport != NULL) {
		debugSupport->preparationsStarted++;
	}
	try {
		interruptableThreads.create_thread(
			boost::bind(&Pool::preparationThreadMain, this),
			"SitePool preparer",
			PREPARER_THREAD_STACK_SIZE);
	} catch (const boost::thread_resource_error &e) {
		preparing = false;
		preparationDone.notify_all();
		TB_ERROR("SitePool: cannot start a preparation thread: " << e.what());
	}
}

void
Pool::preparationThreadMain() {
	TRACE_POINT();
	ScopeGuard guard(boost::bind(&Pool::abortPreparation, this));
	ApplicationPtr app;
	bool failed = false;
	bool skipped = false;

	try {
		app = provisionNewApplication(PR_PREFETCH);
	} catch (const NoFreeSlotException &e) {
		TB_DEBUG("SitePool: not preparing an application in advance: " << e.what());
		skipped = true;
	} catch (const tracable_exception &e) {
		TB_WARN("SitePool: could not prepare an application in advance: " << e.what()
			<< "\n  Backtrace:\n" << e.backtrace());
		failed = true;
	}
	// boost::thread_interrupted is not caught: the guard resets the
	// preparing flag and oxt::thread ends the thread.

	UPDATE_TRACE_POINT();
	guard.clear();
	finishPreparation(app, failed, skipped);
}

void
Pool::finishPreparation(const ApplicationPtr &app, bool failed, bool skipped) {
	LockGuard l(syncher);
	preparing = false;

	if (debugSupport != NULL) {
		if (app != NULL) {
			debugSupport->preparationsSucceeded++;
		} else if (failed) {
			debugSupport->preparationsFailed++;
		} else if (skipped) {
			debugSupport->preparationsSkipped++;
		}
	}

	if (app != NULL) {
		if (lifeStatus != ALIVE) {
			TB_DEBUG("SitePool: shutting down, dropping prepared application "
				<< app->getName());
			registry.giveBack(app->getSlotIndex());
		} else if (nextApplication != NULL) {
			TB_BUG("SitePool: a prepared application (" << nextApplication->getName()
				<< ") already exists while " << app->getName() << " was being prepared");
		} else {
			TB_DEBUG("SitePool: prepared application " << app->getName()
				<< " at " << app->getPrimarySiteBinding());
			nextApplication = app;
		}
	}

	preparationDone.notify_all();
	verifyInvariants();
}

void
Pool::abortPreparation() {
	LockGuard l(syncher);
	TB_DEBUG("SitePool: preparation interrupted");
	preparing = false;
	preparationDone.notify_all();
}


} // namespace SitePool
} // namespace Testbed
