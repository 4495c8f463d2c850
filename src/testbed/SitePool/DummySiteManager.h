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
#ifndef _TESTBED_SITE_POOL_DUMMY_SITE_MANAGER_H_
#define _TESTBED_SITE_POOL_DUMMY_SITE_MANAGER_H_

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread.hpp>
#include <oxt/system_calls.hpp>
#include <oxt/backtrace.hpp>
#include <string>
#include <sstream>
#include <map>
#include <set>
#include <vector>

#include <Constants.h>
#include <Exceptions.h>
#include <Utils/Lock.h>
#include <Utils/StrIntUtils.h>
#include <Utils/SystemTime.h>
#include <SitePool/Backends.h>

namespace Testbed {
namespace SitePool {

using namespace std;
using namespace boost;
using namespace oxt;


/**
 * An in-memory site backend for testing and debugging purposes. Sites,
 * their processes, repositories and web roots only exist inside this
 * object. Failures and delays can be injected through the public fields,
 * which may only be modified while holding <tt>syncher</tt> or before the
 * object is shared with other threads.
 */
class DummySiteManager: public SiteManager {
public:
	struct DummyProcess {
		ProcessInfo info;
		bool alive;
		/** The process exits as soon as somebody tries to inspect it. */
		bool exitsOnInspection;
	};

	struct DummySite {
		SitePtr site;
		unsigned long long startTime;
		map<pid_t, DummyProcess> processes;
		set<string> repositoryFiles;
		map<string, string> webRootFiles;
	};

	typedef map<string, DummySite> SiteMap;

private:
	class DummyProcessManager: public ProcessManager {
	private:
		DummySiteManager *manager;
		string siteName;

	public:
		DummyProcessManager(DummySiteManager *_manager, const string &_siteName)
			: manager(_manager),
			  siteName(_siteName)
			{ }

		virtual vector<ProcessInfo> getProcesses() {
			return manager->listProcesses(siteName);
		}

		virtual ProcessInfo getProcess(pid_t id) {
			return manager->lookupProcess(siteName, id);
		}

		virtual void killProcess(pid_t id, bool throwOnError) {
			manager->killProcess(siteName, id, throwOnError);
		}
	};

	class DummyRepositoryManager: public RepositoryManager {
	private:
		DummySiteManager *manager;
		string siteName;

	public:
		DummyRepositoryManager(DummySiteManager *_manager, const string &_siteName)
			: manager(_manager),
			  siteName(_siteName)
			{ }

		virtual void deleteRepository(bool deleteWebRoot, bool ignoreErrors) {
			manager->deleteRepository(siteName, deleteWebRoot, ignoreErrors);
		}
	};

	class DummyVfsManager: public VfsManager {
	private:
		DummySiteManager *manager;
		string siteName;

	public:
		DummyVfsManager(DummySiteManager *_manager, const string &_siteName)
			: manager(_manager),
			  siteName(_siteName)
			{ }

		virtual void writeAllText(const string &path, const string &content) {
			manager->writeWebRootFile(siteName, path, content);
		}
	};

	boost::condition_variable provisioningResumed;
	SiteMap sites;
	pid_t nextPid;
	unsigned int nextPort;

	DummySite &lookupSite(const string &name) {
		SiteMap::iterator it = sites.find(name);
		if (it == sites.end()) {
			throw ProvisioningException("Site '" + name + "' does not exist", name);
		}
		return it->second;
	}

	SitePtr createSiteUnlocked(const string &name) {
		unsigned int port = nextPort++;
		SitePtr site = boost::make_shared<Site>(name,
			"http://localhost:" + toString(port) + "/",
			"http://localhost:" + toString(port) + "/",
			"http://localhost:" + toString(port + 1000) + "/");
		DummySite &entry = sites[name];
		entry.site = site;
		entry.startTime = SystemTime::getMsec();
		return site;
	}

	/** Sleeps for provisionDelay and blocks while provisioning is paused. */
	void simulateProvisioningLatency() {
		ScopedLock l(syncher);
		provisioningCalls++;
		while (provisioningPaused) {
			waitingProvisioners++;
			try {
				provisioningResumed.wait(l);
			} catch (const boost::thread_interrupted &) {
				waitingProvisioners--;
				throw;
			}
			waitingProvisioners--;
		}
		unsigned int delay = provisionDelay;
		l.unlock();
		if (delay > 0) {
			syscalls::usleep(delay);
		}
	}

	static string formatUpTime(unsigned long long msec) {
		unsigned long long seconds = msec / 1000;
		stringstream result;

		if (seconds >= 60) {
			unsigned long long minutes = seconds / 60;
			if (minutes >= 60) {
				unsigned long long hours = minutes / 60;
				minutes = minutes % 60;
				result << hours << "h ";
			}

			seconds = seconds % 60;
			result << minutes << "m ";
		}
		result << seconds << "s";
		return result.str();
	}

public:
	mutable boost::mutex syncher;

	/** Microseconds that every getSite() and createSite() call sleeps. */
	unsigned int provisionDelay;
	bool provisioningPaused;
	/** Number of getSite() and createSite() calls blocked by pauseProvisioning(). */
	unsigned int waitingProvisioners;

	bool failGetSite;
	bool failCreateSite;
	/** If true, listing or inspecting processes fails. */
	bool failProcessInspection;
	/** If true, killProcess() fails for every process. */
	bool failKillProcess;
	bool failDeleteRepository;
	/** If non-zero, writeAllText() fails this many times with writeFailureStatus. */
	unsigned int writeFailures;
	int writeFailureStatus;
	bool failUpTime;
	/** If true, getServiceUpTime() returns an empty string. */
	bool emptyUpTime;

	unsigned int provisioningCalls;
	unsigned int getSiteCalls;
	unsigned int createSiteCalls;
	unsigned int killCalls;
	unsigned int deleteRepositoryCalls;
	unsigned int writeCalls;
	unsigned int upTimeCalls;

	DummySiteManager() {
		nextPid = 1000;
		nextPort = 8081;
		provisionDelay = 0;
		provisioningPaused = false;
		waitingProvisioners = 0;
		failGetSite = false;
		failCreateSite = false;
		failProcessInspection = false;
		failKillProcess = false;
		failDeleteRepository = false;
		writeFailures = 0;
		writeFailureStatus = BAD_GATEWAY_STATUS;
		failUpTime = false;
		emptyUpTime = false;
		provisioningCalls = 0;
		getSiteCalls = 0;
		createSiteCalls = 0;
		killCalls = 0;
		deleteRepositoryCalls = 0;
		writeCalls = 0;
		upTimeCalls = 0;
	}


	/****** SiteManager interface ******/

	virtual SitePtr getSite(const string &name) {
		TRACE_POINT();
		simulateProvisioningLatency();
		LockGuard l(syncher);
		getSiteCalls++;
		if (failGetSite) {
			throw ProvisioningException("Cannot query site '" + name + "'", name);
		}
		SiteMap::iterator it = sites.find(name);
		if (it == sites.end()) {
			return SitePtr();
		} else {
			return it->second.site;
		}
	}

	virtual SitePtr createSite(const string &name) {
		TRACE_POINT();
		simulateProvisioningLatency();
		LockGuard l(syncher);
		createSiteCalls++;
		if (failCreateSite) {
			throw ProvisioningException("Cannot create site '" + name + "'", name);
		}
		if (sites.find(name) != sites.end()) {
			throw ProvisioningException("Site '" + name + "' already exists", name);
		}
		return createSiteUnlocked(name);
	}

	virtual ProcessManagerPtr getProcessManager(const SitePtr &site) {
		return boost::make_shared<DummyProcessManager>(this, site->name);
	}

	virtual RepositoryManagerPtr getRepositoryManager(const SitePtr &site) {
		return boost::make_shared<DummyRepositoryManager>(this, site->name);
	}

	virtual VfsManagerPtr getVfsWebRootManager(const SitePtr &site) {
		return boost::make_shared<DummyVfsManager>(this, site->name);
	}

	virtual string getServiceUpTime(const SitePtr &site) {
		LockGuard l(syncher);
		upTimeCalls++;
		if (failUpTime) {
			throw RuntimeException("Cannot query the up time of site '" + site->name + "'");
		}
		if (emptyUpTime) {
			return string();
		}
		DummySite &entry = lookupSite(site->name);
		unsigned long long now = SystemTime::getMsec();
		if (now < entry.startTime) {
			now = entry.startTime;
		}
		return formatUpTime(now - entry.startTime);
	}


	/****** Per-site operations ******/

	vector<ProcessInfo> listProcesses(const string &siteName) {
		LockGuard l(syncher);
		DummySite &entry = lookupSite(siteName);
		if (failProcessInspection) {
			throw RuntimeException("Cannot list the processes of site '" + siteName + "'");
		}
		vector<ProcessInfo> result;
		map<pid_t, DummyProcess>::const_iterator it;
		for (it = entry.processes.begin(); it != entry.processes.end(); it++) {
			if (it->second.alive) {
				// The listing does not include file handles.
				result.push_back(ProcessInfo(it->second.info.id, it->second.info.name));
			}
		}
		return result;
	}

	ProcessInfo lookupProcess(const string &siteName, pid_t id) {
		LockGuard l(syncher);
		DummySite &entry = lookupSite(siteName);
		if (failProcessInspection) {
			throw RuntimeException("Cannot inspect process " + toString(id));
		}
		map<pid_t, DummyProcess>::iterator it = entry.processes.find(id);
		if (it != entry.processes.end() && it->second.exitsOnInspection) {
			it->second.alive = false;
		}
		if (it == entry.processes.end() || !it->second.alive) {
			throw RuntimeException("Process " + toString(id) + " not found");
		}
		return it->second.info;
	}

	void killProcess(const string &siteName, pid_t id, bool throwOnError) {
		LockGuard l(syncher);
		killCalls++;
		DummySite &entry = lookupSite(siteName);
		map<pid_t, DummyProcess>::iterator it = entry.processes.find(id);
		if (failKillProcess || it == entry.processes.end() || !it->second.alive) {
			if (throwOnError) {
				throw RuntimeException("Cannot kill process " + toString(id));
			}
		} else {
			it->second.alive = false;
		}
	}

	void deleteRepository(const string &siteName, bool deleteWebRoot, bool ignoreErrors) {
		LockGuard l(syncher);
		deleteRepositoryCalls++;
		DummySite &entry = lookupSite(siteName);
		if (failDeleteRepository) {
			if (!ignoreErrors) {
				throw RuntimeException("Cannot delete the repository of site '"
					+ siteName + "'");
			}
			// Best-effort mode: only part of the tree gets removed.
			if (!entry.repositoryFiles.empty()) {
				entry.repositoryFiles.erase(entry.repositoryFiles.begin());
			}
			return;
		}
		entry.repositoryFiles.clear();
		if (deleteWebRoot) {
			entry.webRootFiles.clear();
		}
	}

	void writeWebRootFile(const string &siteName, const string &path, const string &content) {
		LockGuard l(syncher);
		writeCalls++;
		DummySite &entry = lookupSite(siteName);
		if (writeFailures > 0) {
			writeFailures--;
			string reason = (writeFailureStatus == BAD_GATEWAY_STATUS)
				? "Bad Gateway"
				: "Error";
			throw HttpRequestException("Response status code does not indicate success: "
				+ toString(writeFailureStatus) + " (" + reason + ").",
				writeFailureStatus);
		}
		entry.webRootFiles[path] = content;
	}


	/****** Test helpers ******/

	/** Creates a site directly, bypassing delays and failure injection. */
	SitePtr addSite(const string &name) {
		LockGuard l(syncher);
		return createSiteUnlocked(name);
	}

	/** Deletes a site behind the back of any Application that refers to it. */
	void removeSite(const string &name) {
		LockGuard l(syncher);
		sites.erase(name);
	}

	bool hasSite(const string &name) const {
		LockGuard l(syncher);
		return sites.find(name) != sites.end();
	}

	pid_t addProcess(const string &siteName, const string &processName,
		const vector<string> &openFileHandles = vector<string>())
	{
		LockGuard l(syncher);
		DummySite &entry = lookupSite(siteName);
		DummyProcess process;
		process.info.id = nextPid++;
		process.info.name = processName;
		process.info.openFileHandles = openFileHandles;
		process.alive = true;
		process.exitsOnInspection = false;
		entry.processes[process.info.id] = process;
		return process.info.id;
	}

	/**
	 * Lets the given process exit between being listed and being inspected,
	 * so that getProcess() reports it as not found.
	 */
	void exitProcessOnInspection(const string &siteName, pid_t id) {
		LockGuard l(syncher);
		DummySite &entry = lookupSite(siteName);
		map<pid_t, DummyProcess>::iterator it = entry.processes.find(id);
		if (it != entry.processes.end()) {
			it->second.exitsOnInspection = true;
		}
	}

	bool isProcessAlive(const string &siteName, pid_t id) {
		LockGuard l(syncher);
		DummySite &entry = lookupSite(siteName);
		map<pid_t, DummyProcess>::const_iterator it = entry.processes.find(id);
		return it != entry.processes.end() && it->second.alive;
	}

	void addRepositoryFile(const string &siteName, const string &path) {
		LockGuard l(syncher);
		lookupSite(siteName).repositoryFiles.insert(path);
	}

	unsigned int getRepositoryFileCount(const string &siteName) {
		LockGuard l(syncher);
		return lookupSite(siteName).repositoryFiles.size();
	}

	void addWebRootFile(const string &siteName, const string &path, const string &content) {
		LockGuard l(syncher);
		lookupSite(siteName).webRootFiles[path] = content;
	}

	/** Returns whether the file exists and, if so, stores its content into <tt>content</tt>. */
	bool readWebRootFile(const string &siteName, const string &path, string &content) {
		LockGuard l(syncher);
		DummySite &entry = lookupSite(siteName);
		map<string, string>::const_iterator it = entry.webRootFiles.find(path);
		if (it == entry.webRootFiles.end()) {
			return false;
		} else {
			content = it->second;
			return true;
		}
	}

	/** Makes getSite() and createSite() block until resumeProvisioning() is called. */
	void pauseProvisioning() {
		LockGuard l(syncher);
		provisioningPaused = true;
	}

	void resumeProvisioning() {
		LockGuard l(syncher);
		provisioningPaused = false;
		provisioningResumed.notify_all();
	}

	unsigned int getWaitingProvisioners() const {
		LockGuard l(syncher);
		return waitingProvisioners;
	}
};

typedef boost::shared_ptr<DummySiteManager> DummySiteManagerPtr;


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_DUMMY_SITE_MANAGER_H_ */
