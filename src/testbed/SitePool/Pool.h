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
#ifndef _TESTBED_SITE_POOL_POOL_H_
#define _TESTBED_SITE_POOL_POOL_H_

#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread.hpp>
#include <boost/bind.hpp>
#include <oxt/dynamic_thread_group.hpp>
#include <oxt/backtrace.hpp>
#include <string>
#include <sstream>
#include <vector>
#include <cassert>

#include <Logging.h>
#include <Exceptions.h>
#include <Utils/Lock.h>
#include <Utils/ScopeGuard.h>
#include <Utils/StrIntUtils.h>
#include <SitePool/Common.h>
#include <SitePool/Options.h>
#include <SitePool/SlotRegistry.h>
#include <SitePool/Provisioner.h>
#include <SitePool/Application.h>

namespace Testbed {
namespace SitePool {

using namespace std;
using namespace boost;
using namespace oxt;


/**
 * Hands out reusable test sites to concurrently running tests.
 *
 * The pool has a fixed number of slots, each of which corresponds to a
 * site named after the slot index. acquire() takes a free slot and returns
 * an Application for its site. Tests report their outcome with report():
 * on success the slot becomes free again; on failure the slot is discarded
 * for the rest of the Pool's life, because the site behind it may be in a
 * bad state. A slot is never discarded if that would leave fewer than 2
 * free slots: running out of slots is worse than reusing a suspicious site.
 *
 * Provisioning a site is slow, so the Pool keeps one Application prepared
 * in advance. acquire() hands out the prepared Application if there is one,
 * and provisions one on the spot otherwise. Either way it then starts
 * preparing the next Application in a background thread. At most one
 * preparation runs at any time. An acquire() that arrives while a
 * preparation is running waits for that preparation and takes its result.
 * A failed preparation is logged and not retried: the next acquire() will
 * simply provision on the spot.
 *
 * When all slots are taken, acquire() throws NoFreeSlotException instead
 * of waiting, and background preparation is skipped.
 *
 * Provisioning I/O never happens while holding the Pool lock.
 *
 * Pool is fully thread-safe. Create one Pool per process, call initialize()
 * right after construction and destroy() right before destruction.
 */
class Pool {
public:
	static const unsigned int PREPARER_THREAD_STACK_SIZE = DEFAULT_PREPARER_THREAD_STACK_SIZE;

	/**
	 * Counters that unit tests use to observe the allocation protocol.
	 * Only maintained after initDebugging() has been called. Protected
	 * by Pool::syncher.
	 */
	struct DebugSupport {
		/** Number of acquire() calls that had to provision on the spot. */
		unsigned int foregroundProvisions;
		/** Number of acquire() calls served from the prepared Application. */
		unsigned int cacheHits;
		unsigned int preparationsStarted;
		unsigned int preparationsSucceeded;
		unsigned int preparationsFailed;
		/** Preparations that found no free slot. */
		unsigned int preparationsSkipped;

		DebugSupport() {
			foregroundProvisions  = 0;
			cacheHits             = 0;
			preparationsStarted   = 0;
			preparationsSucceeded = 0;
			preparationsFailed    = 0;
			preparationsSkipped   = 0;
		}
	};

	typedef boost::shared_ptr<DebugSupport> DebugSupportPtr;

// Actually private, but marked public so that unit tests can access the fields.
public:
	friend struct tut::SitePool_PoolTest;

	ProvisionerPtr provisioner;
	Options options;
	SlotRegistry registry;

	mutable boost::mutex syncher;
	/** Signalled whenever a background preparation finishes, successfully or not. */
	boost::condition_variable preparationDone;

	/** The Application prepared in advance, if any. */
	ApplicationPtr nextApplication;
	/** Whether a background preparation is in flight. */
	bool preparing;
	/** Slots that have been taken out of circulation, in order of discarding. */
	vector<SlotIndex> discardedSlots;

	/**
	 * Background preparation threads. They are interrupted and joined
	 * upon destroy().
	 */
	dynamic_thread_group interruptableThreads;

	enum LifeStatus {
		ALIVE,
		SHUTTING_DOWN,
		SHUT_DOWN
	} lifeStatus;

	DebugSupportPtr debugSupport;

	ApplicationPtr provisionNewApplication(ProvisionReason reason);
	void startPreparationUnlocked();
	void preparationThreadMain();
	void finishPreparation(const ApplicationPtr &app, bool failed, bool skipped);
	void abortPreparation();

	/**
	 * Returns the slot to the registry, or discards it, according to the
	 * report() policy. Must be called with the lock held.
	 */
	void releaseSlotUnlocked(SlotIndex index, bool success, const string &name) {
		if (success || registry.count() <= 1) {
			registry.giveBack(index);
			TB_DEBUG("SitePool: slot " << index << " (" << name << ") returned to pool");
		} else {
			discardedSlots.push_back(index);
			TB_INFO("SitePool: Removing application " << name << " from pool");
		}
	}

	void releaseFailedSlot(SlotIndex index) {
		LockGuard l(syncher);
		releaseSlotUnlocked(index, false, options.getSiteName(index));
	}

	void releaseInterruptedSlot(SlotIndex index) {
		LockGuard l(syncher);
		registry.giveBack(index);
		TB_DEBUG("SitePool: provisioning of slot " << index
			<< " interrupted, slot returned to pool");
	}

	void verifyInvariants() const {
		// !a || b: logical equivalent of a => b
		assert(!(lifeStatus == SHUT_DOWN) || (nextApplication == NULL && !preparing));
		assert(registry.count() + discardedSlots.size() <= options.maxSlots);
	}

public:
	Pool(const ProvisionerPtr &_provisioner)
		: provisioner(_provisioner),
		  options(_provisioner->getOptions()),
		  registry(_provisioner->getOptions().maxSlots),
		  preparing(false),
		  lifeStatus(ALIVE)
		{ }

	~Pool() {
		if (lifeStatus != SHUT_DOWN) {
			TB_BUG("You must call Pool::destroy() before actually destroying the Pool object!");
		}
	}

	/** Must be called right after construction. */
	void initialize() {
		LockGuard l(syncher);
		TB_DEBUG("SitePool: initializing with " << options.inspect());
		if (options.prefetchOnStart) {
			startPreparationUnlocked();
		}
	}

	void initDebugging() {
		LockGuard l(syncher);
		debugSupport = boost::make_shared<DebugSupport>();
	}

	/**
	 * Must be called right before destruction. Interrupts and waits for
	 * any background preparation. The prepared Application, if any, is
	 * dropped and its slot returned to the registry.
	 */
	void destroy() {
		TRACE_POINT();
		ScopedLock lock(syncher);
		assert(lifeStatus == ALIVE);
		lifeStatus = SHUTTING_DOWN;
		preparationDone.notify_all();

		UPDATE_TRACE_POINT();
		lock.unlock();
		interruptableThreads.interrupt_and_join_all();
		lock.lock();

		if (nextApplication != NULL) {
			registry.giveBack(nextApplication->getSlotIndex());
			nextApplication.reset();
		}
		lifeStatus = SHUT_DOWN;
		verifyInvariants();
	}

	/**
	 * Returns an Application for exclusive use by the caller. The caller
	 * must eventually pass it to report().
	 *
	 * @throws NoFreeSlotException All slots are in use or discarded.
	 * @throws RuntimeException The pool is being destroyed.
	 * @throws tracable_exception Provisioning failed; see Provisioner::provision().
	 * @throws boost::thread_interrupted
	 */
	ApplicationPtr acquire() {
		TRACE_POINT();
		TB_TRACE(2, "SitePool: acquire()");
		ScopedLock l(syncher);
		while (preparing && lifeStatus == ALIVE) {
			// The Application that is being prepared is as good as
			// cached; wait for it instead of provisioning another one.
			preparationDone.wait(l);
		}
		if (lifeStatus != ALIVE) {
			throw RuntimeException("The site pool is shutting down");
		}
		verifyInvariants();

		ApplicationPtr app = nextApplication;
		nextApplication.reset();
		if (app != NULL) {
			TB_DEBUG("SitePool: handing out prepared application " << app->getName());
			if (debugSupport != NULL) {
				debugSupport->cacheHits++;
			}
		}
		l.unlock();

		if (app == NULL) {
			UPDATE_TRACE_POINT();
			app = provisionNewApplication(PR_FOREGROUND);
		}

		UPDATE_TRACE_POINT();
		l.lock();
		startPreparationUnlocked();
		return app;
	}

	/**
	 * Reports the outcome of the test that used the given Application.
	 * On success the Application's slot becomes free again. On failure the
	 * slot is discarded, unless at most 1 slot is currently free, in which
	 * case it is returned as well.
	 *
	 * @throws ArgumentException <tt>app</tt> is NULL.
	 */
	void report(const ApplicationPtr &app, bool success) {
		TRACE_POINT();
		if (app == NULL) {
			throw ArgumentException("Cannot report the outcome of a NULL application");
		}
		LockGuard l(syncher);
		TB_DEBUG("SitePool: " << app->getName() << " reported "
			<< (success ? "success" : "failure"));
		releaseSlotUnlocked(app->getSlotIndex(), success, app->getName());
		verifyInvariants();
	}

	unsigned int getFreeSlotCount() const {
		return registry.count();
	}

	vector<SlotIndex> getFreeSlots() const {
		return registry.getIndices();
	}

	vector<SlotIndex> getDiscardedSlots() const {
		LockGuard l(syncher);
		return discardedSlots;
	}

	bool hasPendingApplication() const {
		LockGuard l(syncher);
		return nextApplication != NULL;
	}

	bool isPreparing() const {
		LockGuard l(syncher);
		return preparing;
	}

	const Options &getOptions() const {
		return options;
	}

	string inspect() const {
		LockGuard l(syncher);
		stringstream stream;
		vector<SlotIndex> freeSlots = registry.getIndices();
		vector<SlotIndex>::const_iterator it;

		stream << "Site pool (" << options.maxSlots << " slots)\n";
		stream << "  Free slots     :";
		for (it = freeSlots.begin(); it != freeSlots.end(); it++) {
			stream << " " << *it;
		}
		stream << "\n";
		stream << "  Discarded slots:";
		for (it = discardedSlots.begin(); it != discardedSlots.end(); it++) {
			stream << " " << *it;
		}
		stream << "\n";
		stream << "  Prepared       : ";
		if (nextApplication != NULL) {
			stream << nextApplication->getName() << " at "
				<< nextApplication->getPrimarySiteBinding();
		} else if (preparing) {
			stream << "(in progress)";
		} else {
			stream << "(none)";
		}
		stream << "\n";
		return stream.str();
	}
};


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_POOL_H_ */
