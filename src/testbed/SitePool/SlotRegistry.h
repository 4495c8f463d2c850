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
#ifndef _TESTBED_SITE_POOL_SLOT_REGISTRY_H_
#define _TESTBED_SITE_POOL_SLOT_REGISTRY_H_

#include <boost/thread.hpp>
#include <vector>
#include <Exceptions.h>
#include <Utils/Lock.h>
#include <Utils/StrIntUtils.h>
#include <SitePool/Common.h>

namespace Testbed {
namespace SitePool {

using namespace std;
using namespace boost;


/**
 * Keeps track of which slot indices are free. Indices are handed out in
 * LIFO order: the most recently returned index is taken first, because the
 * site behind it is most likely still warm. Initially the registry contains
 * all indices from 1 to maxSlots, and tryTake() returns them in ascending
 * order.
 *
 * SlotRegistry does not guard against an index being given back twice;
 * the Pool is the only caller and it never does that.
 *
 * SlotRegistry is thread-safe.
 */
class SlotRegistry {
private:
	mutable boost::mutex syncher;
	/** Top of the stack is at the back. */
	vector<SlotIndex> indices;
	SlotIndex maxSlots;

public:
	SlotRegistry(SlotIndex _maxSlots)
		: maxSlots(_maxSlots)
	{
		indices.reserve(maxSlots);
		for (SlotIndex i = maxSlots; i >= 1; i--) {
			indices.push_back(i);
		}
	}

	/**
	 * Removes an arbitrary free index from the registry and stores it into
	 * <tt>index</tt>. Returns false, leaving <tt>index</tt> untouched, if no
	 * index is free.
	 */
	bool tryTake(SlotIndex &index) {
		LockGuard l(syncher);
		if (indices.empty()) {
			return false;
		} else {
			index = indices.back();
			indices.pop_back();
			return true;
		}
	}

	/**
	 * @throws ArgumentException The index is out of range.
	 */
	void giveBack(SlotIndex index) {
		if (index < 1 || index > maxSlots) {
			throw ArgumentException("Slot index " + toString(index)
				+ " is out of range (1-" + toString(maxSlots) + ")");
		}
		LockGuard l(syncher);
		indices.push_back(index);
	}

	unsigned int count() const {
		LockGuard l(syncher);
		return indices.size();
	}

	SlotIndex getMaxSlots() const {
		return maxSlots;
	}

	/** The free indices, in the order in which tryTake() would return them. */
	vector<SlotIndex> getIndices() const {
		LockGuard l(syncher);
		return vector<SlotIndex>(indices.rbegin(), indices.rend());
	}
};


} // namespace SitePool
} // namespace Testbed

#endif /* _TESTBED_SITE_POOL_SLOT_REGISTRY_H_ */
