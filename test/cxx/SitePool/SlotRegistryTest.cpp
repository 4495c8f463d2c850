#include <TestSupport.h>
#include <SitePool/SlotRegistry.h>
#include <set>

using namespace Testbed;
using namespace Testbed::SitePool;
using namespace std;

namespace tut {
	struct SitePool_SlotRegistryTest {
		set<SlotIndex> taken;
		boost::mutex takenSyncher;
		AtomicInt duplicates;

		void takeAndGiveBack(SlotRegistry *registry, unsigned int rounds) {
			for (unsigned int i = 0; i < rounds; i++) {
				SlotIndex index;
				if (!registry->tryTake(index)) {
					boost::this_thread::yield();
					continue;
				}
				{
					boost::lock_guard<boost::mutex> l(takenSyncher);
					if (!taken.insert(index).second) {
						duplicates++;
					}
				}
				boost::this_thread::yield();
				{
					boost::lock_guard<boost::mutex> l(takenSyncher);
					taken.erase(index);
				}
				registry->giveBack(index);
			}
		}
	};

	DEFINE_TEST_GROUP(SitePool_SlotRegistryTest);

	TEST_METHOD(1) {
		set_test_name("A new registry hands out 1 up to maxSlots in ascending order");
		SlotRegistry registry(5);
		SlotIndex index = 0;

		ensure_equals(registry.count(), 5u);
		for (SlotIndex i = 1; i <= 5; i++) {
			ensure(registry.tryTake(index));
			ensure_equals(index, i);
		}
		ensure_equals(registry.count(), 0u);
	}

	TEST_METHOD(2) {
		set_test_name("tryTake() on an empty registry returns false and leaves the index alone");
		SlotRegistry registry(1);
		SlotIndex index = 0;

		ensure(registry.tryTake(index));
		index = 42;
		ensure(!registry.tryTake(index));
		ensure_equals(index, 42u);
	}

	TEST_METHOD(3) {
		set_test_name("The most recently returned index is taken first");
		SlotRegistry registry(3);
		SlotIndex a, b, c;

		registry.tryTake(a);
		registry.tryTake(b);
		registry.giveBack(a);
		ensure(registry.tryTake(c));
		ensure_equals(c, a);
		ensure(registry.tryTake(c));
		ensure_equals(c, 3u);
	}

	TEST_METHOD(4) {
		set_test_name("getIndices() lists the free indices in take order");
		SlotRegistry registry(4);
		SlotIndex index;
		vector<SlotIndex> indices;

		registry.tryTake(index);
		registry.tryTake(index);
		registry.giveBack(1);
		indices = registry.getIndices();
		ensure_equals(indices.size(), 3u);
		ensure_equals(indices[0], 1u);
		ensure_equals(indices[1], 3u);
		ensure_equals(indices[2], 4u);
	}

	TEST_METHOD(5) {
		set_test_name("giveBack() rejects out-of-range indices");
		SlotRegistry registry(3);
		try {
			registry.giveBack(0);
			fail("ArgumentException expected");
		} catch (const ArgumentException &) {
			// Pass.
		}
		try {
			registry.giveBack(4);
			fail("ArgumentException expected");
		} catch (const ArgumentException &) {
			// Pass.
		}
		ensure_equals(registry.count(), 3u);
	}

	TEST_METHOD(6) {
		set_test_name("An index is never held by two threads at the same time");
		SlotRegistry registry(3);
		boost::thread_group threads;
		for (int i = 0; i < 4; i++) {
			threads.create_thread(boost::bind(&SitePool_SlotRegistryTest::takeAndGiveBack,
				this, &registry, 2000));
		}
		threads.join_all();
		ensure_equals(duplicates.get(), 0);
		ensure_equals(registry.count(), 3u);
	}
}
