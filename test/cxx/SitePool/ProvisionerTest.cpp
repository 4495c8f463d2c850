#include <TestSupport.h>
#include <SitePool/Provisioner.h>
#include <SitePool/DummySiteManager.h>
#include <Constants.h>

using namespace Testbed;
using namespace Testbed::SitePool;
using namespace std;

namespace tut {
	struct SitePool_ProvisionerTest {
		DummySiteManagerPtr manager;
		Options options;
		ProvisionerPtr provisioner;

		SitePool_ProvisionerTest() {
			manager = boost::make_shared<DummySiteManager>();
			provisioner = boost::make_shared<Provisioner>(manager, options);
			setLogLevel(LVL_CRIT);
		}

		~SitePool_ProvisionerTest() {
			setLogLevel(defaultLogLevel);
			SystemTime::releaseAll();
		}

		string siteName(SlotIndex index) {
			return options.getSiteName(index);
		}

		vector<string> handles(const char *handle1, const char *handle2 = NULL) {
			vector<string> result;
			result.push_back(handle1);
			if (handle2 != NULL) {
				result.push_back(handle2);
			}
			return result;
		}

		void cleanUp(const ApplicationPtr &app) {
			provisioner->killStaleProcesses(app, "test");
			provisioner->wipeRepository(app, "test");
		}

		string markerFileOf(SlotIndex index) {
			string content;
			if (manager->readWebRootFile(siteName(index), options.markerFileName, content)) {
				return content;
			} else {
				return "(missing)";
			}
		}
	};

	DEFINE_TEST_GROUP(SitePool_ProvisionerTest);

	TEST_METHOD(1) {
		set_test_name("A slot without a site gets a newly created site");
		ApplicationPtr app = provisioner->provision(1);

		ensure_equals(app->getName(), DEFAULT_SITE_PREFIX "1");
		ensure_equals(app->getSlotIndex(), 1u);
		ensure(manager->hasSite(siteName(1)));
		ensure_equals(app->getPrimarySiteBinding(), "http://localhost:8081/");
		ensure_equals(manager->getSiteCalls, 1u);
		ensure_equals(manager->createSiteCalls, 1u);
		ensure(app->getProcessManager() != NULL);
		ensure(app->getRepositoryManager() != NULL);
		ensure(app->getVfsWebRootManager() != NULL);
	}

	TEST_METHOD(2) {
		set_test_name("A newly created site is not cleaned up");
		provisioner->provision(2);
		ensure_equals(manager->killCalls, 0u);
		ensure_equals(manager->deleteRepositoryCalls, 0u);
		ensure_equals(manager->writeCalls, 0u);
		ensure_equals(markerFileOf(2), "(missing)");
	}

	TEST_METHOD(3) {
		set_test_name("An existing site is reused and reset to the marker file");
		manager->addSite(siteName(1));
		manager->addRepositoryFile(siteName(1), "app.js");
		manager->addRepositoryFile(siteName(1), "package.json");
		manager->addWebRootFile(siteName(1), "app.js", "console.log(1)");

		ApplicationPtr app = provisioner->provision(1);
		ensure_equals(app->getSlotIndex(), 1u);
		ensure_equals(manager->createSiteCalls, 0u);
		ensure_equals(manager->deleteRepositoryCalls, 1u);
		ensure_equals(manager->getRepositoryFileCount(siteName(1)), 0u);

		string content;
		ensure("Web root was wiped",
			!manager->readWebRootFile(siteName(1), "app.js", content));
		ensure_equals(markerFileOf(1), DEFAULT_MARKER_CONTENT);
	}

	TEST_METHOD(4) {
		set_test_name("Only worker processes holding the stale module are killed");
		manager->addSite(siteName(1));
		pid_t stale = manager->addProcess(siteName(1), "w3wp",
			handles("C:\\Windows\\System32\\kernel32.dll", "D:\\runtime\\kre.host.dll"));
		pid_t staleUpperCase = manager->addProcess(siteName(1), "W3WP",
			handles("D:\\RUNTIME\\KRE.HOST.DLL"));
		pid_t clean = manager->addProcess(siteName(1), "w3wp",
			handles("C:\\Windows\\System32\\kernel32.dll"));
		pid_t otherName = manager->addProcess(siteName(1), "php-cgi",
			handles("D:\\runtime\\kre.host.dll"));

		provisioner->provision(1);
		ensure("(1)", !manager->isProcessAlive(siteName(1), stale));
		ensure("(2)", !manager->isProcessAlive(siteName(1), staleUpperCase));
		ensure("(3)", manager->isProcessAlive(siteName(1), clean));
		ensure("(4)", manager->isProcessAlive(siteName(1), otherName));
		ensure_equals(manager->killCalls, 2u);
	}

	TEST_METHOD(5) {
		set_test_name("Failing to kill a process does not fail provisioning");
		manager->addSite(siteName(1));
		pid_t stale = manager->addProcess(siteName(1), "w3wp", handles("kre.host.dll"));
		manager->failKillProcess = true;

		provisioner->provision(1);
		ensure_equals(manager->killCalls, 1u);
		ensure(manager->isProcessAlive(siteName(1), stale));
		ensure_equals(markerFileOf(1), DEFAULT_MARKER_CONTENT);
	}

	TEST_METHOD(6) {
		set_test_name("Failing to inspect processes does not fail provisioning");
		manager->addSite(siteName(1));
		manager->addProcess(siteName(1), "w3wp", handles("kre.host.dll"));
		manager->failProcessInspection = true;

		provisioner->provision(1);
		ensure_equals(manager->killCalls, 0u);
		ensure_equals(manager->deleteRepositoryCalls, 1u);
		ensure_equals(markerFileOf(1), DEFAULT_MARKER_CONTENT);
	}

	TEST_METHOD(7) {
		set_test_name("The repository is deleted on a best-effort basis");
		manager->addSite(siteName(1));
		manager->addRepositoryFile(siteName(1), "a");
		manager->addRepositoryFile(siteName(1), "b");
		manager->failDeleteRepository = true;

		provisioner->provision(1);
		ensure_equals(manager->deleteRepositoryCalls, 1u);
		ensure_equals(manager->getRepositoryFileCount(siteName(1)), 1u);
		ensure_equals(markerFileOf(1), DEFAULT_MARKER_CONTENT);
	}

	TEST_METHOD(8) {
		set_test_name("Cleanup steps swallow backend exceptions");
		manager->addSite(siteName(1));
		ApplicationPtr app = provisioner->provision(1);
		manager->removeSite(siteName(1));

		cleanUp(app);
		ensure_equals(manager->deleteRepositoryCalls, 2u);
	}

	TEST_METHOD(9) {
		set_test_name("A 502 on writing the marker file is annotated with the service up time");
		SystemTime::forceMsec(1000000);
		manager->addSite(siteName(1));
		SystemTime::forceMsec(1000000 + 3723000);
		manager->writeFailures = 1;

		try {
			provisioner->provision(1);
			fail("HttpRequestException expected");
		} catch (const HttpRequestException &e) {
			ensure_equals(e.getStatus(), 502);
			ensure_equals(string(e.what()),
				"Response status code does not indicate success: 502 (Bad Gateway)."
				" Up Time: 1h 2m 3s");
		}
		ensure_equals(manager->upTimeCalls, 1u);
	}

	TEST_METHOD(10) {
		set_test_name("A 502 is rethrown unchanged if the up time is empty");
		manager->addSite(siteName(1));
		manager->writeFailures = 1;
		manager->emptyUpTime = true;

		try {
			provisioner->provision(1);
			fail("HttpRequestException expected");
		} catch (const HttpRequestException &e) {
			ensure_equals(e.getStatus(), 502);
			ensure_equals(string(e.what()),
				"Response status code does not indicate success: 502 (Bad Gateway).");
		}
	}

	TEST_METHOD(11) {
		set_test_name("A 502 is rethrown unchanged if the up time cannot be obtained");
		manager->addSite(siteName(1));
		manager->writeFailures = 1;
		manager->failUpTime = true;

		try {
			provisioner->provision(1);
			fail("HttpRequestException expected");
		} catch (const HttpRequestException &e) {
			ensure_equals(e.getStatus(), 502);
			ensure_equals(string(e.what()),
				"Response status code does not indicate success: 502 (Bad Gateway).");
		}
		ensure_equals(manager->upTimeCalls, 1u);
	}

	TEST_METHOD(12) {
		set_test_name("Other HTTP errors are not annotated");
		manager->addSite(siteName(1));
		manager->writeFailures = 1;
		manager->writeFailureStatus = 500;

		try {
			provisioner->provision(1);
			fail("HttpRequestException expected");
		} catch (const HttpRequestException &e) {
			ensure_equals(e.getStatus(), 500);
			ensure_equals(string(e.what()),
				"Response status code does not indicate success: 500 (Error).");
		}
		ensure_equals(manager->upTimeCalls, 0u);
	}

	TEST_METHOD(13) {
		set_test_name("Site backend failures propagate");
		manager->failGetSite = true;
		try {
			provisioner->provision(3);
			fail("ProvisioningException expected");
		} catch (const ProvisioningException &e) {
			ensure_equals(e.getSiteName(), siteName(3));
		}

		manager->failGetSite = false;
		manager->failCreateSite = true;
		try {
			provisioner->provision(3);
			fail("ProvisioningException expected");
		} catch (const ProvisioningException &e) {
			ensure_equals(e.getSiteName(), siteName(3));
		}
		ensure(!manager->hasSite(siteName(3)));
	}

	TEST_METHOD(14) {
		set_test_name("Provisioning the same slot twice creates the site once and reuses it afterwards");
		ApplicationPtr app1 = provisioner->provision(4);
		ApplicationPtr app2 = provisioner->provision(4);
		ensure_equals(manager->createSiteCalls, 1u);
		ensure_equals(manager->getSiteCalls, 2u);
		ensure(app1 != app2);
		ensure(app2->getSite() == app1->getSite());
		ensure_equals(markerFileOf(4), DEFAULT_MARKER_CONTENT);
	}

	TEST_METHOD(15) {
		set_test_name("The marker file name and content are configurable");
		options.markerFileName = "index.html";
		options.markerContent = "ready";
		provisioner = boost::make_shared<Provisioner>(manager, options);
		manager->addSite(siteName(1));

		provisioner->provision(1);
		ensure_equals(markerFileOf(1), "ready");
	}

	TEST_METHOD(16) {
		set_test_name("Application::getUpTime() asks the site backend");
		SystemTime::forceMsec(50000);
		ApplicationPtr app = provisioner->provision(1);
		SystemTime::forceMsec(50000 + 59000);
		ensure_equals(app->getUpTime(), "59s");
		SystemTime::forceMsec(50000 + 61000);
		ensure_equals(app->getUpTime(), "1m 1s");
	}

	TEST_METHOD(17) {
		set_test_name("A worker process that cannot be inspected does not spare the other stale ones");
		manager->addSite(siteName(1));
		pid_t vanishing = manager->addProcess(siteName(1), "w3wp", handles("kre.host.dll"));
		pid_t stale = manager->addProcess(siteName(1), "w3wp", handles("kre.host.dll"));
		manager->exitProcessOnInspection(siteName(1), vanishing);

		provisioner->provision(1);
		ensure("(1)", !manager->isProcessAlive(siteName(1), vanishing));
		ensure("(2)", !manager->isProcessAlive(siteName(1), stale));
		ensure_equals("Only the inspectable process is killed", manager->killCalls, 1u);
		ensure_equals(markerFileOf(1), DEFAULT_MARKER_CONTENT);
	}
}
