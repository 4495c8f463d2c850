#include <TestSupport.h>
#include <tut/tut_reporter.hpp>
#include <oxt/initialize.hpp>
#include <oxt/system_calls.hpp>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>

#include <Constants.h>
#include <Logging.h>
#include <Utils/StrIntUtils.h>
#include <Utils/VariantMap.h>

extern char **environ;

using namespace std;
using namespace Testbed;
using namespace TestSupport;

namespace tut {
	test_runner_singleton runner;
}

typedef tut::groupnames::const_iterator groupnames_iterator;

/** All available groups. */
static tut::groupnames allGroups;

/** Whether the user wants to run all test groups, or only the specified test groups. */
enum RunMode { RUN_ALL_GROUPS, RUN_SPECIFIED_GROUPS };
static RunMode runMode = RUN_ALL_GROUPS;

/** The test groups that the user wants to run. Only meaningful if runMode == RUN_SPECIFIED_GROUPS. */
static vector<string> groupsToRun;


static void
usage(int exitCode) {
	printf("Usage: ./TestbedTests [options]\n");
	printf("Runs the Testbed unit tests.\n\n");
	printf("Options:\n");
	printf("  -g GROUP_NAME   Instead of running all unit tests, only run the test group\n");
	printf("                  named GROUP_NAME. You can specify -g multiple times, which\n");
	printf("                  will result in only the specified test groups being run.\n\n");
	printf("                  Available test groups:\n\n");
	for (groupnames_iterator it = allGroups.begin(); it != allGroups.end(); it++) {
		printf("                    %s\n", it->c_str());
	}
	printf("\n");
	printf("  -h              Print this usage information.\n\n");
	printf("Environment:\n");
	printf("  %sLOG_LEVEL  Log level during the tests (default: %d).\n",
		TESTBED_ENV_PREFIX, DEFAULT_LOG_LEVEL);
	printf("  %sLOG_FILE   Write log entries to this file instead of stderr.\n",
		TESTBED_ENV_PREFIX);
	exit(exitCode);
}

static bool
groupExists(const string &name) {
	for (groupnames_iterator it = allGroups.begin(); it != allGroups.end(); it++) {
		if (name == *it) {
			return true;
		}
	}
	return false;
}

static void
parseOptions(int argc, char *argv[]) {
	for (int i = 1; i < argc; i++) {
		if (strcmp(argv[i], "-h") == 0) {
			usage(0);
		} else if (strcmp(argv[i], "-g") == 0) {
			if (argv[i + 1] == NULL) {
				fprintf(stderr, "*** ERROR: A -g option must be followed by a test group name.\n");
				exit(1);
			} else if (!groupExists(argv[i + 1])) {
				fprintf(stderr,
					"*** ERROR: Invalid test group '%s'. Available test groups are:\n\n",
					argv[i + 1]);
				for (groupnames_iterator it = allGroups.begin(); it != allGroups.end(); it++) {
					printf("%s\n", it->c_str());
				}
				exit(1);
			} else {
				runMode = RUN_SPECIFIED_GROUPS;
				groupsToRun.push_back(argv[i + 1]);
				i++;
			}
		} else {
			fprintf(stderr, "*** ERROR: Unknown option: %s\n", argv[i]);
			fprintf(stderr, "Please pass -h for a list of valid options.\n");
			exit(1);
		}
	}
}

static void
setupLogging() {
	VariantMap env;
	env.readFromEnvironment(environ, TESTBED_ENV_PREFIX);
	defaultLogLevel = env.getInt("log_level", false, DEFAULT_LOG_LEVEL);
	setLogLevel(defaultLogLevel);

	string logFile = env.get("log_file", false);
	if (!logFile.empty() && !setLogFile(logFile.c_str())) {
		int e = errno;
		fprintf(stderr, "*** ERROR: cannot open log file %s: %s (errno=%d)\n",
			logFile.c_str(), strerror(e), e);
		exit(1);
	} else if (!logFile.empty()) {
		printf("Writing log entries to %s\n", getLogFile().c_str());
	}
}

int
main(int argc, char *argv[]) {
	tut::reporter reporter;
	tut::runner.get().set_callback(&reporter);
	allGroups = tut::runner.get().list_groups();
	parseOptions(argc, argv);

	oxt::initialize();
	oxt::setup_syscall_interruption_support();
	setupLogging();

	bool all_ok = true;
	if (runMode == RUN_ALL_GROUPS) {
		tut::runner.get().run_tests();
		all_ok = reporter.all_ok();
	} else {
		vector<string>::const_iterator it;
		for (it = groupsToRun.begin(); it != groupsToRun.end(); it++) {
			try {
				tut::runner.get().run_tests(*it);
			} catch (const tut::no_such_group &) {
				fprintf(stderr, "ERROR: test group '%s' not found.\n", it->c_str());
				all_ok = false;
			}
			all_ok = all_ok && reporter.all_ok();
		}
	}

	if (all_ok) {
		return 0;
	} else {
		return 1;
	}
}
