#include<cstdio>
#include<iostream>
#include"messagemover.h"
#include"moverconfig.h"
#include"progress.h"
#include"qpidqueueservice.h"
#include"timestamp.h"

using namespace std;

#define EXIT_MOVE_FAILED (1)
#define EXIT_USAGE       (2)

static string utos(unsigned u){
	char s[16];
	sprintf(s, "%u", u);
	return (string)s;
}

static int resolveQueue(QpidQueueService &service, const char *which,
const string &name, string &address){
	string error;
	int r = service.resolveAddress(name, address, error);
	if(r == QUEUE_NOT_FOUND){
		logError(string("Failed to resolve ") + which + " queue " + name +
		". Error: queue does not exist (" + error + ")");
		return -1;
	}
	if(r != QUEUE_OK){
		logError(string("Failed to resolve ") + which + " queue " + name + ". Error: " + error);
		return -1;
	}
	logInfo(string(which) + " queue address: " + address);
	return 0;
}

int main(int argc, char *argv[]){
	MoverConfig config;
	string error;

	int r = readMoverArgument(argc, argv, config, error);
	if(r == 1){
		cout << moverUsage(argv[0]);
		return 0;
	}
	if(r != 0){
		cerr << "error: " << error << "\n\n" << moverUsage(argv[0]);
		return EXIT_USAGE;
	}

	setLogName("queuemover");
	if(!config.logfile.empty() && setLogFile(config.logfile.c_str()) != 0)
		return EXIT_USAGE;

	BrokerAddress ba;
	if(ba.parse(config.brokerurl) != 0){
		cerr << "error: invalid broker '" << config.brokerurl << "'\n";
		return EXIT_USAGE;
	}
	QpidQueueService service(ba);
	if(service.open(error) != 0){
		logError("Unable to connect to broker " + ba.getAddress() + ". Error: " + error);
		closeLogFile();
		return EXIT_MOVE_FAILED;
	}

	string srcaddress, dstaddress;
	if(resolveQueue(service, "source", config.source, srcaddress) != 0 ||
	resolveQueue(service, "destination", config.destination, dstaddress) != 0){
		closeLogFile();
		return EXIT_MOVE_FAILED;
	}

	unsigned count = 0;
	if(service.getApproximateCount(srcaddress, count, error) != QUEUE_OK){
		logError("Unable to read the approximate number of messages, progress will be rescaled as messages move. Error: " + error);
		count = 0;
	}
	logInfo("Approximate number of messages in the source queue: " + utos(count));

	// the count is only a hint, an empty-looking queue is still drained
	logInfo("Starting to move messages...");
	cout << endl;

	SilentProgress silent;
	ProgressBar bar(cout);
	ProgressReporter *reporter = &bar;
	if(config.quiet)
		reporter = &silent;

	MessageMover mover(service, *reporter, config);
	MoveResult result;
	r = mover.move(srcaddress, dstaddress, count, result);
	bar.finish();

	if(r != 0){
		logError("Transfer stopped (" + string(transferFailureToString(result.failure)) +
		") after moving " + utos(result.moved) + " messages: " + result.error);
		closeLogFile();
		return EXIT_MOVE_FAILED;
	}
	logInfo("Done. Moved " + utos(result.moved) + " messages");
	closeLogFile();
	return 0;
}
