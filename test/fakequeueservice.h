#ifndef FAKEQUEUESERVICE_H_INCLUDED
#define FAKEQUEUESERVICE_H_INCLUDED

#include<deque>
#include<map>
#include<set>
#include<string>
#include<vector>
#include"progress.h"
#include"queueservice.h"

struct ReceiveCall{
	std::string address;
	unsigned maxbatch;
	unsigned leaseseconds;
	unsigned waitseconds;
};

/*
in-memory queues keyed by name, the address of a queue is "fake://<name>".
failures are injected through the public fields.
*/
class FakeQueueService: public QueueService{
private:
	std::map<std::string, std::deque<QueueMessage> > queues;
	std::map<std::string, QueueMessage> inflight; // receipt handle -> message
	unsigned idcount, handlecount;
public:
	// fail the n-th call (1-based), 0 = never
	unsigned failreceiveat, failforwardat, faildeleteat;
	// report these ids as failed instead of forwarding them
	std::set<std::string> forwardfailids;
	// drop these ids from the successful list without reporting them failed
	std::set<std::string> forwardsilentids;
	std::set<std::string> deletefailids;
	// return this many extra messages on top of maxbatch, 0 = honor maxbatch
	unsigned oversizebatch;
	// cap on messages per receive, 0 = maxbatch
	unsigned receivelimit;

	std::vector<ReceiveCall> receivecalls;
	std::vector<ForwardEntryVec> forwardcalls;
	std::vector<DeleteEntryVec> deletecalls;

	FakeQueueService();

	void addQueue(const std::string &name);
	// push n messages with bodies "<prefix>0".."<prefix>n-1"
	void fill(const std::string &name, unsigned n, const std::string &prefix = "body-");
	const std::deque<QueueMessage> &getQueue(const std::string &name);
	unsigned inflightCount();

	int resolveAddress(const std::string &name,
	std::string &address, std::string &error);
	int getApproximateCount(const std::string &address,
	unsigned &count, std::string &error);
	int receive(const std::string &address, unsigned maxbatch,
	unsigned leaseseconds, unsigned waitseconds,
	QueueMessageVec &messages, std::string &error);
	int forwardBatch(const std::string &address,
	const ForwardEntryVec &entries, ForwardResult &result, std::string &error);
	int deleteBatch(const std::string &address,
	const DeleteEntryVec &entries, DeleteResult &result, std::string &error);
};

class RecordingProgress: public ProgressReporter{
public:
	std::vector<unsigned> counts;
	std::vector<unsigned> totals;

	void report(unsigned count, unsigned total);
};

#endif
