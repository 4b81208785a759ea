#ifndef QUEUESERVICE_H_INCLUDED
#define QUEUESERVICE_H_INCLUDED

#include<string>
#include<vector>

// return values of QueueService operations
#define QUEUE_OK            (0)
#define QUEUE_NOT_FOUND     (-1)
#define QUEUE_SERVICE_ERROR (-2)

struct QueueMessage{
	std::string messageid;
	std::string receipthandle; // valid until the lease expires
	std::string body;
};
typedef std::vector<QueueMessage> QueueMessageVec;

struct ForwardEntry{
	std::string id;
	std::string body;
};
typedef std::vector<ForwardEntry> ForwardEntryVec;

struct DeleteEntry{
	std::string id;
	std::string receipthandle;
};
typedef std::vector<DeleteEntry> DeleteEntryVec;

struct EntryFailure{
	std::string id;
	std::string reason;
};
typedef std::vector<EntryFailure> EntryFailureVec;

struct ForwardResult{
	std::vector<std::string> successful;
	EntryFailureVec failed;
};

struct DeleteResult{
	EntryFailureVec failed;
};

std::string entryFailuresToString(const EntryFailureVec &failed);

class QueueService{
public:
	virtual ~QueueService();

	virtual int resolveAddress(const std::string &name,
	std::string &address, std::string &error) = 0;

	virtual int getApproximateCount(const std::string &address,
	unsigned &count, std::string &error) = 0;

	// waitseconds applies to the first message only
	virtual int receive(const std::string &address, unsigned maxbatch,
	unsigned leaseseconds, unsigned waitseconds,
	QueueMessageVec &messages, std::string &error) = 0;

	// per-entry outcomes go to result; a non-zero return means
	// the whole call failed and result is meaningless
	virtual int forwardBatch(const std::string &address,
	const ForwardEntryVec &entries, ForwardResult &result, std::string &error) = 0;

	virtual int deleteBatch(const std::string &address,
	const DeleteEntryVec &entries, DeleteResult &result, std::string &error) = 0;
};

#endif
