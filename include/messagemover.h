#ifndef MESSAGEMOVER_H_INCLUDED
#define MESSAGEMOVER_H_INCLUDED

#include<string>
#include"moverconfig.h"
#include"progress.h"
#include"queueservice.h"

enum TransferState{
	DRAINING = 4444,
	EMPTY,  // source drained
	FAILED
};

enum TransferFailure{
	NO_FAILURE = 5555,
	RECEIVE_FAILURE,
	FORWARD_FAILURE,
	PARTIAL_FORWARD_FAILURE,
	DELETE_FAILURE,
	PARTIAL_DELETE_FAILURE
};

const char *transferStateToString(enum TransferState s);
const char *transferFailureToString(enum TransferFailure f);

struct MoveResult{
	unsigned moved; // forwarded and deleted
	unsigned total; // display total at the end
	enum TransferState state;
	enum TransferFailure failure;
	std::string error;

	MoveResult();
};

class MessageMover{
private:
	QueueService &service;
	ProgressReporter &reporter;
	const MoverConfig config;
	enum TransferState state;

	int fail(MoveResult &result, enum TransferFailure f, std::string error);
	// return 0 if the batch was forwarded and deleted, -1 if failed
	int moveBatch(const std::string &srcaddress, const std::string &dstaddress,
	const QueueMessageVec &batch, MoveResult &result);
public:
	MessageMover(QueueService &s, ProgressReporter &r, const MoverConfig &c);

	// return 0 if the source was drained, -1 if the transfer failed
	int move(const std::string &srcaddress, const std::string &dstaddress,
	unsigned approximatetotal, MoveResult &result);
	enum TransferState getState() const;
};

#endif
