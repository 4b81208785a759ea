#include<cstdio>
#include<set>
#include"batchtranslator.h"
#include"common.h"
#include"messagemover.h"
#include"timestamp.h"

using namespace std;

static string utos(unsigned u){
	char s[16];
	sprintf(s, "%u", u);
	return (string)s;
}

struct TransferStateString{
	enum TransferState t;
	const char *s;
}statestring[]={
	{DRAINING, "draining"},
	{EMPTY, "empty"},
	{FAILED, "failed"}
};

struct TransferFailureString{
	enum TransferFailure f;
	const char *s;
}failurestring[]={
	{NO_FAILURE, "none"},
	{RECEIVE_FAILURE, "receive failure"},
	{FORWARD_FAILURE, "forward failure"},
	{PARTIAL_FORWARD_FAILURE, "partial forward failure"},
	{DELETE_FAILURE, "delete failure"},
	{PARTIAL_DELETE_FAILURE, "partial delete failure"}
};

const char *transferStateToString(enum TransferState s){
	for(unsigned a = 0; a < sizeof(statestring) / sizeof(statestring[0]); a++){
		if(statestring[a].t == s)
			return statestring[a].s;
	}
	return "";
}

const char *transferFailureToString(enum TransferFailure f){
	for(unsigned a = 0; a < sizeof(failurestring) / sizeof(failurestring[0]); a++){
		if(failurestring[a].f == f)
			return failurestring[a].s;
	}
	return "";
}

MoveResult::MoveResult(){
	moved = 0;
	total = 0;
	state = DRAINING;
	failure = NO_FAILURE;
}

MessageMover::MessageMover(QueueService &s, ProgressReporter &r, const MoverConfig &c):
service(s), reporter(r), config(c){
	this->state = DRAINING;
}

enum TransferState MessageMover::getState() const{
	return this->state;
}

int MessageMover::fail(MoveResult &result, enum TransferFailure f, string error){
	this->state = FAILED;
	result.state = FAILED;
	result.failure = f;
	result.error = error;
	logError(error);
	return -1;
}

int MessageMover::moveBatch(const string &srcaddress, const string &dstaddress,
const QueueMessageVec &batch, MoveResult &result){
	string error;

	ForwardResult forwarded;
	if(this->service.forwardBatch(dstaddress, toForwardEntries(batch), forwarded, error) != QUEUE_OK)
		return this->fail(result, FORWARD_FAILURE,
		"Failed to enqueue messages to the destination. Error: " + error);

	if(forwarded.failed.size() > 0)
		return this->fail(result, PARTIAL_FORWARD_FAILURE,
		utos(forwarded.failed.size()) + " messages failed to enqueue, exiting: " +
		entryFailuresToString(forwarded.failed));

	// only messages the destination confirmed may be deleted
	set<string> confirmed(forwarded.successful.begin(), forwarded.successful.end());
	QueueMessageVec deletable;
	for(QueueMessageVec::const_iterator i = batch.begin(); i != batch.end(); i++){
		if(confirmed.count(i->messageid) != 0)
			deletable.push_back(*i);
	}
	if(deletable.size() != batch.size())
		return this->fail(result, PARTIAL_FORWARD_FAILURE,
		"destination confirmed " + utos(deletable.size()) + " of " +
		utos(batch.size()) + " messages, exiting");

	DeleteResult deleted;
	if(this->service.deleteBatch(srcaddress, toDeleteEntries(deletable), deleted, error) != QUEUE_OK)
		return this->fail(result, DELETE_FAILURE,
		"Failed to delete messages from source queue. Error: " + error);

	if(deleted.failed.size() > 0)
		return this->fail(result, PARTIAL_DELETE_FAILURE,
		"Error deleting messages, the following were not deleted: " +
		entryFailuresToString(deleted.failed));
	return 0;
}

int MessageMover::move(const string &srcaddress, const string &dstaddress,
unsigned approximatetotal, MoveResult &result){
	TransferProgress progress(approximatetotal);

	this->state = DRAINING;
	result = MoveResult();
	result.total = progress.getTotal();

	while(1){
		QueueMessageVec batch;
		string error;
		int r = this->service.receive(srcaddress, MAX_BATCH_SIZE,
		this->config.leaseseconds, DEFAULT_WAIT_SECONDS, batch, error);
		if(r != QUEUE_OK)
			return this->fail(result, RECEIVE_FAILURE,
			"Failed to receive messages. Error: " + error);

		if(batch.size() == 0){
			this->state = EMPTY;
			result.state = EMPTY;
			return 0;
		}
		if(batch.size() > MAX_BATCH_SIZE)
			return this->fail(result, RECEIVE_FAILURE,
			"Failed to receive messages. Error: got " + utos(batch.size()) +
			" messages, limit is " + utos(MAX_BATCH_SIZE));

		if(this->moveBatch(srcaddress, dstaddress, batch, result) != 0)
			return -1;

		progress.addMoved(batch.size());
		result.moved = progress.getMoved();
		result.total = progress.getTotal();
		this->reporter.report(result.moved, result.total);
	}
}
