#ifndef QPIDQUEUESERVICE_H_INCLUDED
#define QPIDQUEUESERVICE_H_INCLUDED

#include<map>
#include<string>
#include<qpid/messaging/Connection.h>
#include<qpid/messaging/Message.h>
#include<qpid/messaging/Receiver.h>
#include<qpid/messaging/Sender.h>
#include<qpid/messaging/Session.h>
#include"brokeraddress.h"
#include"leasetable.h"
#include"queueservice.h"

/*
QueueService on a qpid broker.
received messages stay unacknowledged (leased) until deleteBatch
acknowledges them or their lease runs out and they are released.
*/
class QpidQueueService: public QueueService{
private:
	BrokerAddress broker;
	qpid::messaging::Connection *connection;
	qpid::messaging::Session session;
	std::map<std::string, qpid::messaging::Receiver> receivers;
	std::map<std::string, qpid::messaging::Sender> senders;
	std::map<std::string, std::string> queuenames; // address -> name
	LeaseTable leases;
	std::map<std::string, qpid::messaging::Message> pending; // receipt handle -> message

	int getReceiver(const std::string &address,
	qpid::messaging::Receiver &receiver, std::string &error);
	int getSender(const std::string &address,
	qpid::messaging::Sender &sender, std::string &error);
	void release(const std::string &handle);
	void releaseExpired();
public:
	QpidQueueService(const BrokerAddress &ba);
	~QpidQueueService();

	// return 0 if connected, -1 if error
	int open(std::string &error);
	void close();

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

#endif
