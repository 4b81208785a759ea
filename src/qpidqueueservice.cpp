#include<set>
#include<vector>
#include<qpid/client/ConnectionSettings.h>
#include<qpid/console/SessionManager.h>
#include<qpid/messaging/Duration.h>
#include<qpid/messaging/exceptions.h>
#include"qpidqueueservice.h"
#include"timestamp.h"

using namespace std;
using namespace qpid::messaging;

// queues are never created implicitly, a missing queue is a NotFound
static string queueNameToAddress(const string &name){
	return name + "; {create:never}";
}

QpidQueueService::QpidQueueService(const BrokerAddress &ba): broker(ba){
	this->connection = NULL;
}

QpidQueueService::~QpidQueueService(){
	this->close();
}

int QpidQueueService::open(string &error){
	this->close();
	try{
		this->connection = new Connection(this->broker.getAddress());
		this->connection->open();
		this->session = this->connection->createSession();
	} catch(const std::exception &e){
		error = e.what();
		delete this->connection;
		this->connection = NULL;
		return -1;
	}
	return 0;
}

void QpidQueueService::close(){
	if(this->connection == NULL)
		return;
	// unacknowledged messages go back to their queue when the session ends
	try{
		if(this->connection->isOpen())
			this->connection->close();
	} catch(const std::exception &e){
		logError(string("closing broker connection: ") + e.what());
	}
	delete this->connection;
	this->connection = NULL;
	this->receivers.clear();
	this->senders.clear();
	this->pending.clear();
	this->leases.clear();
}

int QpidQueueService::getReceiver(const string &address, Receiver &receiver, string &error){
	map<string, Receiver>::iterator i = this->receivers.find(address);
	if(i != this->receivers.end()){
		receiver = i->second;
		return QUEUE_OK;
	}
	if(this->connection == NULL){
		error = "not connected";
		return QUEUE_SERVICE_ERROR;
	}
	try{
		receiver = this->session.createReceiver(address);
	} catch(const NotFound &e){
		error = e.what();
		return QUEUE_NOT_FOUND;
	} catch(const std::exception &e){
		error = e.what();
		return QUEUE_SERVICE_ERROR;
	}
	this->receivers[address] = receiver;
	return QUEUE_OK;
}

int QpidQueueService::getSender(const string &address, Sender &sender, string &error){
	map<string, Sender>::iterator i = this->senders.find(address);
	if(i != this->senders.end()){
		sender = i->second;
		return QUEUE_OK;
	}
	if(this->connection == NULL){
		error = "not connected";
		return QUEUE_SERVICE_ERROR;
	}
	try{
		sender = this->session.createSender(address);
	} catch(const NotFound &e){
		error = e.what();
		return QUEUE_NOT_FOUND;
	} catch(const std::exception &e){
		error = e.what();
		return QUEUE_SERVICE_ERROR;
	}
	this->senders[address] = sender;
	return QUEUE_OK;
}

// hand a leased message back to its queue
void QpidQueueService::release(const string &handle){
	map<string, Message>::iterator i = this->pending.find(handle);
	if(i == this->pending.end())
		return;
	try{
		this->session.release(i->second);
	} catch(const std::exception &e){
		logError("releasing " + handle + ": " + e.what());
	}
	this->pending.erase(i);
}

void QpidQueueService::releaseExpired(){
	vector<string> expired = this->leases.takeExpired(getSecond());
	for(unsigned i = 0; i < expired.size(); i++)
		this->release(expired[i]);
}

int QpidQueueService::resolveAddress(const string &name, string &address, string &error){
	string a = queueNameToAddress(name);
	// a sender resolves the queue without subscribing to it,
	// the receiver is created by the first receive
	Sender sender;
	int r = this->getSender(a, sender, error);
	if(r != QUEUE_OK)
		return r;
	this->queuenames[a] = name;
	address = a;
	return QUEUE_OK;
}

int QpidQueueService::getApproximateCount(const string &address, unsigned &count, string &error){
	map<string, string>::iterator n = this->queuenames.find(address);
	if(n == this->queuenames.end()){
		error = "address " + address + " was not resolved";
		return QUEUE_SERVICE_ERROR;
	}

	try{
		qpid::console::SessionManager::Settings smsettings;
		smsettings.rcvObjects = false;
		smsettings.rcvEvents = false;
		smsettings.rcvHeartbeats = false;
		qpid::console::SessionManager sm(NULL, smsettings);

		qpid::client::ConnectionSettings settings;
		settings.host = this->broker.host;
		settings.port = this->broker.port;
		qpid::console::Broker *b = sm.addBroker(settings);
		b->waitForStable();

		qpid::console::Object::Vector objvec;
		sm.getObjects(objvec, "queue", b);
		for(unsigned i = 0; i != objvec.size(); i++){
			if(objvec[i].attrString("name").compare(n->second) != 0)
				continue;
			count = (unsigned)objvec[i].attrUint64("msgDepth");
			sm.delBroker(b);
			return QUEUE_OK;
		}
		sm.delBroker(b);
	} catch(const std::exception &e){
		error = e.what();
		return QUEUE_SERVICE_ERROR;
	}
	error = "queue " + n->second + " not found in broker statistics";
	return QUEUE_SERVICE_ERROR;
}

int QpidQueueService::receive(const string &address, unsigned maxbatch,
unsigned leaseseconds, unsigned waitseconds,
QueueMessageVec &messages, string &error){
	Receiver receiver;
	int r = this->getReceiver(address, receiver, error);
	if(r != QUEUE_OK)
		return QUEUE_SERVICE_ERROR;

	this->releaseExpired();
	messages.clear();
	set<string> ids;
	try{
		for(unsigned i = 0; i < maxbatch; i++){
			Message msg;
			Duration timeout = (i == 0? Duration::SECOND * waitseconds: Duration::IMMEDIATE);
			if(receiver.fetch(msg, timeout) == false)
				break;

			QueueMessage qm;
			qm.receipthandle = this->leases.add(getSecond(), leaseseconds);
			// batch entry ids must be unique
			qm.messageid = this->leases.assignMessageId(msg.getMessageId(), ids);
			qm.body = msg.getContent();
			this->pending[qm.receipthandle] = msg;
			messages.push_back(qm);
		}
	} catch(const std::exception &e){
		error = e.what();
		return QUEUE_SERVICE_ERROR;
	}
	return QUEUE_OK;
}

int QpidQueueService::forwardBatch(const string &address,
const ForwardEntryVec &entries, ForwardResult &result, string &error){
	Sender sender;
	if(this->getSender(address, sender, error) != QUEUE_OK)
		return QUEUE_SERVICE_ERROR;

	result.successful.clear();
	result.failed.clear();
	for(ForwardEntryVec::const_iterator i = entries.begin(); i != entries.end(); i++){
		try{
			Message msg(i->body);
			sender.send(msg, true);
			result.successful.push_back(i->id);
		} catch(const std::exception &e){
			EntryFailure f;
			f.id = i->id;
			f.reason = e.what();
			result.failed.push_back(f);
		}
	}
	return QUEUE_OK;
}

int QpidQueueService::deleteBatch(const string &address,
const DeleteEntryVec &entries, DeleteResult &result, string &error){
	if(this->connection == NULL){
		error = "not connected";
		return QUEUE_SERVICE_ERROR;
	}

	result.failed.clear();
	double now = getSecond();
	for(DeleteEntryVec::const_iterator i = entries.begin(); i != entries.end(); i++){
		EntryFailure f;
		f.id = i->id;
		int lease = this->leases.take(i->receipthandle, now);
		map<string, Message>::iterator p = this->pending.find(i->receipthandle);
		if(lease == LEASE_UNKNOWN || p == this->pending.end()){
			f.reason = "receipt handle " + i->receipthandle + " is not valid";
			result.failed.push_back(f);
			if(p != this->pending.end())
				this->release(i->receipthandle);
			continue;
		}
		if(lease == LEASE_EXPIRED){
			f.reason = "receipt handle " + i->receipthandle + " has expired";
			result.failed.push_back(f);
			this->release(i->receipthandle);
			continue;
		}
		try{
			this->session.acknowledge(p->second, true);
		} catch(const std::exception &e){
			f.reason = e.what();
			result.failed.push_back(f);
		}
		this->pending.erase(p);
	}
	return QUEUE_OK;
}
