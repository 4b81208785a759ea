#include"batchtranslator.h"

ForwardEntryVec toForwardEntries(const QueueMessageVec &messages){
	ForwardEntryVec result(messages.size());
	for(unsigned i = 0; i < messages.size(); i++){
		result[i].id = messages[i].messageid;
		result[i].body = messages[i].body;
	}
	return result;
}

DeleteEntryVec toDeleteEntries(const QueueMessageVec &messages){
	DeleteEntryVec result(messages.size());
	for(unsigned i = 0; i < messages.size(); i++){
		result[i].id = messages[i].messageid;
		result[i].receipthandle = messages[i].receipthandle;
	}
	return result;
}
