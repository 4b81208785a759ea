#include"queueservice.h"

using namespace std;

QueueService::~QueueService(){
}

string entryFailuresToString(const EntryFailureVec &failed){
	string r;
	for(EntryFailureVec::const_iterator i = failed.begin(); i != failed.end(); i++){
		if(!r.empty())
			r += ", ";
		r += i->id + " (" + i->reason + ")";
	}
	return r;
}
