#include<cstdio>
#include"leasetable.h"

using namespace std;

static string ulltos(unsigned long long u){
	char s[32];
	sprintf(s, "%llu", u);
	return (string)s;
}

LeaseTable::LeaseTable(){
	this->handlecount = 0;
	this->idcount = 0;
}

string LeaseTable::add(double now, unsigned leaseseconds){
	this->handlecount++;
	string handle = "rh-" + ulltos(this->handlecount);
	this->leases[handle] = now + leaseseconds;
	return handle;
}

int LeaseTable::take(const string &handle, double now){
	map<string, double>::iterator i = this->leases.find(handle);
	if(i == this->leases.end())
		return LEASE_UNKNOWN;
	double leaseend = i->second;
	this->leases.erase(i);
	return leaseend > now? LEASE_ACTIVE: LEASE_EXPIRED;
}

vector<string> LeaseTable::takeExpired(double now){
	vector<string> expired;
	map<string, double>::iterator i = this->leases.begin();
	while(i != this->leases.end()){
		if(i->second > now){
			i++;
			continue;
		}
		expired.push_back(i->first);
		this->leases.erase(i++);
	}
	return expired;
}

unsigned LeaseTable::size() const{
	return this->leases.size();
}

void LeaseTable::clear(){
	this->leases.clear();
}

string LeaseTable::assignMessageId(const string &id, set<string> &ids){
	string r = id;
	// a producer may have set an id that looks generated
	while(r.empty() || ids.count(r) != 0){
		this->idcount++;
		r = "msg-" + ulltos(this->idcount);
	}
	ids.insert(r);
	return r;
}
