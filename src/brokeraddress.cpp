#include<cstdio>
#include"common.h"
#include"brokeraddress.h"

using namespace std;

int urlToIPPort(const string &url, string &host, unsigned &port){
	size_t colon = url.rfind(':');
	if(colon == string::npos){
		if(url.empty())
			return -1;
		host = url;
		port = DEFAULT_BROKER_PORT;
		return 0;
	}
	if(colon == 0 || colon + 1 == url.length())
		return -1;

	unsigned p = 0;
	for(size_t i = colon + 1; i < url.length(); i++){
		if(url[i] < '0' || url[i] > '9')
			return -1;
		p = p * 10 + (url[i] - '0');
		if(p > 65535)
			return -1;
	}
	if(p == 0)
		return -1;
	host = url.substr(0, colon);
	port = p;
	return 0;
}

string IPPortToUrl(const string &host, unsigned port){
	char s[16];
	sprintf(s, ":%u", port);
	return host + s;
}

BrokerAddress::BrokerAddress(){
	this->host = "localhost";
	this->port = DEFAULT_BROKER_PORT;
}

BrokerAddress::BrokerAddress(string host, unsigned port){
	this->host = host;
	this->port = port;
}

int BrokerAddress::parse(const string &url){
	string h;
	unsigned p;
	if(urlToIPPort(url, h, p) != 0)
		return -1;
	this->host = h;
	this->port = p;
	return 0;
}

string BrokerAddress::getAddress() const{
	return IPPortToUrl(this->host, this->port);
}

bool BrokerAddress::operator==(const BrokerAddress &ba) const{
	return this->host.compare(ba.host) == 0 && this->port == ba.port;
}
