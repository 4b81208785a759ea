#ifndef BROKERADDRESS_H_INCLUDED
#define BROKERADDRESS_H_INCLUDED

#include<string>

// "host[:port]", port defaults to DEFAULT_BROKER_PORT
// return 0 if ok, -1 if url is malformed
int urlToIPPort(const std::string &url, std::string &host, unsigned &port);
std::string IPPortToUrl(const std::string &host, unsigned port);

class BrokerAddress{
public:
	std::string host;
	unsigned port;

	BrokerAddress();
	BrokerAddress(std::string host, unsigned port);
	int parse(const std::string &url);
	std::string getAddress() const;
	bool operator==(const BrokerAddress &ba) const;
};

#endif
