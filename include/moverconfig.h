#ifndef MOVERCONFIG_H_INCLUDED
#define MOVERCONFIG_H_INCLUDED

#include<string>

struct MoverConfig{
	std::string source;
	std::string destination;
	std::string brokerurl;
	unsigned leaseseconds;
	std::string logfile; // empty if not logging to a file
	bool quiet;

	MoverConfig();
};

// return 0 if ok, -1 if error (see error), 1 if help is requested
int readMoverArgument(int argc, char *argv[], MoverConfig &config, std::string &error);
std::string moverUsage(const char *program);

#endif
