#include"brokeraddress.h"
#include"common.h"
#include"moverconfig.h"

using namespace std;

MoverConfig::MoverConfig(){
	brokerurl = DEFAULT_BROKER_URL;
	leaseseconds = DEFAULT_LEASE_SECONDS;
	quiet = false;
}

string moverUsage(const char *program){
	string p = program;
	return "usage: " + p + " --source=SOURCE --destination=DESTINATION [<flags>]\n"
	"\n"
	"Move all messages from one queue to another\n"
	"\n"
	"Flags:\n"
	"  -s, --source=SOURCE            Source queue to move messages from\n"
	"  -d, --destination=DESTINATION  Destination queue to move messages to\n"
	"  -b, --broker=\"" DEFAULT_BROKER_URL "\"  Broker for source and destination queues\n"
	"  -l, --lease=SECONDS            How long received messages stay hidden (default 10)\n"
	"  -o, --log=FILE                 Append a timestamped log to FILE\n"
	"  -q, --quiet                    Do not draw the progress bar\n"
	"  -h, --help                     Show this help\n";
}

// return 0 if s is an unsigned decimal that fits, -1 otherwise
static int stou(const string &s, unsigned &u){
	if(s.empty() || s.length() > 9)
		return -1;
	unsigned r = 0;
	for(unsigned i = 0; i < s.length(); i++){
		if(s[i] < '0' || s[i] > '9')
			return -1;
		r = r * 10 + (s[i] - '0');
	}
	u = r;
	return 0;
}

struct FlagName{
	char shortname;
	const char *longname;
	bool hasvalue;
}flagnames[]={
	{'s', "source", true},
	{'d', "destination", true},
	{'b', "broker", true},
	{'l', "lease", true},
	{'o', "log", true},
	{'q', "quiet", false},
	{'h', "help", false}
};
#define NUMBER_OF_FLAGS (sizeof(flagnames) / sizeof(flagnames[0]))

// return index in flagnames, -1 if unknown; value is set for "--name=value"
static int findFlag(const char *arg, string &value, bool &hasinlinevalue){
	hasinlinevalue = false;
	if(arg[0] != '-')
		return -1;
	if(arg[1] != '-'){
		if(arg[1] == '\0' || arg[2] != '\0')
			return -1;
		for(unsigned a = 0; a < NUMBER_OF_FLAGS; a++){
			if(flagnames[a].shortname == arg[1])
				return (int)a;
		}
		return -1;
	}
	string name = arg + 2;
	size_t eq = name.find('=');
	if(eq != string::npos){
		value = name.substr(eq + 1);
		name = name.substr(0, eq);
		hasinlinevalue = true;
	}
	for(unsigned a = 0; a < NUMBER_OF_FLAGS; a++){
		if(name.compare(flagnames[a].longname) == 0)
			return (int)a;
	}
	return -1;
}

static int setFlag(char shortname, const string &value, MoverConfig &config, string &error){
	switch(shortname){
	case 's':
		config.source = value;
		break;
	case 'd':
		config.destination = value;
		break;
	case 'b':
		config.brokerurl = value;
		break;
	case 'l':
		if(stou(value, config.leaseseconds) != 0){
			error = "invalid lease '" + value + "'";
			return -1;
		}
		break;
	case 'o':
		config.logfile = value;
		break;
	case 'q':
		config.quiet = true;
		break;
	default:
		break;
	}
	return 0;
}

static int checkConfig(const MoverConfig &config, string &error){
	if(config.source.empty()){
		error = "required flag --source not provided";
		return -1;
	}
	if(config.destination.empty()){
		error = "required flag --destination not provided";
		return -1;
	}
	if(config.source.compare(config.destination) == 0){
		error = "source and destination are the same queue";
		return -1;
	}
	if(config.leaseseconds == 0){
		error = "lease must be at least 1 second";
		return -1;
	}
	BrokerAddress ba;
	if(ba.parse(config.brokerurl) != 0){
		error = "invalid broker '" + config.brokerurl + "'";
		return -1;
	}
	return 0;
}

int readMoverArgument(int argc, char *argv[], MoverConfig &config, string &error){
	MoverConfig c;
	for(int i = 1; i < argc; i++){
		string value;
		bool hasinlinevalue;
		int f = findFlag(argv[i], value, hasinlinevalue);
		if(f < 0){
			error = "unknown flag '" + string(argv[i]) + "'";
			return -1;
		}
		if(flagnames[f].shortname == 'h')
			return 1;
		if(flagnames[f].hasvalue == false){
			if(hasinlinevalue){
				error = "flag --" + string(flagnames[f].longname) + " takes no value";
				return -1;
			}
		}
		else if(hasinlinevalue == false){
			if(i + 1 == argc){
				error = "expected argument for flag --" + string(flagnames[f].longname);
				return -1;
			}
			i++;
			value = argv[i];
		}
		if(setFlag(flagnames[f].shortname, value, c, error) != 0)
			return -1;
	}
	if(checkConfig(c, error) != 0)
		return -1;
	config = c;
	return 0;
}
