#include<sys/time.h>
#include<cstdio>
#include<iostream>
#include"timestamp.h"

double getSecond(){
	struct timeval tv;
	if(gettimeofday(&tv, NULL)!=0)
		std::cerr << "gettimeofday error\n";
	return tv.tv_sec+1e-6*tv.tv_usec;
}

static const char *logname = "queuemover";
static FILE *logfile = NULL;

void setLogName(const char *name){
	logname = name;
}

int setLogFile(const char *path){
	FILE *f = fopen(path, "a");
	if(f == NULL){
		std::cerr << "cannot open " << path << std::endl;
		return -1;
	}
	closeLogFile();
	logfile = f;
	return 0;
}

void closeLogFile(){
	if(logfile != NULL){
		fclose(logfile);
		logfile = NULL;
	}
}

void logTime(const char *str){
	if(logfile == NULL)
		return;
	fprintf(logfile, "%.6lf %s %s\n", getSecond(), logname, str);
	fflush(logfile);
}

void logInfo(const std::string &str){
	std::cout << str << std::endl;
	logTime(str.c_str());
}

void logError(const std::string &str){
	std::cerr << "error: " << str << std::endl;
	logTime(("error: " + str).c_str());
}
