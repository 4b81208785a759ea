#ifndef TIMESTAMP_H_INCLUDED
#define TIMESTAMP_H_INCLUDED

#include<string>

double getSecond();

void setLogName(const char *name);
// return -1 if the file cannot be opened
int setLogFile(const char *path);
void closeLogFile();

// "<seconds> <logname> <str>" into the log file, if one is set
void logTime(const char *str);

void logInfo(const std::string &str);
void logError(const std::string &str);

#endif
