#include<cstdlib>
#include<cstdio>
#include<fstream>
#include<string>
#include<unistd.h>
#include<gtest/gtest.h>
#include"timestamp.h"

TEST(TimestampTest, SecondsAdvance){
	double a = getSecond();
	double b = getSecond();
	EXPECT_GT(a, 1e9);
	EXPECT_GE(b, a);
}

TEST(TimestampTest, LogFileGetsNamedLines){
	char path[] = "/tmp/queuemover_logXXXXXX";
	int fd = mkstemp(path);
	ASSERT_GE(fd, 0);
	close(fd);

	setLogName("movertest");
	ASSERT_EQ(0, setLogFile(path));
	logInfo("moved 10 messages");
	logError("queue gone");
	closeLogFile();
	logInfo("not in the file");

	std::ifstream in(path);
	std::string first, second, third;
	ASSERT_TRUE((bool)std::getline(in, first));
	ASSERT_TRUE((bool)std::getline(in, second));
	EXPECT_FALSE((bool)std::getline(in, third));
	EXPECT_NE(std::string::npos, first.find(" movertest moved 10 messages"));
	EXPECT_NE(std::string::npos, second.find(" movertest error: queue gone"));
	remove(path);
	setLogName("queuemover");
}

TEST(TimestampTest, UnwritableLogFile){
	EXPECT_EQ(-1, setLogFile("/nonexistent-dir/queuemover.log"));
}
