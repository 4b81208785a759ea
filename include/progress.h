#ifndef PROGRESS_H_INCLUDED
#define PROGRESS_H_INCLUDED

#include<ostream>
#include<string>
#include"common.h"

class ProgressReporter{
public:
	virtual ~ProgressReporter();
	virtual void report(unsigned count, unsigned total) = 0;
};

class SilentProgress: public ProgressReporter{
public:
	void report(unsigned count, unsigned total);
};

class ProgressBar: public ProgressReporter{
private:
	std::ostream &out;
	unsigned width;
	bool drawing;
public:
	ProgressBar(std::ostream &o, unsigned w = PROGRESS_BAR_WIDTH);
	~ProgressBar();

	void report(unsigned count, unsigned total);
	// ends the line and shows the cursor again
	void finish();

	static std::string render(unsigned count, unsigned total, unsigned width);
	static unsigned percent(unsigned count, unsigned total);
};

/*
moved count and display total of one transfer.
the total starts as the approximate count and is raised to the moved
count whenever the moved count passes it; neither value ever decreases.
*/
class TransferProgress{
private:
	unsigned moved;
	unsigned total;
public:
	TransferProgress(unsigned approximatetotal = 0);
	void addMoved(unsigned n);
	unsigned getMoved() const;
	unsigned getTotal() const;
};

#endif
