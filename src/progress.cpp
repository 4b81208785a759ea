#include<cstdio>
#include"progress.h"

using namespace std;

#define CURSOR_HIDE "\033[?25l"
#define CURSOR_SHOW "\033[?25h"
#define COLOR_CYAN  "\033[36m"
#define COLOR_RESET "\033[0m"

ProgressReporter::~ProgressReporter(){
}

void SilentProgress::report(unsigned count, unsigned total){
}

//class ProgressBar

ProgressBar::ProgressBar(ostream &o, unsigned w): out(o){
	this->width = w;
	this->drawing = false;
}

ProgressBar::~ProgressBar(){
	this->finish();
}

unsigned ProgressBar::percent(unsigned count, unsigned total){
	if(total == 0)
		return 0;
	if(count >= total)
		return 100;
	return (unsigned)((unsigned long long)count * 100 / total);
}

string ProgressBar::render(unsigned count, unsigned total, unsigned width){
	unsigned filled = 0;
	if(total != 0)
		filled = count >= total? width: (unsigned)((unsigned long long)count * width / total);

	string bar = "|";
	for(unsigned i = 0; i < width; i++)
		bar += (i < filled? "\xe2\x96\x88": "\xe2\x96\x91"); // full block, light shade
	bar += "|";

	char s[16];
	sprintf(s, " %3u%%", percent(count, total));
	return bar + s;
}

void ProgressBar::report(unsigned count, unsigned total){
	if(this->drawing == false){
		this->out << CURSOR_HIDE;
		this->drawing = true;
	}
	this->out << "\r\t\t" << COLOR_CYAN << render(count, total, this->width) << COLOR_RESET;
	this->out.flush();
}

void ProgressBar::finish(){
	if(this->drawing == false)
		return;
	this->out << "\n" << CURSOR_SHOW;
	this->out.flush();
	this->drawing = false;
}

//class TransferProgress

TransferProgress::TransferProgress(unsigned approximatetotal){
	this->moved = 0;
	this->total = approximatetotal;
}

void TransferProgress::addMoved(unsigned n){
	this->moved += n;
	// the approximate count was low, grow the total instead of overflowing the bar
	if(this->moved > this->total)
		this->total = this->moved;
}

unsigned TransferProgress::getMoved() const{
	return this->moved;
}

unsigned TransferProgress::getTotal() const{
	return this->total;
}
