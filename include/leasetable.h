#ifndef LEASETABLE_H_INCLUDED
#define LEASETABLE_H_INCLUDED

#include<map>
#include<set>
#include<string>
#include<vector>

// return values of LeaseTable::take
#define LEASE_ACTIVE  (0)
#define LEASE_EXPIRED (-1)
#define LEASE_UNKNOWN (-2)

/*
receipt handles of received but not yet deleted messages.
a handle is valid until its lease end; times are getSecond() values.
the caller keeps the messages themselves, keyed by handle.
*/
class LeaseTable{
private:
	std::map<std::string, double> leases; // receipt handle -> lease end
	unsigned long long handlecount;
	unsigned long long idcount;
public:
	LeaseTable();

	// return a new receipt handle leased until now + leaseseconds
	std::string add(double now, unsigned leaseseconds);
	// removes the handle; LEASE_ACTIVE, LEASE_EXPIRED or LEASE_UNKNOWN
	int take(const std::string &handle, double now);
	// removes and returns all handles whose lease ended
	std::vector<std::string> takeExpired(double now);
	unsigned size() const;
	void clear();

	// id unique among ids: the given one, or a generated "msg-<n>"
	// when it is empty or already used. the result is added to ids.
	std::string assignMessageId(const std::string &id, std::set<std::string> &ids);
};

#endif
