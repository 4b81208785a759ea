#include<set>
#include<string>
#include<vector>
#include<gtest/gtest.h>
#include"leasetable.h"

TEST(LeaseTableTest, HandlesAreUnique){
	LeaseTable leases;
	std::string a = leases.add(100.0, 10);
	std::string b = leases.add(100.0, 10);
	EXPECT_NE(a, b);
	EXPECT_EQ(2u, leases.size());
}

TEST(LeaseTableTest, TakeActiveHandleOnce){
	LeaseTable leases;
	std::string h = leases.add(100.0, 10);

	EXPECT_EQ(LEASE_ACTIVE, leases.take(h, 109.5));
	EXPECT_EQ(0u, leases.size());
	// a handle cannot be deleted twice
	EXPECT_EQ(LEASE_UNKNOWN, leases.take(h, 109.5));
}

TEST(LeaseTableTest, TakeExpiredHandle){
	LeaseTable leases;
	std::string h = leases.add(100.0, 10);

	EXPECT_EQ(LEASE_EXPIRED, leases.take(h, 110.0));
	EXPECT_EQ(0u, leases.size());
}

TEST(LeaseTableTest, TakeUnknownHandle){
	LeaseTable leases;
	leases.add(100.0, 10);

	EXPECT_EQ(LEASE_UNKNOWN, leases.take("rh-999", 100.0));
	EXPECT_EQ(LEASE_UNKNOWN, leases.take("", 100.0));
	EXPECT_EQ(1u, leases.size());
}

TEST(LeaseTableTest, TakeExpiredReturnsOnlyEndedLeases){
	LeaseTable leases;
	std::string early = leases.add(100.0, 2);
	std::string late = leases.add(100.0, 30);
	std::string middle = leases.add(105.0, 2);

	std::vector<std::string> expired = leases.takeExpired(107.0);
	std::set<std::string> got(expired.begin(), expired.end());
	EXPECT_EQ(2u, expired.size());
	EXPECT_EQ(1u, got.count(early));
	EXPECT_EQ(1u, got.count(middle));

	// released handles can no longer be deleted, the live one still can
	EXPECT_EQ(LEASE_UNKNOWN, leases.take(early, 107.0));
	EXPECT_EQ(LEASE_ACTIVE, leases.take(late, 107.0));
	EXPECT_TRUE(leases.takeExpired(1000.0).empty());
}

TEST(LeaseTableTest, ClearDropsAllLeases){
	LeaseTable leases;
	std::string h = leases.add(100.0, 10);
	leases.clear();
	EXPECT_EQ(0u, leases.size());
	EXPECT_EQ(LEASE_UNKNOWN, leases.take(h, 100.0));
}

TEST(LeaseTableTest, KeepsProducerMessageId){
	LeaseTable leases;
	std::set<std::string> ids;
	EXPECT_EQ("order-17", leases.assignMessageId("order-17", ids));
	EXPECT_EQ(1u, ids.count("order-17"));
}

TEST(LeaseTableTest, GeneratesIdWhenMissing){
	LeaseTable leases;
	std::set<std::string> ids;
	std::string a = leases.assignMessageId("", ids);
	std::string b = leases.assignMessageId("", ids);
	EXPECT_FALSE(a.empty());
	EXPECT_NE(a, b);
	EXPECT_EQ(2u, ids.size());
}

TEST(LeaseTableTest, DuplicateIdIsReplaced){
	LeaseTable leases;
	std::set<std::string> ids;
	EXPECT_EQ("order-17", leases.assignMessageId("order-17", ids));
	std::string second = leases.assignMessageId("order-17", ids);
	EXPECT_NE("order-17", second);
	EXPECT_EQ(2u, ids.size());
}

TEST(LeaseTableTest, GeneratedIdSkipsProducerIdOfSameShape){
	LeaseTable leases;
	std::set<std::string> ids;
	// producers already used the first generated names
	EXPECT_EQ("msg-1", leases.assignMessageId("msg-1", ids));
	EXPECT_EQ("msg-2", leases.assignMessageId("msg-2", ids));

	std::string generated = leases.assignMessageId("", ids);
	EXPECT_NE("msg-1", generated);
	EXPECT_NE("msg-2", generated);
	EXPECT_EQ(3u, ids.size());

	std::string again = leases.assignMessageId("msg-1", ids);
	EXPECT_NE("msg-1", again);
	EXPECT_EQ(4u, ids.size());
}
