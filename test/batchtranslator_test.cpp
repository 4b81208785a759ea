#include<gtest/gtest.h>
#include"batchtranslator.h"

static QueueMessageVec makeBatch(){
	const char *ids[] = {"m-3", "m-1", "m-2"};
	QueueMessageVec batch;
	for(unsigned i = 0; i < 3; i++){
		QueueMessage m;
		m.messageid = ids[i];
		m.receipthandle = std::string("handle-") + ids[i];
		m.body = std::string("payload of ") + ids[i];
		batch.push_back(m);
	}
	return batch;
}

TEST(BatchTranslatorTest, ForwardEntriesKeepOrderAndIds){
	QueueMessageVec batch = makeBatch();
	ForwardEntryVec entries = toForwardEntries(batch);

	ASSERT_EQ(batch.size(), entries.size());
	for(unsigned i = 0; i < batch.size(); i++){
		EXPECT_EQ(batch[i].messageid, entries[i].id);
		EXPECT_EQ(batch[i].body, entries[i].body);
	}
}

TEST(BatchTranslatorTest, DeleteEntriesKeepOrderAndIds){
	QueueMessageVec batch = makeBatch();
	DeleteEntryVec entries = toDeleteEntries(batch);

	ASSERT_EQ(batch.size(), entries.size());
	for(unsigned i = 0; i < batch.size(); i++){
		EXPECT_EQ(batch[i].messageid, entries[i].id);
		EXPECT_EQ(batch[i].receipthandle, entries[i].receipthandle);
	}
}

TEST(BatchTranslatorTest, BinaryBodyIsCopiedVerbatim){
	QueueMessageVec batch(1);
	batch[0].messageid = "bin";
	batch[0].body = std::string("\x00\xff\x01", 3);

	ForwardEntryVec entries = toForwardEntries(batch);
	ASSERT_EQ(1u, entries.size());
	EXPECT_EQ(3u, entries[0].body.size());
	EXPECT_EQ(batch[0].body, entries[0].body);
}

TEST(BatchTranslatorTest, EmptyBatch){
	QueueMessageVec batch;
	EXPECT_TRUE(toForwardEntries(batch).empty());
	EXPECT_TRUE(toDeleteEntries(batch).empty());
}
