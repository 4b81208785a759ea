#ifndef BATCHTRANSLATOR_H_INCLUDED
#define BATCHTRANSLATOR_H_INCLUDED

#include"queueservice.h"

// both keep the input order and use messageid as the entry id
ForwardEntryVec toForwardEntries(const QueueMessageVec &messages);
DeleteEntryVec toDeleteEntries(const QueueMessageVec &messages);

#endif
