#ifndef COMMON_H_INCLUDED
#define COMMON_H_INCLUDED

// receive limit imposed by the queue service
#define MAX_BATCH_SIZE (10)

// messagemover.cpp
#define DEFAULT_LEASE_SECONDS (10)
#define DEFAULT_WAIT_SECONDS  (0) // free-poll, an empty receive ends the transfer

// brokeraddress.cpp
#define DEFAULT_BROKER_PORT (5672)
#define DEFAULT_BROKER_URL  "localhost:5672"

// progress.cpp
#define PROGRESS_BAR_WIDTH (40)

#endif
