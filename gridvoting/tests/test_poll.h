#ifndef TEST_POLL_H
#define TEST_POLL_H

void test_poll();

#endif // TEST_POLL_H
