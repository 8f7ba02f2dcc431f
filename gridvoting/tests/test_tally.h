#ifndef TEST_TALLY_H
#define TEST_TALLY_H

void test_tally();

#endif // TEST_TALLY_H
