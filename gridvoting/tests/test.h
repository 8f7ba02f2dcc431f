#ifndef TEST_H
#define TEST_H

#include "tests/test_poll.h"
#include "tests/test_paillier.h"
#include "tests/test_tally.h"
#include "tests/test_controller.h"
#include "tests/test_serialization.h"
#include "tests/test_shell.h"

void test_start()
{
    test_poll();
    test_paillier();
    test_tally();
    test_controller();
    test_serialization();
    test_shell();
}

#endif // TEST_H
