#ifndef TEST_SHELL_H
#define TEST_SHELL_H

void test_shell();

#endif // TEST_SHELL_H
