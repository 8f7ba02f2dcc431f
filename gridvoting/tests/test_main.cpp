/*=============================================================================

Gridvoting Tests

Author   : Benedikt Hiemenz, Max Kolhagen, Markus Schmidt
=============================================================================*/
#include "helper.h"
#include "tests/test.h"

#include <exception>

int main()
{
    try
    {
        test_start();
    }
    catch (const std::exception& e)
    {
        Log::e("(Test) Unexpected Exception: %s", e.what());
        return 1;
    }

    Log::i("(Main) ALL TESTS WERE SUCCESSFUL!");
    return 0;
}
