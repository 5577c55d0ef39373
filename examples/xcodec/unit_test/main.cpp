#include "xtest/xtest.hpp"

XTEST_MAIN;
