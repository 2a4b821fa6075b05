#define BOOST_TEST_MAIN 1
#define BOOST_TEST_DYN_LINK 1

#include <boost/test/unit_test.hpp>
