#define BOOST_TEST_MODULE Hydra Ledger Tests
#include <boost/test/included/unit_test.hpp>
