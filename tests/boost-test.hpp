#pragma once

// Common include for all unit tests

#include <boost/test/unit_test.hpp>
