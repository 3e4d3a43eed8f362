/**
 * HttpConnectivityProbe tests
 *
 * Only failure paths: nothing here needs a working network.
 */

#include <boost/test/unit_test.hpp>

#include "../net/ConnectivityProbe.h"

BOOST_AUTO_TEST_SUITE(connectivity_probe_tests)

BOOST_AUTO_TEST_CASE(malformed_url_is_unreachable) {
    HttpConnectivityProbe probe(2);
    bool reachable = true;
    BOOST_CHECK_NO_THROW(reachable = probe.isReachable("this is not a url"));
    BOOST_CHECK(!reachable);
}

BOOST_AUTO_TEST_CASE(empty_url_is_unreachable) {
    HttpConnectivityProbe probe(2);
    BOOST_CHECK(!probe.isReachable(""));
}

BOOST_AUTO_TEST_CASE(closed_port_is_unreachable) {
    HttpConnectivityProbe probe(2);
    BOOST_CHECK(!probe.isReachable("http://127.0.0.1:1/README.md"));
}

BOOST_AUTO_TEST_SUITE_END()
