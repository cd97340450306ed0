// Copyright (c) 2011-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"
#include "test/test_pairmint.h"
#include "utilmoneystr.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(utilmoneystr_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_FormatMoney)
{
    BOOST_CHECK_EQUAL(FormatMoney(0), "0.000000");
    BOOST_CHECK_EQUAL(FormatMoney(COIN), "1.000000");
    BOOST_CHECK_EQUAL(FormatMoney((COIN / 10000) * 123456789), "12345.678900");
    BOOST_CHECK_EQUAL(FormatMoney(-COIN), "-1.000000");
    BOOST_CHECK_EQUAL(FormatMoney(COIN, true), "+1.000000");
    BOOST_CHECK_EQUAL(FormatMoney(1), "0.000001");
    BOOST_CHECK_EQUAL(FormatMoney(MAX_MONEY), "1000000000000.000000");
}

BOOST_AUTO_TEST_CASE(util_ParseMoney)
{
    CAmount ret = 0;
    BOOST_CHECK(ParseMoney("0.0", ret));
    BOOST_CHECK_EQUAL(ret, 0);

    BOOST_CHECK(ParseMoney("12345.6789", ret));
    BOOST_CHECK_EQUAL(ret, (COIN / 10000) * 123456789);

    BOOST_CHECK(ParseMoney("1", ret));
    BOOST_CHECK_EQUAL(ret, COIN);
    BOOST_CHECK(ParseMoney(" 1.5 ", ret));
    BOOST_CHECK_EQUAL(ret, COIN + COIN / 2);
    BOOST_CHECK(ParseMoney(".000001", ret));
    BOOST_CHECK_EQUAL(ret, 1);
    BOOST_CHECK(ParseMoney("0.000001", ret));
    BOOST_CHECK_EQUAL(ret, 1);

    // Precision beyond the smallest unit
    BOOST_CHECK(!ParseMoney("0.0000001", ret));
    // Too large
    BOOST_CHECK(!ParseMoney("10000000000000", ret));
    // Negative
    BOOST_CHECK(!ParseMoney("-1", ret));
    // Garbage
    BOOST_CHECK(!ParseMoney("", ret));
    BOOST_CHECK(!ParseMoney(".", ret));
    BOOST_CHECK(!ParseMoney("1a", ret));
    BOOST_CHECK(!ParseMoney("1.0 x", ret));
}

BOOST_AUTO_TEST_SUITE_END()
