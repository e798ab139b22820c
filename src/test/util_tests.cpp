// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_piggy.h"

#include "util/moneystr.h"
#include "util/strencodings.h"
#include "util/system.h"
#include "util/time.h"

#include <sstream>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(util_FormatMoney)
{
    BOOST_CHECK_EQUAL(FormatMoney(0), "0.00");
    BOOST_CHECK_EQUAL(FormatMoney((COIN / 10000) * 123456789), "12345.6789");
    BOOST_CHECK_EQUAL(FormatMoney(-COIN), "-1.00");

    BOOST_CHECK_EQUAL(FormatMoney(COIN * 100000000), "100000000.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN * 1000), "1000.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN * 10), "10.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN), "1.00");
    BOOST_CHECK_EQUAL(FormatMoney(COIN / 10), "0.10");
    BOOST_CHECK_EQUAL(FormatMoney(COIN / 100), "0.01");
    BOOST_CHECK_EQUAL(FormatMoney(COIN / 1000), "0.001");
    BOOST_CHECK_EQUAL(FormatMoney(1), "0.000001");
    BOOST_CHECK_EQUAL(FormatMoney(1060405684), "1060.405684");
}

BOOST_AUTO_TEST_CASE(util_ParseMoney)
{
    CAmount ret = 0;
    BOOST_CHECK(ParseMoney("0.0", ret));
    BOOST_CHECK_EQUAL(ret, 0);

    BOOST_CHECK(ParseMoney("12345.6789", ret));
    BOOST_CHECK_EQUAL(ret, (COIN / 10000) * 123456789);

    BOOST_CHECK(ParseMoney("1000", ret));
    BOOST_CHECK_EQUAL(ret, COIN * 1000);
    BOOST_CHECK(ParseMoney("1", ret));
    BOOST_CHECK_EQUAL(ret, COIN);
    BOOST_CHECK(ParseMoney("0.1", ret));
    BOOST_CHECK_EQUAL(ret, COIN / 10);
    BOOST_CHECK(ParseMoney("0.000001", ret));
    BOOST_CHECK_EQUAL(ret, 1);
    BOOST_CHECK(ParseMoney(" 150 ", ret));
    BOOST_CHECK_EQUAL(ret, 150 * COIN);

    // Parsing amount that can not be represented in ret should fail
    BOOST_CHECK(!ParseMoney("0.0000001", ret));

    // Parsing empty string should fail
    BOOST_CHECK(!ParseMoney("", ret));

    // Attempted 63 bit overflow should fail
    BOOST_CHECK(!ParseMoney("92233720368.54775808", ret));

    // Above MAX_MONEY
    BOOST_CHECK(!ParseMoney("1000000001", ret));

    // Parsing garbage should fail
    BOOST_CHECK(!ParseMoney("-1", ret));
    BOOST_CHECK(!ParseMoney("1e3", ret));
    BOOST_CHECK(!ParseMoney("12 34", ret));
}

BOOST_AUTO_TEST_CASE(util_ParseDuration)
{
    int64_t n = 0;
    BOOST_CHECK(ParseDuration("30d", n));
    BOOST_CHECK_EQUAL(n, 30 * SECONDS_PER_DAY);
    BOOST_CHECK(ParseDuration("12h", n));
    BOOST_CHECK_EQUAL(n, 12 * SECONDS_PER_HOUR);
    BOOST_CHECK(ParseDuration("90m", n));
    BOOST_CHECK_EQUAL(n, 90 * 60);
    BOOST_CHECK(ParseDuration("45", n));
    BOOST_CHECK_EQUAL(n, 45);
    BOOST_CHECK(ParseDuration("45s", n));
    BOOST_CHECK_EQUAL(n, 45);

    BOOST_CHECK(!ParseDuration("", n));
    BOOST_CHECK(!ParseDuration("d", n));
    BOOST_CHECK(!ParseDuration("-5d", n));
    BOOST_CHECK(!ParseDuration("3w", n));
    BOOST_CHECK(!ParseDuration("1.5d", n));
}

BOOST_AUTO_TEST_CASE(util_ParseInt64)
{
    int64_t n;
    BOOST_CHECK(ParseInt64("1234", &n) && n == 1234LL);
    BOOST_CHECK(ParseInt64("-1234", &n) && n == -1234LL);
    BOOST_CHECK(ParseInt64("9223372036854775807", &n) && n == (int64_t)9223372036854775807);
    BOOST_CHECK(!ParseInt64("", &n));
    BOOST_CHECK(!ParseInt64(" 1", &n));
    BOOST_CHECK(!ParseInt64("1 ", &n));
    BOOST_CHECK(!ParseInt64("1a", &n));
    BOOST_CHECK(!ParseInt64("9223372036854775808", &n));
}

BOOST_AUTO_TEST_CASE(util_ParseUInt32)
{
    uint32_t n;
    BOOST_CHECK(ParseUInt32("1234", &n) && n == 1234);
    BOOST_CHECK(ParseUInt32("4294967295", &n) && n == 4294967295U);
    BOOST_CHECK(!ParseUInt32("4294967296", &n));
    BOOST_CHECK(!ParseUInt32("-1", &n));
    BOOST_CHECK(!ParseUInt32("30d", &n));
}

BOOST_AUTO_TEST_CASE(util_SplitWords)
{
    std::vector<std::string> v = SplitWords("  deposit\talice   150  30 ");
    BOOST_REQUIRE_EQUAL(v.size(), 4u);
    BOOST_CHECK_EQUAL(v[0], "deposit");
    BOOST_CHECK_EQUAL(v[1], "alice");
    BOOST_CHECK_EQUAL(v[3], "30");
    BOOST_CHECK(SplitWords("   ").empty());
}

BOOST_AUTO_TEST_CASE(util_FormatISO8601DateTime)
{
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(TEST_START_TIME), "2023-11-14T22:13:20Z");
    BOOST_CHECK_EQUAL(FormatISO8601DateTime(0), "1970-01-01T00:00:00Z");
}

BOOST_AUTO_TEST_CASE(util_ParseParameters)
{
    ArgsManager testArgs;
    const char* argv_test[] = {"-ignored", "-a", "-b", "-ccc=argument", "-ccc=multiple", "f", "-d=e"};

    std::string error;
    BOOST_CHECK(testArgs.ParseParameters(0, (char**)argv_test, error));
    BOOST_CHECK(!testArgs.IsArgSet("-a"));
    BOOST_CHECK(testArgs.GetPositionalArgs().empty());

    BOOST_CHECK(testArgs.ParseParameters(7, (char**)argv_test, error));
    // expectation: -ignored is ignored (program name argument),
    // -a, -b and -ccc end up in map, -d ignored because it is after
    // a non-option argument (non-GNU option parsing)
    BOOST_CHECK(testArgs.IsArgSet("-a") && testArgs.IsArgSet("-b") && testArgs.IsArgSet("-ccc")
                && !testArgs.IsArgSet("f") && !testArgs.IsArgSet("-d"));
    BOOST_CHECK_EQUAL(testArgs.GetArgs("-ccc").size(), 2u);
    BOOST_CHECK_EQUAL(testArgs.GetArg("-ccc", ""), "multiple");

    const std::vector<std::string> vPositional = testArgs.GetPositionalArgs();
    BOOST_REQUIRE_EQUAL(vPositional.size(), 2u);
    BOOST_CHECK_EQUAL(vPositional[0], "f");
    BOOST_CHECK_EQUAL(vPositional[1], "-d=e");
}

BOOST_AUTO_TEST_CASE(util_GetBoolArg)
{
    ArgsManager testArgs;
    const char* argv_test[] = {"ignored", "-a", "-nob", "-c=0", "-d=1", "-e=false", "-nof=0", "--regtest"};
    std::string error;
    BOOST_CHECK(testArgs.ParseParameters(8, (char**)argv_test, error));

    BOOST_CHECK(testArgs.GetBoolArg("-a", false));
    BOOST_CHECK(!testArgs.GetBoolArg("-b", true));
    BOOST_CHECK(testArgs.IsArgNegated("-b"));
    BOOST_CHECK(!testArgs.GetBoolArg("-c", true));
    BOOST_CHECK(testArgs.GetBoolArg("-d", false));
    // Non-numeric values count as false
    BOOST_CHECK(!testArgs.GetBoolArg("-e", true));
    // -nof=0 means -f=1
    BOOST_CHECK(testArgs.GetBoolArg("-f", false));
    // --foo is read as -foo
    BOOST_CHECK(testArgs.GetBoolArg("-regtest", false));

    BOOST_CHECK(testArgs.GetBoolArg("-missing", true));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-missing", (int64_t)42), 42);
}

BOOST_AUTO_TEST_CASE(util_ReadConfigStream)
{
    const std::string str_config =
        "# vault settings\n"
        "admin = treasury\n"
        "compounding=continuous  # overrides the preset\n"
        "globalmultiplier=12000\n"
        "\n"
        "nologtimestamps=1\n";

    std::istringstream streamConfig(str_config);
    ArgsManager testArgs;
    std::string error;
    BOOST_REQUIRE(testArgs.ReadConfigStream(streamConfig, error));

    BOOST_CHECK_EQUAL(testArgs.GetArg("-admin", ""), "treasury");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-compounding", ""), "continuous");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-globalmultiplier", (int64_t)0), 12000);
    BOOST_CHECK(!testArgs.GetBoolArg("-logtimestamps", true));

    // Command line wins over the config file
    const char* argv_test[] = {"ignored", "-admin=root"};
    BOOST_CHECK(testArgs.ParseParameters(2, (char**)argv_test, error));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-admin", ""), "root");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-compounding", ""), "continuous");

    std::istringstream streamBad("just-a-word\n");
    BOOST_CHECK(!testArgs.ReadConfigStream(streamBad, error));
    BOOST_CHECK(error.find("line 1") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(util_SoftSetArg)
{
    ArgsManager testArgs;
    BOOST_CHECK(testArgs.SoftSetArg("-admin", "a"));
    BOOST_CHECK(!testArgs.SoftSetArg("-admin", "b"));
    BOOST_CHECK_EQUAL(testArgs.GetArg("-admin", ""), "a");

    testArgs.ForceSetArg("-admin", "c");
    BOOST_CHECK_EQUAL(testArgs.GetArg("-admin", ""), "c");

    testArgs.ClearArgs();
    BOOST_CHECK(!testArgs.IsArgSet("-admin"));
}

BOOST_AUTO_TEST_SUITE_END()
