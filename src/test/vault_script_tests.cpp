// Copyright (c) 2025 The PiggyVault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Command processor driving the vault through text commands
//

#include "test/test_piggy.h"

#include "util/time.h"
#include "vault/vault_script.h"

#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/test/unit_test.hpp>

struct ScriptTestingSetup : public VaultTestingSetup {
    CVaultScript script;

    ScriptTestingSetup() : script(*manager, ledger, clock) {}

    /** Run a line that must succeed */
    std::string Ok(const std::string& strLine)
    {
        std::string strResult;
        BOOST_CHECK_MESSAGE(script.ExecuteLine(strLine, strResult), strLine + " -> " + strResult);
        return strResult;
    }

    /** Run a line that must fail, returning the error text */
    std::string Fail(const std::string& strLine)
    {
        std::string strResult;
        BOOST_CHECK_MESSAGE(!script.ExecuteLine(strLine, strResult), strLine + " unexpectedly succeeded");
        return strResult;
    }
};

BOOST_FIXTURE_TEST_SUITE(vault_script_tests, ScriptTestingSetup)

BOOST_AUTO_TEST_CASE(script_full_lifecycle)
{
    BOOST_CHECK_EQUAL(Ok("mint alice 1000"), "balance=1000.00");
    BOOST_CHECK_EQUAL(Ok("mint admin 1000"), "balance=1000.00");
    BOOST_CHECK_EQUAL(Ok("fund admin 1000"), "pool=1000.00");
    BOOST_CHECK_EQUAL(Ok("deposit alice 1000 30"), "deposit 1");
    BOOST_CHECK_EQUAL(Ok("balance alice"), "0.00");
    BOOST_CHECK_EQUAL(Ok("summary alice"), "saved=1000.00 active=1 earned=0.00");

    BOOST_CHECK_EQUAL(Ok("advance 30d"), strprintf("now=%d", TEST_START_TIME + 30 * SECONDS_PER_DAY));
    BOOST_CHECK_EQUAL(Ok("interest 1"), "9.910176");

    BOOST_CHECK_EQUAL(Ok("withdraw alice 1"),
                      "principal=1000.00 interest=9.910176 bonus=50.495508 total=1060.405684");
    BOOST_CHECK_EQUAL(Ok("balance alice"), "1060.405684");
    BOOST_CHECK_EQUAL(Ok("pool"), "total=1000.00 distributed=50.495508 available=949.504492");
    BOOST_CHECK_EQUAL(Ok("summary alice"), "saved=0.00 active=0 earned=60.405684");

    BOOST_CHECK(boost::algorithm::starts_with(Ok("show 1"), "CDeposit(id=1, owner=alice"));
    BOOST_CHECK(manager->CheckInvariants());
}

BOOST_AUTO_TEST_CASE(script_emergency)
{
    Ok("mint alice 1000");
    Ok("deposit alice 1000 30");
    Ok("advance 5d");
    BOOST_CHECK_EQUAL(Ok("emergency alice 1"), "principal=1000.00 penalty=20.00 total=980.00");
    BOOST_CHECK(boost::algorithm::starts_with(Ok("deposit? 1"), "CDeposit(id=1"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("emergency alice 1"), "error: already-withdrawn"));
}

BOOST_AUTO_TEST_CASE(script_rejections)
{
    Ok("mint alice 1000");
    Ok("deposit alice 1000 30");

    BOOST_CHECK(boost::algorithm::starts_with(Fail("deposit alice 5 30"), "error: bad-deposit-amount-range"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("withdraw bob 1"), "error: not-owner"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("withdraw alice 1"), "error: not-matured"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("withdraw alice 9"), "error: bad-deposit-unknown"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("interest 9"), "error: bad-deposit-unknown"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("globalmult alice 15000"), "error: bad-admin-caller"));
    BOOST_CHECK(boost::algorithm::starts_with(Fail("planmult admin 30 30000"), "error: bad-admin-multiplier"));
}

BOOST_AUTO_TEST_CASE(script_argument_errors)
{
    BOOST_CHECK_EQUAL(Fail("frobnicate"), "error: unknown command 'frobnicate'");
    BOOST_CHECK_EQUAL(Fail("deposit alice"), "error: usage: deposit <owner> <amount> <days>");
    BOOST_CHECK_EQUAL(Fail("pool extra"), "error: usage: pool");
    BOOST_CHECK_EQUAL(Fail("mint alice lots"), "error: invalid amount 'lots'");
    BOOST_CHECK_EQUAL(Fail("withdraw alice 0"), "error: invalid deposit id '0'");
    BOOST_CHECK_EQUAL(Fail("advance soon"), "error: invalid duration 'soon'");
    BOOST_CHECK(boost::algorithm::starts_with(Fail("mode admin hourly"), "error: invalid mode 'hourly'"));
    BOOST_CHECK_EQUAL(Fail("plan admin 60 1500 100 1000 maybe"), "error: invalid flag 'maybe'");

    BOOST_CHECK_THROW(script.Execute("deposit alice"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(script_admin_commands)
{
    BOOST_CHECK_EQUAL(Ok("plan admin 60 1500 100 1000"), "ok");
    BOOST_CHECK_EQUAL(Ok("planmult admin 60 15000"), "ok");
    BOOST_CHECK_EQUAL(Ok("globalmult admin 12000"), "ok");
    BOOST_CHECK_EQUAL(Ok("mode admin continuous"), "ok");

    BOOST_CHECK(manager->GetCompoundingMode() == vault_interest::CompoundingMode::CONTINUOUS);
    BOOST_CHECK_EQUAL(manager->GetGlobalMultiplier(), 12000u);
    Optional<CSavingsPlan> plan = manager->GetPlan(60);
    BOOST_REQUIRE(plan);
    BOOST_CHECK_EQUAL(plan->nMultiplier, 15000u);
    BOOST_CHECK(plan->fActive);

    BOOST_CHECK_EQUAL(Ok("plan admin 60 1500 100 1000 inactive"), "ok");
    BOOST_CHECK(!manager->GetPlan(60)->fActive);

    const std::string strPlans = Ok("plans");
    BOOST_CHECK(boost::algorithm::starts_with(strPlans, "7d apy=500 mult=10000 min=10.00 max=10000.00 penalty=200 active"));
    BOOST_CHECK(strPlans.find("60d apy=1500 mult=15000 min=100.00 max=1000.00 penalty=300 inactive") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(script_comments_and_blank_lines)
{
    BOOST_CHECK_EQUAL(script.Execute(""), "");
    BOOST_CHECK_EQUAL(script.Execute("   "), "");
    BOOST_CHECK_EQUAL(script.Execute("# a comment"), "");
    BOOST_CHECK_EQUAL(script.Execute("mint alice 5   # trailing comment"), "balance=5.00");
}

BOOST_AUTO_TEST_CASE(script_run_stream)
{
    std::istringstream in(
        "# fund and save\n"
        "mint alice 150\n"
        "deposit alice 150 30\n"
        "deposit alice 150 30\n"
        "\n"
        "summary alice\n");
    std::ostringstream out;

    BOOST_CHECK_EQUAL(script.Run(in, out), 1u);

    const std::string strOut = out.str();
    BOOST_CHECK(strOut.find("balance=150.00\n") != std::string::npos);
    BOOST_CHECK(strOut.find("deposit 1\n") != std::string::npos);
    BOOST_CHECK(strOut.find("error: transfer-failed") != std::string::npos);
    BOOST_CHECK(strOut.find("saved=150.00 active=1 earned=0.00\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(script_command_list)
{
    const std::vector<std::string> vCommands = script.ListCommands();
    BOOST_CHECK_EQUAL(vCommands.size(), 17u);

    bool fFound = false;
    for (const std::string& strUsage : vCommands) {
        if (strUsage == "plan <caller> <days> <apy> <min> <max> [active]") fFound = true;
    }
    BOOST_CHECK(fFound);
}

BOOST_AUTO_TEST_SUITE_END()
