// Copyright (c) 2012-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"
#include "rpc/client.h"
#include "rpc/server.h"
#include "test/test_pairmint.h"
#include "util/system.h"

#include <algorithm>
#include <stdexcept>

#include <boost/test/unit_test.hpp>
#include <univalue.h>

namespace {

/** Matches a runtime_error whose message contains the reason */
class HasReason
{
public:
    explicit HasReason(const std::string& reason) : m_reason(reason) {}
    bool operator()(const std::runtime_error& e) const
    {
        return std::string(e.what()).find(m_reason) != std::string::npos;
    }

private:
    const std::string m_reason;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(rpc_pairs_tests, PairTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_param_conversion)
{
    UniValue params = RPCConvertValues("transferpair", {"00000000000000000000000000000000000000b2", "7"});
    BOOST_REQUIRE_EQUAL(params.size(), 2U);
    BOOST_CHECK(params[0].isStr());
    BOOST_CHECK(params[1].isNum());
    BOOST_CHECK_EQUAL(params[1].get_int64(), 7);

    params = RPCConvertValues("mintpair", {"https://pairs.example/1"});
    BOOST_CHECK(params[0].isStr());

    BOOST_CHECK_THROW(RPCConvertValues("burnpair", {"[1"}), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(rpc_pair_lifecycle)
{
    UniValue r = CallRPC("mintpair https://pairs.example/1", alice);
    BOOST_CHECK_EQUAL(find_value(r, "id").get_int64(), 0);
    BOOST_CHECK_EQUAL(find_value(r, "owner").get_str(), alice.GetHex());
    BOOST_CHECK_EQUAL(find_value(r, "fee").getValStr(), "1.000000");

    r = CallRPC("getpair 0", alice);
    BOOST_CHECK(find_value(r, "live").get_bool());
    BOOST_CHECK_EQUAL(find_value(r, "owner").get_str(), alice.GetHex());
    BOOST_CHECK_EQUAL(find_value(r, "uri").get_str(), "https://pairs.example/1");
    BOOST_CHECK_EQUAL(find_value(r, "units").getValStr(), "1.000000");

    r = CallRPC("transferpair " + bob.GetHex() + " 0", alice);
    BOOST_CHECK_EQUAL(find_value(r, "to").get_str(), bob.GetHex());
    r = CallRPC("getpair 0", bob);
    BOOST_CHECK_EQUAL(find_value(r, "owner").get_str(), bob.GetHex());

    BOOST_CHECK_EXCEPTION(CallRPC("burnpair 0", alice), std::runtime_error, HasReason("not-pair-owner"));

    r = CallRPC("burnpair 0", bob);
    BOOST_CHECK_EQUAL(find_value(r, "refund").getValStr(), "1.000000");
    BOOST_CHECK_EXCEPTION(CallRPC("getpair 0", bob), std::runtime_error, HasReason("not live"));
    BOOST_CHECK_EXCEPTION(CallRPC("burnpair 0", bob), std::runtime_error, HasReason("pair-not-live"));

    r = CallRPC("getpairstate", bob);
    BOOST_CHECK_EQUAL(find_value(r, "live_pairs").get_int64(), 0);
    BOOST_CHECK_EQUAL(find_value(r, "total_minted").get_int64(), 1);
    BOOST_CHECK_EQUAL(find_value(r, "total_burned").get_int64(), 1);
    BOOST_CHECK(find_value(find_value(r, "invariants"), "ok").get_bool());
}

BOOST_AUTO_TEST_CASE(rpc_listpairs_and_audit)
{
    CallRPC("mintpair https://pairs.example/1", alice);
    CallRPC("mintpair https://pairs.example/2", bob);
    CallRPC("mintpair https://pairs.example/3", alice);

    UniValue r = CallRPC("listpairs", alice);
    BOOST_REQUIRE(r.isArray());
    BOOST_REQUIRE_EQUAL(r.size(), 3U);
    BOOST_CHECK_EQUAL(find_value(r[1], "owner").get_str(), bob.GetHex());

    r = CallRPC("auditpairs", admin);
    BOOST_CHECK(find_value(r, "ok").get_bool());
    BOOST_CHECK_EQUAL(find_value(r, "pairs_checked").get_int64(), 3);
    BOOST_CHECK_EQUAL(find_value(r, "owners").get_int64(), 2);
    BOOST_CHECK(find_value(r, "escrow_covered").get_bool());
}

BOOST_AUTO_TEST_CASE(rpc_requires_caller)
{
    BOOST_CHECK_EXCEPTION(CallRPC("mintpair https://pairs.example/1", CAccountID()), std::runtime_error,
                          HasReason("-caller"));
    BOOST_CHECK_THROW(CallRPC("burnpair abc", alice), std::runtime_error);
    BOOST_CHECK_EXCEPTION(CallRPC("transferpair nothex 0", alice), std::runtime_error,
                          HasReason("40 hexadecimal characters"));
}

BOOST_AUTO_TEST_CASE(rpc_admin_commands)
{
    UniValue r = CallRPC("pause", admin);
    BOOST_CHECK_EQUAL(find_value(r, "component").get_str(), "engine");
    BOOST_CHECK(find_value(r, "paused").get_bool());
    BOOST_CHECK_EXCEPTION(CallRPC("mintpair https://pairs.example/1", alice), std::runtime_error,
                          HasReason("engine-paused"));
    BOOST_CHECK_EXCEPTION(CallRPC("unpause", alice), std::runtime_error, HasReason("missing-role-pauser"));
    r = CallRPC("unpause engine", admin);
    BOOST_CHECK(!find_value(r, "paused").get_bool());

    BOOST_CHECK(!CallRPC("hasrole engine pauser " + alice.GetHex(), alice).get_bool());
    BOOST_CHECK(CallRPC("grantrole engine pauser " + alice.GetHex(), admin).get_bool());
    BOOST_CHECK(CallRPC("hasrole engine pauser " + alice.GetHex(), alice).get_bool());
    BOOST_CHECK(CallRPC("hasrole pairledger transfer engine", alice).get_bool());
    BOOST_CHECK(CallRPC("revokerole engine pauser " + alice.GetHex(), admin).get_bool());
    BOOST_CHECK(!CallRPC("hasrole engine pauser " + alice.GetHex(), alice).get_bool());
    BOOST_CHECK_EXCEPTION(CallRPC("grantrole engine superuser " + alice.GetHex(), admin), std::runtime_error,
                          HasReason("Unknown role"));

    BOOST_CHECK_EQUAL(CallRPC("setbaseuri https://gw.example/", admin).get_str(), "https://gw.example/");
    BOOST_CHECK_EXCEPTION(CallRPC("setbaseuri https://evil.example/", alice), std::runtime_error,
                          HasReason("missing-role-urisetter"));

    CallRPC("mintpair https://pairs.example/1", alice);
    r = CallRPC("emergencywithdraw stablecoin 1", admin);
    BOOST_CHECK_EQUAL(find_value(r, "amount").getValStr(), "1.000000");
    BOOST_CHECK_EQUAL(CallRPC("getbalance engine", admin).getValStr(), "0.000000");
}

BOOST_AUTO_TEST_CASE(rpc_token_commands)
{
    const CAccountID carol = TestAccount("b3");
    BOOST_CHECK_EQUAL(CallRPC("getbalance " + carol.GetHex(), carol).getValStr(), "0.000000");

    BOOST_CHECK_EXCEPTION(CallRPC("mintstable " + carol.GetHex() + " 2", carol), std::runtime_error,
                          HasReason("missing-role-minter"));
    BOOST_CHECK_EQUAL(CallRPC("mintstable " + carol.GetHex() + " 2", admin).getValStr(), "2.000000");
    BOOST_CHECK_EXCEPTION(CallRPC("mintpair https://pairs.example/1", carol), std::runtime_error,
                          HasReason("insufficient-fee-allowance"));

    BOOST_CHECK_EQUAL(CallRPC("approve stablecoin engine 1.5", carol).getValStr(), "1.500000");
    CallRPC("mintpair https://pairs.example/1", carol);
    BOOST_CHECK_EQUAL(CallRPC("getbalance " + carol.GetHex(), carol).getValStr(), "1.000000");
    BOOST_CHECK_EQUAL(CallRPC("getbalance " + carol.GetHex() + " pairledger", carol).getValStr(), "1.000000");
    BOOST_CHECK_EXCEPTION(CallRPC("getbalance " + carol.GetHex() + " registry", carol), std::runtime_error,
                          HasReason("Unknown token"));
}

BOOST_AUTO_TEST_CASE(rpc_events)
{
    const int64_t nBase = node.statedb->ReadEventCount();
    CallRPC("mintpair https://pairs.example/1", alice);
    CallRPC("transferpair " + bob.GetHex() + " 0", alice);
    CallRPC("burnpair 0", bob);

    UniValue r = CallRPC("getevents " + std::to_string(nBase), admin);
    BOOST_REQUIRE(r.isArray());
    BOOST_REQUIRE_EQUAL(r.size(), 3U);
    BOOST_CHECK_EQUAL(find_value(r[0], "type").get_str(), "pair-minted");
    BOOST_CHECK_EQUAL(find_value(r[0], "owner").get_str(), alice.GetHex());
    BOOST_CHECK_EQUAL(find_value(r[1], "type").get_str(), "pair-transferred");
    BOOST_CHECK_EQUAL(find_value(r[1], "from").get_str(), alice.GetHex());
    BOOST_CHECK_EQUAL(find_value(r[1], "to").get_str(), bob.GetHex());
    BOOST_CHECK_EQUAL(find_value(r[2], "type").get_str(), "pair-burned");
    BOOST_CHECK_EQUAL(find_value(r[2], "amount").getValStr(), "1.000000");

    r = CallRPC("getevents 0 2", admin);
    BOOST_CHECK_EQUAL(r.size(), 2U);
    BOOST_CHECK_EQUAL(find_value(r[0], "type").get_str(), "role-granted");
    BOOST_CHECK_EXCEPTION(CallRPC("getevents 0 0", admin), std::runtime_error, HasReason("count"));

    // -eventcount sets the default page size
    gArgs.ForceSetArg("-eventcount", "1");
    r = CallRPC("getevents " + std::to_string(nBase), admin);
    BOOST_REQUIRE_EQUAL(r.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(r[0], "type").get_str(), "pair-minted");
    gArgs.ForceSetArg("-eventcount", "0");
    BOOST_CHECK_EXCEPTION(CallRPC("getevents", admin), std::runtime_error, HasReason("count"));
}

BOOST_AUTO_TEST_CASE(rpc_help)
{
    const std::string strHelp = CallRPC("help", admin).get_str();
    BOOST_CHECK(strHelp.find("mintpair") != std::string::npos);
    BOOST_CHECK(strHelp.find("== Pairs ==") != std::string::npos);
    BOOST_CHECK_EQUAL(CallRPC("help mintpair", admin).get_str().find("mintpair \"uri\""), 0U);
    BOOST_CHECK_EXCEPTION(CallRPC("nosuchcommand", admin), std::runtime_error, HasReason("Method not found"));

    const std::vector<std::string> vCommands = tableRPC.listCommands();
    for (const char* name : {"help", "mintpair", "burnpair", "transferpair", "pause", "getevents"}) {
        BOOST_CHECK_MESSAGE(std::find(vCommands.begin(), vCommands.end(), name) != vCommands.end(), name);
    }
}

BOOST_AUTO_TEST_SUITE_END()
