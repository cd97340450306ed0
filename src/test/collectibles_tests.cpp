// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"
#include "state/statedb.h"
#include "test/test_pairmint.h"
#include "token/collectibles.h"

#include <boost/test/unit_test.hpp>

namespace {

struct RegistryTestingSetup : public BasicTestingSetup {
    CStateDB db;
    CCollectibleRegistry registry;
    CAccountID admin;
    CAccountID operatorId;
    CAccountID alice;
    CAccountID bob;

    RegistryTestingSetup()
        : db(fs::path(), true), registry(db, TestAccount("a3"), "registry"),
          admin(TestAccount("c1")), operatorId(TestAccount("a1")),
          alice(TestAccount("b1")), bob(TestAccount("b2"))
    {
        CValidationState state;
        CAccessControl& access = registry.GetAccess();
        if (!access.SetupRole(ROLE_ADMIN, admin, state) ||
            !access.SetupRole(ROLE_PAUSER, admin, state) ||
            !access.SetupRole(ROLE_URI_SETTER, admin, state) ||
            !access.SetupRole(ROLE_MINTER, operatorId, state) ||
            !access.SetupRole(ROLE_BURNER, operatorId, state) ||
            !access.SetupRole(ROLE_TRANSFER, operatorId, state)) {
            throw std::runtime_error(FormatStateMessage(state));
        }
    }

    uint64_t Mint(const CAccountID& to)
    {
        CValidationState state;
        uint64_t nId = 0;
        BOOST_REQUIRE(registry.Mint(operatorId, to, "ipfs://QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG", nId, state));
        return nId;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(collectibles_tests, RegistryTestingSetup)

BOOST_AUTO_TEST_CASE(uri_validation)
{
    CValidationState state;
    BOOST_CHECK(ValidateTokenURI("https://a.io", state));
    BOOST_CHECK(ValidateTokenURI("http://a.io", state));
    BOOST_CHECK(ValidateTokenURI("ipfs://QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG", state));

    CValidationState empty;
    BOOST_CHECK(!ValidateTokenURI("", empty));
    BOOST_CHECK_EQUAL(empty.GetRejectReason(), "bad-uri-empty");

    CValidationState prefix;
    BOOST_CHECK(!ValidateTokenURI("ftp://example.com/x", prefix));
    BOOST_CHECK_EQUAL(prefix.GetRejectReason(), "bad-uri-prefix");

    CValidationState shortCid;
    BOOST_CHECK(!ValidateTokenURI("ipfs://Qm", shortCid));
    BOOST_CHECK_EQUAL(shortCid.GetRejectReason(), "bad-uri-length");

    CValidationState bare;
    BOOST_CHECK(!ValidateTokenURI("https://", bare));
    BOOST_CHECK_EQUAL(bare.GetRejectReason(), "bad-uri-length");
}

BOOST_AUTO_TEST_CASE(sequential_ids)
{
    BOOST_CHECK_EQUAL(registry.NextId(), 0U);
    BOOST_CHECK_EQUAL(Mint(alice), 0U);
    BOOST_CHECK_EQUAL(Mint(bob), 1U);
    BOOST_CHECK_EQUAL(Mint(alice), 2U);
    BOOST_CHECK_EQUAL(registry.TotalSupply(), 3U);

    CValidationState state;
    BOOST_CHECK(registry.Burn(operatorId, 1, state));
    BOOST_CHECK_EQUAL(registry.TotalSupply(), 2U);
    BOOST_CHECK(!registry.Exists(1));

    // Burned ids are never handed out again
    BOOST_CHECK_EQUAL(Mint(bob), 3U);
    BOOST_CHECK_EQUAL(registry.NextId(), 4U);

    CAccountID owner;
    BOOST_CHECK(registry.OwnerOf(3, owner));
    BOOST_CHECK(owner == bob);
    BOOST_CHECK(!registry.OwnerOf(1, owner));
}

BOOST_AUTO_TEST_CASE(mint_requires_minter)
{
    CValidationState state;
    uint64_t nId = 0;
    BOOST_CHECK(!registry.Mint(admin, alice, "https://a.io/1", nId, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-minter");

    CValidationState state2;
    BOOST_CHECK(!registry.Mint(operatorId, CAccountID(), "https://a.io/1", nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-mint-zero-address");
    BOOST_CHECK_EQUAL(registry.NextId(), 0U);
}

BOOST_AUTO_TEST_CASE(token_uri_and_base)
{
    const uint64_t nId = Mint(alice);
    std::string uri;
    BOOST_CHECK(registry.TokenURI(nId, uri));
    BOOST_CHECK_EQUAL(uri, "ipfs://QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG");

    CValidationState state;
    BOOST_CHECK(!registry.SetBaseURI(alice, "https://gw.example/", state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-urisetter");

    CValidationState state2;
    BOOST_CHECK(registry.SetBaseURI(admin, "https://gw.example/", state2));
    BOOST_CHECK_EQUAL(registry.GetBaseURI(), "https://gw.example/");
    BOOST_CHECK(registry.TokenURI(nId, uri));
    BOOST_CHECK_EQUAL(uri, "https://gw.example/ipfs://QmYwAPJzv5CZsnA625s3Xf2nemtYgPpHdWEz79ojWnPbdG");

    BOOST_CHECK(!registry.TokenURI(nId + 1, uri));
}

BOOST_AUTO_TEST_CASE(transfer_and_approval)
{
    const uint64_t nId = Mint(alice);
    CValidationState state;

    // Holders have no transfer role of their own
    BOOST_CHECK(!registry.TransferFrom(alice, alice, bob, nId, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-transfer");

    CValidationState state2;
    BOOST_CHECK(registry.Approve(alice, bob, nId, state2));
    CAccountID approved;
    BOOST_CHECK(registry.GetApproved(nId, approved));
    BOOST_CHECK(approved == bob);

    BOOST_CHECK(!registry.TransferFrom(operatorId, bob, alice, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "transfer-from-incorrect-owner");

    CValidationState state3;
    BOOST_CHECK(registry.TransferFrom(operatorId, alice, bob, nId, state3));
    CAccountID owner;
    BOOST_CHECK(registry.OwnerOf(nId, owner));
    BOOST_CHECK(owner == bob);
    // Approval cleared with the transfer
    BOOST_CHECK(registry.GetApproved(nId, approved));
    BOOST_CHECK(approved.IsNull());

    CValidationState state4;
    BOOST_CHECK(!registry.Approve(alice, alice, nId, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "approve-caller-not-owner");
    CValidationState state5;
    BOOST_CHECK(!registry.Approve(bob, bob, nId, state5));
    BOOST_CHECK_EQUAL(state5.GetRejectReason(), "approve-to-owner");
}

BOOST_AUTO_TEST_CASE(burn_rules)
{
    const uint64_t nId = Mint(alice);

    // Burner role alone is not enough: caller must also be owner, approved or operator
    CValidationState state;
    BOOST_CHECK(registry.GetAccess().GrantRole(admin, ROLE_BURNER, bob, state));
    BOOST_CHECK(!registry.Burn(bob, nId, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "not-owner-nor-approved");

    CValidationState state2;
    BOOST_CHECK(registry.Approve(alice, bob, nId, state2));
    BOOST_CHECK(registry.Burn(bob, nId, state2));
    BOOST_CHECK(!registry.Exists(nId));

    CValidationState state3;
    BOOST_CHECK(!registry.Burn(operatorId, nId, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "nonexistent-token");
    BOOST_CHECK_EQUAL(state3.GetRejectCode(), REJECT_INVARIANT);
}

BOOST_AUTO_TEST_CASE(registry_pause)
{
    const uint64_t nId = Mint(alice);
    CValidationState state;
    BOOST_CHECK(registry.GetAccess().Pause(admin, state));

    uint64_t nNew = 0;
    BOOST_CHECK(!registry.Mint(operatorId, alice, "https://a.io/2", nNew, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "registry-paused");
    CValidationState state2;
    BOOST_CHECK(!registry.TransferFrom(operatorId, alice, bob, nId, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "registry-paused");
    CValidationState state3;
    BOOST_CHECK(!registry.Burn(operatorId, nId, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "registry-paused");
}

BOOST_AUTO_TEST_SUITE_END()
