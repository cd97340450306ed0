// Copyright (c) 2026 The Pairmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "access/accesscontrol.h"
#include "consensus/validation.h"
#include "state/statedb.h"
#include "test/test_pairmint.h"

#include <boost/test/unit_test.hpp>

namespace {

struct AccessTestingSetup : public BasicTestingSetup {
    CStateDB db;
    CAccessControl access;
    CAccountID admin;
    CAccountID user;

    AccessTestingSetup()
        : db(fs::path(), true), access(db, TestAccount("a1"), "engine"),
          admin(TestAccount("c1")), user(TestAccount("b1"))
    {
        CValidationState state;
        if (!access.SetupRole(ROLE_ADMIN, admin, state) || !access.SetupRole(ROLE_PAUSER, admin, state)) {
            throw std::runtime_error(FormatStateMessage(state));
        }
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(accesscontrol_tests, AccessTestingSetup)

BOOST_AUTO_TEST_CASE(role_names)
{
    for (uint8_t n = 0; n < ROLE_COUNT; n++) {
        AccessRole role;
        BOOST_CHECK(RoleFromString(RoleToString(n), role));
        BOOST_CHECK_EQUAL(role, n);
    }
    AccessRole role;
    BOOST_CHECK(!RoleFromString("root", role));
    BOOST_CHECK_EQUAL(RoleToString(ROLE_COUNT), "unknown");
}

BOOST_AUTO_TEST_CASE(grant_and_revoke)
{
    CValidationState state;
    BOOST_CHECK(!access.HasRole(ROLE_MINTER, user));
    BOOST_CHECK(access.GrantRole(admin, ROLE_MINTER, user, state));
    BOOST_CHECK(access.HasRole(ROLE_MINTER, user));
    // Roles are per domain
    CAccessControl other(db, TestAccount("a3"), "registry");
    BOOST_CHECK(!other.HasRole(ROLE_MINTER, user));

    const uint64_t nEvents = db.ReadEventCount();
    // Granting again changes nothing
    BOOST_CHECK(access.GrantRole(admin, ROLE_MINTER, user, state));
    BOOST_CHECK_EQUAL(db.ReadEventCount(), nEvents);

    BOOST_CHECK(access.RevokeRole(admin, ROLE_MINTER, user, state));
    BOOST_CHECK(!access.HasRole(ROLE_MINTER, user));
    BOOST_CHECK_EQUAL(db.ReadEventCount(), nEvents + 1);

    PairEvent event;
    BOOST_REQUIRE(db.ReadEvent(nEvents, event));
    BOOST_CHECK_EQUAL(event.nType, EVENT_ROLE_REVOKED);
    BOOST_CHECK(event.from == admin);
    BOOST_CHECK(event.to == user);
    BOOST_CHECK_EQUAL(event.nRole, ROLE_MINTER);

    // Revoking a role that is not held is a no-op
    BOOST_CHECK(access.RevokeRole(admin, ROLE_MINTER, user, state));
}

BOOST_AUTO_TEST_CASE(grant_requires_admin)
{
    CValidationState state;
    BOOST_CHECK(!access.GrantRole(user, ROLE_MINTER, user, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-admin");
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_UNAUTHORIZED);
    BOOST_CHECK(!access.HasRole(ROLE_MINTER, user));

    CValidationState state2;
    BOOST_CHECK(!access.GrantRole(admin, ROLE_MINTER, CAccountID(), state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "bad-role-zero-address");
}

BOOST_AUTO_TEST_CASE(last_admin_kept)
{
    CValidationState state;
    BOOST_CHECK(!access.RevokeRole(admin, ROLE_ADMIN, admin, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "last-admin");
    BOOST_CHECK(access.HasRole(ROLE_ADMIN, admin));

    CValidationState state2;
    BOOST_CHECK(access.GrantRole(admin, ROLE_ADMIN, user, state2));
    BOOST_CHECK_EQUAL(access.CountRoleMembers(ROLE_ADMIN), 2U);
    BOOST_CHECK(access.RevokeRole(user, ROLE_ADMIN, admin, state2));
    BOOST_CHECK_EQUAL(access.CountRoleMembers(ROLE_ADMIN), 1U);
    BOOST_CHECK(!access.HasRole(ROLE_ADMIN, admin));
}

BOOST_AUTO_TEST_CASE(pause_switch)
{
    const uint64_t nEvents = db.ReadEventCount();
    CValidationState state;
    BOOST_CHECK(!access.IsPaused());
    BOOST_CHECK(access.CheckNotPaused(state));

    BOOST_CHECK(!access.Pause(user, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "missing-role-pauser");
    BOOST_CHECK(!access.IsPaused());

    CValidationState state2;
    BOOST_CHECK(access.Pause(admin, state2));
    BOOST_CHECK(access.IsPaused());
    BOOST_CHECK(!access.CheckNotPaused(state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "engine-paused");
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_PAUSED);

    CValidationState state3;
    BOOST_CHECK(!access.Pause(admin, state3));
    BOOST_CHECK_EQUAL(state3.GetRejectReason(), "already-paused");

    CValidationState state4;
    BOOST_CHECK(access.Unpause(admin, state4));
    BOOST_CHECK(!access.IsPaused());
    BOOST_CHECK(!access.Unpause(admin, state4));
    BOOST_CHECK_EQUAL(state4.GetRejectReason(), "not-paused");

    // pause + unpause
    BOOST_CHECK_EQUAL(db.ReadEventCount(), nEvents + 2);
    PairEvent event;
    BOOST_REQUIRE(db.ReadEvent(nEvents, event));
    BOOST_CHECK_EQUAL(event.nType, EVENT_PAUSE_CHANGED);
    BOOST_CHECK(event.fPaused);
}

BOOST_AUTO_TEST_SUITE_END()
