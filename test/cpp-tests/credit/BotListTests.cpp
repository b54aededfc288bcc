/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"
#include "creditsim/credit/AccessControl.hpp"
#include "creditsim/credit/BotList.hpp"
#include "creditsim/credit/Permissions.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::credit;
using namespace testing;

//-------------------------------------------------------------------------

struct BotListTest : public Test
{
    virtual void SetUp() override
    {
        owner = chain.allocateAddress();
        facade = chain.allocateAddress();
        creditAccount = chain.allocateAddress();
        bot = chain.allocateAddress();
        otherBot = chain.allocateAddress();

        botList = std::make_unique<BotList>(chain, owner);
        botList->approveCreditFacade(owner, facade);
    }

    simulation::Chain chain;
    Address owner;
    Address facade;
    Address creditAccount;
    Address bot;
    Address otherBot;
    std::unique_ptr<BotList> botList;
};

//-------------------------------------------------------------------------

TEST_F(BotListTest, GrantAndRevoke)
{
    EXPECT_EQ(
        botList->setBotPermissions(facade, creditAccount, bot, ADD_COLLATERAL_PERMISSION, 10, 20), 1);
    EXPECT_EQ(
        botList->setBotPermissions(facade, creditAccount, otherBot, ALL_PERMISSIONS, 0, 0), 2);

    const auto permissions = botList->botPermissions(bot, creditAccount);
    ASSERT_TRUE(permissions.has_value());
    EXPECT_EQ(permissions->permissions, ADD_COLLATERAL_PERMISSION);
    EXPECT_EQ(permissions->fundingAmount, uint256_t{10});
    EXPECT_EQ(permissions->weeklyAllowance, uint256_t{20});
    EXPECT_THAT(botList->activeBots(creditAccount), UnorderedElementsAre(bot, otherBot));

    EXPECT_EQ(botList->setBotPermissions(facade, creditAccount, bot, 0, 0, 0), 1);
    EXPECT_FALSE(botList->botPermissions(bot, creditAccount).has_value());
    EXPECT_EQ(botList->botStatus(bot, creditAccount).permissions, 0);
}

//-------------------------------------------------------------------------

TEST_F(BotListTest, EraseAllBotPermissions)
{
    static_cast<void>(botList->setBotPermissions(facade, creditAccount, bot, ALL_PERMISSIONS, 0, 0));
    static_cast<void>(botList->setBotPermissions(facade, creditAccount, otherBot, ALL_PERMISSIONS, 0, 0));

    botList->eraseAllBotPermissions(facade, creditAccount);

    EXPECT_THAT(botList->activeBots(creditAccount), IsEmpty());
    EXPECT_FALSE(botList->botPermissions(bot, creditAccount).has_value());
    EXPECT_FALSE(botList->botPermissions(otherBot, creditAccount).has_value());

    // Nothing left to erase.
    EXPECT_NO_THROW(botList->eraseAllBotPermissions(facade, creditAccount));
}

//-------------------------------------------------------------------------

TEST_F(BotListTest, ForbiddenBots)
{
    static_cast<void>(botList->setBotPermissions(facade, creditAccount, bot, ALL_PERMISSIONS, 0, 0));
    botList->setBotForbiddenStatus(owner, bot, true);

    const auto status = botList->botStatus(bot, creditAccount);
    EXPECT_EQ(status.permissions, ALL_PERMISSIONS);
    EXPECT_TRUE(status.forbidden);

    EXPECT_THROW(
        static_cast<void>(botList->setBotPermissions(facade, creditAccount, bot, ALL_PERMISSIONS, 0, 0)),
        InvalidBotException);
    // Revoking is still possible.
    EXPECT_EQ(botList->setBotPermissions(facade, creditAccount, bot, 0, 0, 0), 0);

    botList->setBotForbiddenStatus(owner, bot, false);
    EXPECT_FALSE(botList->isForbidden(bot));
}

//-------------------------------------------------------------------------

TEST_F(BotListTest, AccessChecks)
{
    EXPECT_THROW(
        static_cast<void>(botList->setBotPermissions(owner, creditAccount, bot, ALL_PERMISSIONS, 0, 0)),
        CallerNotCreditFacadeException);
    EXPECT_THROW(
        static_cast<void>(botList->setBotPermissions(facade, creditAccount, bot, 1u << 20, 0, 0)),
        UnexpectedPermissionsException);
    EXPECT_THROW(botList->eraseAllBotPermissions(owner, creditAccount), CallerNotCreditFacadeException);
    EXPECT_THROW(botList->approveCreditFacade(facade, facade), CallerNotOwnerException);
    EXPECT_THROW(botList->setBotForbiddenStatus(facade, bot, true), CallerNotOwnerException);
}

//-------------------------------------------------------------------------

TEST_F(BotListTest, RollsBackWithJournal)
{
    {
        auto tx = chain.journal().begin();
        static_cast<void>(botList->setBotPermissions(facade, creditAccount, bot, ALL_PERMISSIONS, 0, 0));
    }
    EXPECT_THAT(botList->activeBots(creditAccount), IsEmpty());
}

//-------------------------------------------------------------------------

TEST(AccessControlTest, Roles)
{
    const Address configurator = 1;
    const Address controller = 2;
    const Address stranger = 3;

    AccessControl accessControl{configurator};
    EXPECT_TRUE(accessControl.hasRole(Role::CONFIGURATOR, configurator));

    accessControl.grantRole(configurator, Role::CONTROLLER, controller);
    EXPECT_NO_THROW(accessControl.checkControllerOrConfigurator(controller));
    EXPECT_NO_THROW(accessControl.checkControllerOrConfigurator(configurator));
    EXPECT_THROW(accessControl.checkControllerOrConfigurator(stranger), CallerNotControllerException);

    EXPECT_THROW(accessControl.checkRole(Role::PAUSABLE_ADMIN, stranger), CallerNotPausableAdminException);
    EXPECT_THROW(accessControl.checkRole(Role::UNPAUSABLE_ADMIN, stranger), CallerNotUnpausableAdminException);
    EXPECT_THROW(
        accessControl.grantRole(controller, Role::PAUSABLE_ADMIN, stranger), CallerNotConfiguratorException);

    accessControl.revokeRole(configurator, Role::CONTROLLER, controller);
    EXPECT_FALSE(accessControl.hasRole(Role::CONTROLLER, controller));
}

//-------------------------------------------------------------------------
