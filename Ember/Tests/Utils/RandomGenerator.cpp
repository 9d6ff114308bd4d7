#include <gtest/gtest.h>

#include <random>

#include "Utils/RandomGenerator.h"

namespace Utils::Tests
{
    using namespace Ember::Utils;

    class RandomGeneratorTests : public ::testing::Test {
    protected:
        void SetUp() override {
            saved_seed_ = RandomGenerator::getInstance().getSeed();
        }

        void TearDown() override {
            RandomGenerator::getInstance().setSeed( saved_seed_ );
        }

        unsigned int saved_seed_{ 0 };
    };

    TEST_F( RandomGeneratorTests, SetSeed_MakesGeneratorsReproducible ) {
        auto& rng = RandomGenerator::getInstance();

        rng.setSeed( 42 );
        auto first = rng.getGenerator();

        rng.setSeed( 42 );
        auto second = rng.getGenerator();

        EXPECT_EQ( rng.getSeed(), 42u );
        for ( int i = 0; i < 8; ++i ) {
            EXPECT_EQ( first(), second() );
        }
    }

    TEST_F( RandomGeneratorTests, GetGenerator_ReturnsIndependentCopies ) {
        auto& rng = RandomGenerator::getInstance();
        rng.setSeed( 7 );

        auto a = rng.getGenerator();
        a.discard( 100 );
        auto b = rng.getGenerator();

        EXPECT_EQ( b, std::mt19937( 7 ) );
    }

    TEST_F( RandomGeneratorTests, DeriveGenerator_DependsOnSalt ) {
        auto& rng = RandomGenerator::getInstance();
        rng.setSeed( 99 );

        auto a1 = rng.deriveGenerator( 1 );
        auto a2 = rng.deriveGenerator( 1 );
        auto b = rng.deriveGenerator( 2 );

        EXPECT_EQ( a1, a2 );
        EXPECT_NE( a1(), b() );
    }

    TEST_F( RandomGeneratorTests, NextSeed_AdvancesAndFollowsSetSeed ) {
        auto& rng = RandomGenerator::getInstance();

        rng.setSeed( 11 );
        const unsigned int a1 = rng.nextSeed();
        const unsigned int a2 = rng.nextSeed();

        rng.setSeed( 11 );
        const unsigned int b1 = rng.nextSeed();
        const unsigned int b2 = rng.nextSeed();

        EXPECT_NE( a1, a2 );
        EXPECT_EQ( a1, b1 );
        EXPECT_EQ( a2, b2 );

        std::mt19937 reference( 11 );
        EXPECT_EQ( a1, static_cast<unsigned int>( reference() ) );
    }
}
