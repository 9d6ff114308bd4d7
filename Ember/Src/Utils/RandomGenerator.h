/**
 * @file RandomGenerator.h
 * @brief Provides a centralized random number generator for the Ember library.
 */

#ifndef EMBER_UTILS_RANDOM_GENERATOR_H_
#define EMBER_UTILS_RANDOM_GENERATOR_H_

#include <mutex>
#include <random>

namespace Ember::Utils
{
    /**
     * @brief Singleton class providing centralized random number generation.
     *
     * Weight initialization, dropout masks and sampling streams all start from
     * generators handed out here, so installing a seed before constructing a
     * model makes its initial weights reproducible.
     */
    class RandomGenerator {
    public:
        /**
         * @brief Gets the singleton instance of the RandomGenerator.
         */
        static RandomGenerator& getInstance() {
            static RandomGenerator instance;
            return instance;
        }

        /**
         * @brief Sets the global random seed.
         *
         * @param seed The seed value (use 0 for non-deterministic behavior from std::random_device)
         */
        void setSeed( unsigned int seed ) {
            std::lock_guard<std::mutex> lock( mutex_ );
            if ( seed == 0 ) {
                std::random_device rd;
                seed_ = rd();
            }
            else {
                seed_ = seed;
            }
            generator_ = std::mt19937( seed_ );
        }

        unsigned int getSeed() const {
            std::lock_guard<std::mutex> lock( mutex_ );
            return seed_;
        }

        /**
         * @brief Gets a copy of the generator initialized with the global seed.
         *
         * Subsequent calls to setSeed do not affect generators already handed out,
         * and two calls without an intervening setSeed return identical streams.
         */
        std::mt19937 getGenerator() const {
            std::lock_guard<std::mutex> lock( mutex_ );
            return generator_;
        }

        /**
         * @brief Draws a seed from the global engine and advances it.
         *
         * Consecutive calls return different values, so consumers that need a
         * fresh stream per request seed from here rather than from getGenerator().
         * After setSeed the sequence of returned values is reproducible.
         */
        unsigned int nextSeed() {
            std::lock_guard<std::mutex> lock( mutex_ );
            return static_cast<unsigned int>( generator_() );
        }

        /**
         * @brief Derives an independent generator for a named consumer.
         *
         * The stream is a pure function of the global seed and the salt, which
         * keeps e.g. each dropout layer reproducible without sharing state.
         */
        std::mt19937 deriveGenerator( unsigned int salt ) const {
            std::lock_guard<std::mutex> lock( mutex_ );
            std::seed_seq seq{ seed_, salt };
            return std::mt19937( seq );
        }

    private:
        RandomGenerator() {
            std::random_device rd;
            seed_ = rd();
            generator_ = std::mt19937( seed_ );
        }

        RandomGenerator( const RandomGenerator& ) = delete;
        RandomGenerator& operator=( const RandomGenerator& ) = delete;

        mutable std::mutex mutex_;
        unsigned int seed_;
        std::mt19937 generator_;
    };
}

#endif
