#ifndef RANDOM_SOURCE_H
#define RANDOM_SOURCE_H

#include <stdint.h>

/**
 * Fast PRNG (xoroshiro128++) shared by all random draws of one run.
 * Seeded through SplitMix64 so that any seed, including 0, gives a valid state.
 */
class RandomSource {
public:
    RandomSource();
    explicit RandomSource(unsigned long long seed);

    /**
     * Re-seed the generator
     *
     * @param seed Seed value
     */
    void Seed(unsigned long long seed);

    uint64_t NextU64();

    /**
     * Random integer in a range
     *
     * @param range Upper bound (exclusive)
     * @return Integer between 0 and range-1, 0 when range <= 0
     */
    int Random(int range);

private:
    uint64_t m_state[2];
};

#endif // RANDOM_SOURCE_H
