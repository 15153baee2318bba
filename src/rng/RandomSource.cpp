#include "RandomSource.h"

// xoroshiro128++ by David Blackman and Sebastiano Vigna
// Public domain: see http://vigna.di.unimi.it

static inline uint64_t rotl(const uint64_t x, int k) {
	return (x << k) | (x >> (64 - k));
}

static inline uint64_t splitmix64(uint64_t *x) {
	uint64_t z = (*x += 0x9E3779B97F4A7C15ULL);
	z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
	z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
	return z ^ (z >> 31);
}

RandomSource::RandomSource()
{
	Seed(1);
}

RandomSource::RandomSource(unsigned long long seed)
{
	Seed(seed);
}

void RandomSource::Seed(unsigned long long seed)
{
	uint64_t sm = (uint64_t)seed;
	m_state[0] = splitmix64(&sm);
	m_state[1] = splitmix64(&sm);
	if ((m_state[0] | m_state[1]) == 0)
		m_state[1] = 1;
}

uint64_t RandomSource::NextU64()
{
	const uint64_t s0 = m_state[0];
	uint64_t s1 = m_state[1];
	const uint64_t result = rotl(s0 + s1, 17) + s0;

	s1 ^= s0;
	m_state[0] = rotl(s0, 49) ^ s1 ^ (s1 << 21);
	m_state[1] = rotl(s1, 28);
	return result;
}

int RandomSource::Random(int range)
{
	if (range <= 0)
		return 0;
	// upper bits of xoroshiro have the best quality
	return (int)((NextU64() >> 33) % (uint64_t)range);
}
