#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <type_traits>
#include <utility>

namespace culturebench
{
  namespace rng_utils
  {
    /**
     * @brief Get a random index in [0, hiExclusive).
     *
     * Uses std::uniform_int_distribution to avoid modulo bias.
     * Returns 0 when hiExclusive is 0.
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(rng);
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Master seed of one random stream family.
     *
     * The seed for replicate b is a pure function of (masterSeed, b), which
     * makes bootstrap output independent of the order replicates are
     * evaluated in.
     */
    class CRNKey
    {
    public:
      CRNKey(uint64_t masterSeed)
	: m_masterSeed(masterSeed)
      {}

      uint64_t make_seed_for(std::size_t replicate) const
      {
	return hash_combine64({m_masterSeed, static_cast<uint64_t>(replicate)});
      }

    private:
      uint64_t m_masterSeed;
    };

    // Expand a 64-bit seed into eight 32-bit words for std::seed_seq.
    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s1 + 0xd1342543de82ef95ull);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(s3), static_cast<uint32_t>(s3 >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    template<class Eng>
    inline Eng construct_seeded_engine(std::seed_seq& sseq)
    {
      static_assert(std::is_constructible_v<Eng, std::seed_seq&>,
		    "engine must be constructible from std::seed_seq");
      return Eng(sseq);
    }

    /**
     * @brief Builds one deterministically seeded engine per replicate index.
     *
     * This is the provider shape PercentileBootstrap::run expects:
     * `Engine make_engine(std::size_t) const`.
     */
    template<class Eng = std::mt19937_64>
    class CRNEngineProvider
    {
    public:
      using Engine = Eng;

      explicit CRNEngineProvider(CRNKey key)
	: m_key(std::move(key))
      {}

      Engine make_engine(std::size_t replicate) const
      {
	auto sseq = make_seed_seq(m_key.make_seed_for(replicate));
	return construct_seeded_engine<Engine>(sseq);
      }

    private:
      CRNKey m_key;
    };
  } // namespace rng_utils
} // namespace culturebench
