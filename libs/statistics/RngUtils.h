#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <string>

namespace benchstat
{
  namespace rng_utils
  {
    /**
     * @brief Uniform index in [0, hiExclusive) without modulo bias.
     *
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

    // SplitMix64 finaliser: deterministic, strong avalanche.
    inline uint64_t splitmix64(uint64_t x) noexcept
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Fold several 64-bit values into one.
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts) noexcept
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
        h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Stable 64-bit digest of a byte string.
     *
     * Bytes are packed little-endian into 64-bit words and folded with
     * hash_combine64, followed by the length. Independent of std::hash, so
     * digests are comparable across builds and platforms.
     */
    inline uint64_t digest_bytes(const std::string& bytes) noexcept
    {
      uint64_t h = 0xcbf29ce484222325ull;
      uint64_t word = 0;
      std::size_t filled = 0;
      for (unsigned char ch : bytes)
        {
          word |= static_cast<uint64_t>(ch) << (8 * filled);
          if (++filled == 8)
            {
              h = hash_combine64({h, word});
              word = 0;
              filled = 0;
            }
        }
      if (filled > 0)
        h = hash_combine64({h, word});
      return hash_combine64({h, static_cast<uint64_t>(bytes.size())});
    }

    /**
     * @brief Seed for shard @p shardIndex of a run seeded with @p masterSeed.
     *
     * The shard index is XOR-ed into the master seed and the result is passed
     * through SplitMix64 so neighbouring shards get uncorrelated streams.
     */
    inline uint64_t derive_shard_seed(uint64_t masterSeed, std::size_t shardIndex) noexcept
    {
      return splitmix64(masterSeed ^ splitmix64(static_cast<uint64_t>(shardIndex)));
    }

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

    /**
     * @brief Hands out one independently seeded engine per shard.
     *
     * No engine is ever shared between shards, so shards may run on any
     * thread in any order and still draw the same numbers.
     */
    template<class Eng = std::mt19937_64>
    class ShardEngineProvider
    {
    public:
      using Engine = Eng;

      explicit ShardEngineProvider(uint64_t masterSeed)
        : m_masterSeed(masterSeed)
      {}

      Engine make_engine(std::size_t shardIndex) const
      {
        auto sseq = make_seed_seq(derive_shard_seed(m_masterSeed, shardIndex));
        return Engine(sseq);
      }

      uint64_t masterSeed() const noexcept
      {
        return m_masterSeed;
      }

    private:
      uint64_t m_masterSeed;
    };
  } // namespace rng_utils
} // namespace benchstat
