#ifndef ARLOADER_PRICING_HPP
#define ARLOADER_PRICING_HPP

#include <cstdint>

namespace arloader {

/// Network pricing block; rewards grow per started block.
inline constexpr uint64_t BLOCK_SIZE = 256 * 1024;
inline constexpr uint64_t WINSTONS_PER_AR = 1000000000000ULL;
inline constexpr uint64_t LAMPORTS_PER_SOL = 1000000000ULL;

/// Winstons per lamport used when paying through the co-signer.
inline constexpr uint64_t RATE = 2500;
/// Minimum lamports charged per transaction.
inline constexpr uint64_t FLOOR = 5000;
/// Fee of the payment chain's transfer itself.
inline constexpr uint64_t SOL_TX_FEE = 5000;

inline uint64_t blocksFor(uint64_t dataSize) {
  return dataSize / BLOCK_SIZE + (dataSize % BLOCK_SIZE != 0 ? 1 : 0);
}

/**
 * @brief Linear price model quoted from the network.
 *
 * base is the price of one block, incremental the price of each further
 * block, both already scaled by the reward multiplier.
 */
struct PriceTerms {
  uint64_t base{0};
  uint64_t incremental{0};

  /// Reward for a payload of @p dataSize bytes. Empty data costs one block.
  uint64_t rewardFor(uint64_t dataSize) const {
    uint64_t blocks = blocksFor(dataSize);
    return base + incremental * (blocks > 0 ? blocks - 1 : 0);
  }

  /**
   * @brief Derives terms from quotes for one and two blocks.
   * @param multiplier must be in (0, 10); checked by validateConfig.
   */
  static PriceTerms fromQuotes(uint64_t oneBlock, uint64_t twoBlocks,
                               double multiplier) {
    PriceTerms terms;
    terms.base = static_cast<uint64_t>(static_cast<double>(oneBlock) * multiplier);
    uint64_t two = static_cast<uint64_t>(static_cast<double>(twoBlocks) * multiplier);
    terms.incremental = two > terms.base ? two - terms.base : 0;
    return terms;
  }
};

/// Lamports the co-signer charges for a transaction with @p reward winstons.
inline uint64_t lamportsFor(uint64_t reward) {
  uint64_t lamports = reward / RATE;
  return lamports > FLOOR ? lamports : FLOOR;
}

/// USD prices in cents, as reported by the oracle.
struct OraclePrices {
  uint64_t usdCentsPerAr{0};
  uint64_t usdCentsPerSol{0};
};

} // namespace arloader

#endif // ARLOADER_PRICING_HPP
