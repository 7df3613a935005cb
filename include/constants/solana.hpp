#pragma once
#include <cstdint>
#include <string>

namespace SolanaConstants {
  // Raydium programs
  inline const std::string RAYDIUM_AMM_V4 = "675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8";
  inline const std::string RAYDIUM_AMM_V4_AUTHORITY = "5Q544fKrFoe6tsEbD7S8EmxGTJYAKtTVhAW5Q5pge4j1";
  inline const std::string RAYDIUM_CP_SWAP = "CPMMoo8L3F4NbTegBCKVNunggL7H1ZpdTHKxQB5qKP1C";
  inline const std::string RAYDIUM_STABLE = "5quBtoiQqxF9Jv6KYKctB59NT3gtJD2Y65kdnB1Uev3h";
  inline const std::string RAYDIUM_CLMM = "CAMMCzo5YL8w4VFF8KVHrK22GGUsp5VTaW7grrKgrWqK";

  // Runtime programs and sysvars
  inline const std::string SYSTEM_PROGRAM = "11111111111111111111111111111111";
  inline const std::string TOKEN_PROGRAM = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
  inline const std::string TOKEN_2022_PROGRAM = "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb";
  inline const std::string ASSOCIATED_TOKEN_PROGRAM = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL";
  inline const std::string COMPUTE_BUDGET_PROGRAM = "ComputeBudget111111111111111111111111111111";
  inline const std::string SYSVAR_CLOCK = "SysvarC1ock11111111111111111111111111111111";

  // Well-known mints
  inline const std::string WSOL_MINT = "So11111111111111111111111111111111111111112";
  inline const std::string USDC_MINT = "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v";
  inline const std::string USDT_MINT = "Es9vMFrzaCERmJfrF4H2FYD4KCoNkY11McCe8BenwNYB";
  inline const std::string RAY_MINT = "4k3Dyjzvzp8eMZWUXbBCjEvwSkkk59S5iCNLY3QrkX6R";

  inline constexpr size_t MAX_TRANSACTION_SIZE = 1232;
  inline constexpr size_t MAX_ACCOUNTS_PER_QUERY = 100;
  inline constexpr uint64_t TOKEN_ACCOUNT_RENT_LAMPORTS = 2039280;
  inline constexpr uint32_t DEFAULT_COMPUTE_UNIT_LIMIT = 400000;
  inline constexpr uint64_t DEFAULT_COMPUTE_UNIT_PRICE = 50000;  // micro-lamports
}
