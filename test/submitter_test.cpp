#include <gtest/gtest.h>

#include "common/errors.hpp"
#include "constants/solana.hpp"
#include "crypto/pda.hpp"
#include "protection/slippage_guard.hpp"
#include "quotes/quote_engine.hpp"
#include "transaction/submitter.hpp"
#include "utils/byte_io.hpp"
#include "test_support.hpp"
#include <set>

using namespace TestSupport;

namespace {
  class SubmitterTest : public ::testing::Test {
  protected:
    SubmitterTest()
      : clock(1000000), signer(Key(7)),
        pool(ConstantProductPool(100, Token(1, 6), Token(2, 6), 1000000000ULL, 2000000000ULL, 25)),
        builder(chain, BuilderOptions{}) {}

    void SetUp() override {
      QuoteError err;
      ASSERT_TRUE(QuotePool(pool, Request(pool.token_a, pool.token_b, 1000000), QuoteEngineOptions{}, route.quote, err));
      route.slippage_bps = 50;
      route.minimum_output = SlippageGuard::MinimumOutput(route.quote.amount_out, route.slippage_bps);
      output_ata = Crypto::AssociatedTokenAddress(Key(7), Key(2), Program(SolanaConstants::TOKEN_PROGRAM));
      chain.SetTokenBalance(output_ata, Key(2), kStartingBalance);
    }

    SwapSubmitter Submitter(int64_t confirmation_timeout_ms = 2000) {
      SubmitterOptions options;
      options.backoff = RetryBackoff(500, 8000, 3);
      options.confirmation_timeout_ms = confirmation_timeout_ms;
      options.poll_interval_ms = 500;
      return SwapSubmitter(chain, signer, builder, clock, options);
    }

    // Dry run credits `out`; a landed transaction credits `landed_out`
    void ChainPays(uint64_t out, uint64_t landed_out) {
      chain.simulate = [this, out](const std::vector<Pubkey>&) {
        return SimulatedBalance(Key(2), kStartingBalance + out);
      };
      chain.send = [this, landed_out](size_t) {
        chain.SetTokenBalance(output_ata, Key(2), kStartingBalance + landed_out);
        return std::string();
      };
    }

    static constexpr uint64_t kStartingBalance = 5000;
    ManualClock clock;
    FakeChainDataSource chain;
    HashSigner signer;
    PoolState pool;
    SwapBuilder builder;
    Route route;
    Pubkey output_ata;
  };
}

TEST_F(SubmitterTest, ConfirmedSwapReportsActualOutput) {
  ASSERT_GT(route.quote.amount_out, 0u);
  ChainPays(route.quote.amount_out, route.quote.amount_out - 100);
  auto submitter = Submitter();
  TransactionReport report = submitter.Execute(pool, route);

  EXPECT_EQ(report.status, TransactionState::Confirmed);
  EXPECT_TRUE(report.Succeeded());
  EXPECT_EQ(report.attempts, 1u);
  EXPECT_EQ(report.format, TransactionFormat::Legacy);
  EXPECT_EQ(chain.simulate_calls, 1u);
  ASSERT_EQ(chain.sent.size(), 1u);
  EXPECT_EQ(chain.landed.count(report.signature), 1u);
  EXPECT_EQ(report.expected_output, route.quote.amount_out);
  EXPECT_EQ(report.actual_output, route.quote.amount_out - 100);
  EXPECT_GT(report.realized_slippage_pct, 0);
  EXPECT_GT(report.actual_price, 0);
  EXPECT_TRUE(report.error.empty());
}

TEST_F(SubmitterTest, SimulationBelowMinimumIsNeverSubmitted) {
  ChainPays(route.minimum_output - 1, 0);
  auto submitter = Submitter();
  try {
    submitter.Execute(pool, route);
    FAIL() << "expected SimulationFailed";
  } catch (const SimulationFailed& e) {
    EXPECT_EQ(e.SimulatedOut(), route.minimum_output - 1);
    EXPECT_EQ(e.MinimumOut(), route.minimum_output);
  }
  EXPECT_TRUE(chain.sent.empty());
}

TEST_F(SubmitterTest, RejectedSimulationIsNeverSubmitted) {
  chain.simulate = [](const std::vector<Pubkey>&) {
    SimulationResult r;
    r.success = false;
    r.error = "custom program error: 0x1e";
    return r;
  };
  auto submitter = Submitter();
  EXPECT_THROW(submitter.Execute(pool, route), SimulationFailed);
  EXPECT_TRUE(chain.sent.empty());
}

TEST_F(SubmitterTest, SimulationAtExactMinimumPasses) {
  ChainPays(route.minimum_output, route.minimum_output);
  auto submitter = Submitter();
  EXPECT_EQ(submitter.Execute(pool, route).status, TransactionState::Confirmed);
}

TEST_F(SubmitterTest, TransientSendErrorsRetryWithBackoff) {
  ChainPays(route.quote.amount_out, route.quote.amount_out);
  chain.send = [this](size_t n) -> std::string {
    if (n < 3) throw RpcTransportError("connection reset");
    chain.SetTokenBalance(output_ata, Key(2), kStartingBalance + route.quote.amount_out);
    return std::string();
  };
  auto submitter = Submitter();
  TransactionReport report = submitter.Execute(pool, route);

  EXPECT_EQ(report.status, TransactionState::Confirmed);
  EXPECT_EQ(report.attempts, 3u);
  EXPECT_EQ(chain.sent.size(), 3u);
  EXPECT_EQ(clock.Sleeps(), (std::vector<int64_t>{500, 1000}));
  // Every attempt after the first uses a fresh blockhash
  EXPECT_EQ(chain.blockhash_calls, 3u);
  EXPECT_EQ(report.actual_output, route.quote.amount_out);
  EXPECT_EQ(report.elapsed_ms, 1500);
}

TEST_F(SubmitterTest, UnconfirmedAttemptsEndTimedOut) {
  ChainPays(route.quote.amount_out, route.quote.amount_out);
  chain.status = [](const std::string&) { return SignatureStatus{SignatureState::NotFound, ""}; };
  auto submitter = Submitter(2000);
  TransactionReport report = submitter.Execute(pool, route);

  EXPECT_EQ(report.status, TransactionState::TimedOut);
  EXPECT_EQ(report.attempts, 3u);
  EXPECT_EQ(chain.sent.size(), 3u);
  EXPECT_NE(report.error.find("not confirmed"), std::string::npos);
  // Distinct transactions, one per blockhash
  std::set<std::vector<uint8_t>> distinct(chain.sent.begin(), chain.sent.end());
  EXPECT_EQ(distinct.size(), 3u);
}

TEST_F(SubmitterTest, LateConfirmationStopsReplacement) {
  ChainPays(route.quote.amount_out, route.quote.amount_out);
  // The first broadcast lands only after its confirmation window closed
  chain.status = [this](const std::string& sig) {
    bool landed = chain.landed.count(sig) != 0 && clock.NowMs() >= 1002500;
    return SignatureStatus{landed ? SignatureState::Confirmed : SignatureState::NotFound, ""};
  };
  auto submitter = Submitter(2000);
  TransactionReport report = submitter.Execute(pool, route);

  EXPECT_EQ(report.status, TransactionState::Confirmed);
  EXPECT_EQ(report.attempts, 2u);
  EXPECT_EQ(chain.sent.size(), 1u);
}

TEST_F(SubmitterTest, PermanentSendErrorFailsWithoutRetry) {
  ChainPays(route.quote.amount_out, route.quote.amount_out);
  chain.send = [](size_t) -> std::string {
    throw RpcResponseError(-32002, "Transaction simulation failed: insufficient funds");
  };
  auto submitter = Submitter();
  TransactionReport report = submitter.Execute(pool, route);

  EXPECT_EQ(report.status, TransactionState::Failed);
  EXPECT_EQ(report.attempts, 1u);
  EXPECT_TRUE(clock.Sleeps().empty());
  EXPECT_NE(report.error.find("insufficient funds"), std::string::npos);
}

TEST_F(SubmitterTest, RejectedCredentialsFailWithoutRetry) {
  ChainPays(route.quote.amount_out, route.quote.amount_out);
  chain.send = [](size_t) -> std::string { throw RpcTransportError("HTTP POST failed status=401", 401); };
  auto submitter = Submitter();
  TransactionReport report = submitter.Execute(pool, route);

  EXPECT_EQ(report.status, TransactionState::Failed);
  EXPECT_EQ(report.attempts, 1u);
  EXPECT_EQ(chain.sent.size(), 1u);
  EXPECT_TRUE(clock.Sleeps().empty());
  EXPECT_NE(report.error.find("401"), std::string::npos);
}

TEST_F(SubmitterTest, OnChainFailureIsFailed) {
  ChainPays(route.quote.amount_out, route.quote.amount_out);
  chain.status = [](const std::string&) { return SignatureStatus{SignatureState::Failed, "InstructionError"}; };
  auto submitter = Submitter();
  TransactionReport report = submitter.Execute(pool, route);
  EXPECT_EQ(report.status, TransactionState::Failed);
  EXPECT_EQ(report.actual_output, 0u);
  EXPECT_NE(report.error.find("InstructionError"), std::string::npos);
}

TEST(RetryBackoffTest, DoublesUpToCap) {
  RetryBackoff backoff(500, 3000, 5);
  EXPECT_EQ(backoff.DelayAfter(0), 0);
  EXPECT_EQ(backoff.DelayAfter(1), 500);
  EXPECT_EQ(backoff.DelayAfter(2), 1000);
  EXPECT_EQ(backoff.DelayAfter(3), 2000);
  EXPECT_EQ(backoff.DelayAfter(4), 3000);
  EXPECT_EQ(backoff.DelayAfter(40), 3000);
  EXPECT_TRUE(backoff.CanRetry(4));
  EXPECT_FALSE(backoff.CanRetry(5));
}

TEST(SwapPlanTest, ConstantProductSwapSequence) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, BuilderOptions{});
  PoolState pool = ConstantProductPool(100, Token(1, 6), Token(2, 6), 1000000000ULL, 2000000000ULL, 25);
  Route route;
  QuoteError err;
  ASSERT_TRUE(QuotePool(pool, Request(pool.token_a, pool.token_b, 1000000), QuoteEngineOptions{}, route.quote, err));
  route.minimum_output = 123;

  SwapPlan plan = builder.Plan(pool, route, Key(7));
  EXPECT_FALSE(plan.wraps_sol);
  ASSERT_EQ(plan.instructions.size(), 4u);
  EXPECT_EQ(plan.instructions[0].program_id, Program(SolanaConstants::COMPUTE_BUDGET_PROGRAM));
  EXPECT_EQ(plan.instructions[1].program_id, Program(SolanaConstants::COMPUTE_BUDGET_PROGRAM));
  EXPECT_EQ(plan.instructions[2].program_id, Program(SolanaConstants::ASSOCIATED_TOKEN_PROGRAM));

  const Instruction& swap = plan.instructions[3];
  EXPECT_EQ(swap.program_id, Program(SolanaConstants::RAYDIUM_AMM_V4));
  ASSERT_EQ(swap.accounts.size(), 8u);
  EXPECT_EQ(swap.accounts[2].pubkey, Program(SolanaConstants::RAYDIUM_AMM_V4_AUTHORITY));
  EXPECT_EQ(swap.accounts[5].pubkey, plan.input_account);
  EXPECT_EQ(swap.accounts[6].pubkey, plan.output_account);
  ASSERT_EQ(swap.data.size(), 17u);
  EXPECT_EQ(swap.data[0], 16);
  EXPECT_EQ(ByteIO::ReadU64(swap.data, 1), 1000000u);
  EXPECT_EQ(ByteIO::ReadU64(swap.data, 9), 123u);
}

TEST(SwapPlanTest, NativeSolInputIsWrappedAndClosed) {
  FakeChainDataSource chain;
  BuilderOptions options;
  options.compute_unit_price = 0;
  SwapBuilder builder(chain, options);
  TokenRef sol{Pubkey::FromBase58(SolanaConstants::WSOL_MINT), 9, "SOL"};
  PoolState pool = ConstantProductPool(100, sol, Token(2, 6), 1000000000000ULL, 2000000000ULL, 25);
  Route route;
  QuoteError err;
  ASSERT_TRUE(QuotePool(pool, Request(sol, pool.token_b, 50000000), QuoteEngineOptions{}, route.quote, err));

  SwapPlan plan = builder.Plan(pool, route, Key(7));
  EXPECT_TRUE(plan.wraps_sol);
  ASSERT_EQ(plan.instructions.size(), 7u);
  const Pubkey token = Program(SolanaConstants::TOKEN_PROGRAM);
  EXPECT_EQ(plan.instructions[0].program_id, Program(SolanaConstants::COMPUTE_BUDGET_PROGRAM));
  EXPECT_EQ(plan.instructions[1].program_id, Program(SolanaConstants::ASSOCIATED_TOKEN_PROGRAM));
  EXPECT_EQ(plan.instructions[2].program_id, Program(SolanaConstants::ASSOCIATED_TOKEN_PROGRAM));
  EXPECT_EQ(plan.instructions[2].accounts[1].pubkey, plan.input_account);
  EXPECT_EQ(plan.instructions[3].program_id, Program(SolanaConstants::SYSTEM_PROGRAM));
  EXPECT_EQ(ByteIO::ReadU64(plan.instructions[3].data, 4), 50000000u);
  EXPECT_EQ(plan.instructions[4].program_id, token);
  EXPECT_EQ(plan.instructions[4].data, (std::vector<uint8_t>{17}));
  EXPECT_EQ(plan.instructions[5].program_id, Program(SolanaConstants::RAYDIUM_AMM_V4));
  EXPECT_EQ(plan.instructions[6].program_id, token);
  EXPECT_EQ(plan.instructions[6].data, (std::vector<uint8_t>{9}));
}

TEST(SwapPlanTest, CpSwapUsesPerSideTokenPrograms) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, BuilderOptions{});
  PoolState pool = ConstantProductPool(100, Token(1, 6), Token(2, 6), 1000000000ULL, 2000000000ULL, 25);
  pool.program = PoolProgram::CpSwap;
  auto& s = std::get<ConstantProductState>(pool.curve);
  s.amm_config = Key(113);
  s.observation = Key(114);
  s.token_program_a = Program(SolanaConstants::TOKEN_PROGRAM);
  s.token_program_b = Program(SolanaConstants::TOKEN_2022_PROGRAM);
  Route route;
  QuoteError err;
  ASSERT_TRUE(QuotePool(pool, Request(pool.token_b, pool.token_a, 1000000), QuoteEngineOptions{}, route.quote, err));

  SwapPlan plan = builder.Plan(pool, route, Key(7));
  EXPECT_EQ(plan.input_account,
            Crypto::AssociatedTokenAddress(Key(7), Key(2), Program(SolanaConstants::TOKEN_2022_PROGRAM)));
  const Instruction& swap = plan.instructions.back();
  EXPECT_EQ(swap.program_id, Program(SolanaConstants::RAYDIUM_CP_SWAP));
  ASSERT_EQ(swap.accounts.size(), 13u);
  EXPECT_EQ(swap.accounts[1].pubkey.ToBase58(), "GpMZbSM2GgvTKHJirzeGfMFoaZ8UR2X7F4v8vHTvxFbL");
  // b -> a: input vault first
  EXPECT_EQ(swap.accounts[6].pubkey, s.vault_b);
  EXPECT_EQ(swap.accounts[8].pubkey, Program(SolanaConstants::TOKEN_2022_PROGRAM));
  EXPECT_EQ(swap.accounts[10].pubkey, Key(2));
  std::vector<uint8_t> disc(swap.data.begin(), swap.data.begin() + 8);
  EXPECT_EQ(disc, (std::vector<uint8_t>{143, 190, 90, 218, 196, 30, 51, 222}));
}

TEST(SwapPlanTest, MismatchedQuoteIsRejected) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, BuilderOptions{});
  PoolState pool = ConstantProductPool(100, Token(1, 6), Token(2, 6), 1000000000ULL, 2000000000ULL, 25);
  Route route;
  QuoteError err;
  ASSERT_TRUE(QuotePool(pool, Request(pool.token_a, pool.token_b, 1000), QuoteEngineOptions{}, route.quote, err));
  route.quote.pool = Key(999);
  EXPECT_THROW(builder.Plan(pool, route, Key(7)), std::invalid_argument);
}

namespace {
  struct WsolSwap {
    TokenRef sol{Pubkey::FromBase58(SolanaConstants::WSOL_MINT), 9, "SOL"};
    PoolState pool = ConstantProductPool(100, sol, Token(2, 6), 1000000000000ULL, 2000000000ULL, 25);
    Route route;
    bool quoted = false;

    WsolSwap() {
      QuoteError err;
      quoted = QuotePool(pool, Request(sol, pool.token_b, 50000000), QuoteEngineOptions{}, route.quote, err);
    }
  };

  BuilderOptions WithoutPriorityFee() {
    BuilderOptions options;
    options.compute_unit_price = 0;
    return options;
  }
}

TEST(SwapPlanTest, ExistingWsolIsToppedUpAndKept) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, WithoutPriorityFee());
  WsolSwap s;
  ASSERT_TRUE(s.quoted);
  ASSERT_EQ(s.route.quote.amount_in, 50000000u);
  Pubkey wsol_account = Crypto::AssociatedTokenAddress(Key(7), s.sol.mint, Program(SolanaConstants::TOKEN_PROGRAM));
  chain.SetTokenBalance(wsol_account, s.sol.mint, 20000000);

  WrappedSolAccount wsol = builder.ReadWrappedSol(Key(7));
  EXPECT_EQ(wsol.address, wsol_account);
  EXPECT_TRUE(wsol.exists);
  EXPECT_EQ(wsol.balance, 20000000u);

  SwapPlan plan = builder.Plan(s.pool, s.route, Key(7), wsol);
  EXPECT_TRUE(plan.wraps_sol);
  EXPECT_FALSE(plan.closes_input);
  EXPECT_EQ(plan.wrapped_lamports, 30000000u);
  // Compute limit, output ATA, transfer, sync, swap; no close
  ASSERT_EQ(plan.instructions.size(), 5u);
  EXPECT_EQ(plan.instructions[2].program_id, Program(SolanaConstants::SYSTEM_PROGRAM));
  EXPECT_EQ(ByteIO::ReadU64(plan.instructions[2].data, 4), 30000000u);
  EXPECT_EQ(plan.instructions[4].program_id, Program(SolanaConstants::RAYDIUM_AMM_V4));
}

TEST(SwapPlanTest, SufficientWsolNeedsNoTransfer) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, WithoutPriorityFee());
  WsolSwap s;
  ASSERT_TRUE(s.quoted);
  WrappedSolAccount wsol;
  wsol.exists = true;
  wsol.balance = 60000000;

  SwapPlan plan = builder.Plan(s.pool, s.route, Key(7), wsol);
  EXPECT_EQ(plan.wrapped_lamports, 0u);
  ASSERT_EQ(plan.instructions.size(), 3u);
  EXPECT_EQ(plan.instructions.back().program_id, Program(SolanaConstants::RAYDIUM_AMM_V4));
}

TEST(SwapPlanTest, MissingWsolAccountReadsAsEmpty) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, BuilderOptions{});
  WrappedSolAccount wsol = builder.ReadWrappedSol(Key(7));
  EXPECT_FALSE(wsol.exists);
  EXPECT_EQ(wsol.balance, 0u);
}

TEST(SwapPlanTest, WrapAndUnwrapPlans) {
  FakeChainDataSource chain;
  SwapBuilder builder(chain, WithoutPriorityFee());
  const Pubkey token = Program(SolanaConstants::TOKEN_PROGRAM);

  SwapPlan wrap = builder.PlanWrap(Key(7), 1500000000);
  EXPECT_FALSE(wrap.is_swap);
  ASSERT_EQ(wrap.instructions.size(), 4u);
  EXPECT_EQ(wrap.instructions[1].program_id, Program(SolanaConstants::ASSOCIATED_TOKEN_PROGRAM));
  EXPECT_EQ(ByteIO::ReadU64(wrap.instructions[2].data, 4), 1500000000u);
  EXPECT_EQ(wrap.instructions[3].data, (std::vector<uint8_t>{17}));
  EXPECT_THROW(builder.PlanWrap(Key(7), 0), std::invalid_argument);

  SwapPlan unwrap = builder.PlanUnwrap(Key(7));
  ASSERT_EQ(unwrap.instructions.size(), 2u);
  EXPECT_EQ(unwrap.instructions[1].program_id, token);
  EXPECT_EQ(unwrap.instructions[1].data, (std::vector<uint8_t>{9}));
  EXPECT_EQ(unwrap.instructions[1].accounts[0].pubkey, unwrap.input_account);
}

TEST_F(SubmitterTest, PlainPlanIsSimulatedThenSent) {
  auto submitter = Submitter();
  TransactionReport report = submitter.Submit(builder.PlanWrap(Key(7), 1000000));
  EXPECT_EQ(report.status, TransactionState::Confirmed);
  EXPECT_EQ(report.attempts, 1u);
  EXPECT_EQ(report.expected_output, 1000000u);
  EXPECT_EQ(chain.simulate_calls, 1u);
  EXPECT_EQ(chain.sent.size(), 1u);

  chain.simulate = [](const std::vector<Pubkey>&) {
    SimulationResult r;
    r.error = "insufficient lamports";
    return r;
  };
  EXPECT_THROW(submitter.Submit(builder.PlanWrap(Key(7), 1000000)), SimulationFailed);
  EXPECT_EQ(chain.sent.size(), 1u);
}
