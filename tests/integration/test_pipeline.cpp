/**
 * @file  test_pipeline.cpp
 * @brief End-to-end: price files → pair discovery → whitelist → walk-forward
 *        → CSV artifacts.
 *
 * The synthetic universe is written to disk as `<TICKER>_dsf_1y.csv` files
 * and read back through CsvPriceLoader, so the test exercises the same path
 * as the command-line driver.
 */

#include <gtest/gtest.h>
#include "statarb/pair_discovery.hpp"
#include "statarb/pair_filters.hpp"
#include "statarb/price_loader.hpp"
#include "statarb/report.hpp"
#include "statarb/walk_forward.hpp"
#include "fixtures.hpp"

#include <fmt/format.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace statarb;
using namespace statarb::backtest;
using namespace statarb::testing;
namespace fs = std::filesystem;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / "statarb_pipeline";
        fs::remove_all(root_);
        fs::create_directories(data_dir());

        series_ = three_ticker_universe(200);
        for (const auto& s : series_) {
            std::string csv = "date,permno,prc,vol\n";
            for (std::size_t i = 0; i < s.size(); ++i) {
                csv += fmt::format("{},1,{},1000\n",
                                   s.dates[i].to_string(), std::exp(s.log_prices[i]));
            }
            std::ofstream(data_dir() / (s.ticker + CsvPriceLoader::FILE_SUFFIX)) << csv;
        }
    }

    void TearDown() override { fs::remove_all(root_); }

    fs::path data_dir() const { return root_ / "data"; }
    fs::path out_dir()  const { return root_ / "out"; }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static std::size_t line_count(const std::string& s) {
        std::size_t n = 0;
        for (char c : s) n += (c == '\n');
        return n;
    }

    static WalkForwardConfig config() {
        WalkForwardConfig cfg;
        cfg.start           = Date::from_ymd(2020, 1, 1);
        cfg.end             = Date::from_ymd(2020, 12, 31);
        cfg.formation       = 120;
        cfg.trade           = 20;
        cfg.signal.lookback = 20;
        return cfg;
    }

    fs::path                 root_;
    std::vector<PriceSeries> series_;
};

}  // namespace

TEST_F(PipelineTest, LoaderRecoversWrittenSeries) {
    const CsvPriceLoader loader(data_dir());
    EXPECT_EQ(loader.discover_tickers(), (std::vector<std::string>{"AAA", "BBB", "CCC"}));

    const auto cfg      = config();
    const auto universe = load_universe(loader, loader.discover_tickers(), cfg.start, cfg.end);
    ASSERT_EQ(universe.size(), 3u);
    for (const auto& s : series_) {
        const auto& loaded = universe.at(s.ticker);
        ASSERT_EQ(loaded.dates, s.dates);
        for (std::size_t i = 0; i < s.size(); ++i) {
            EXPECT_NEAR(loaded.log_prices[i], s.log_prices[i], 1e-12);
        }
    }
}

TEST_F(PipelineTest, DiscoveryFeedsWalkForward) {
    const auto cfg = config();
    const CsvPriceLoader loader(data_dir());
    const auto universe = load_universe(loader, loader.discover_tickers(), cfg.start, cfg.end);

    // Discovery: only the cointegrated pair clears the whitelist cut.
    const auto scores = scan_cointegration(universe, cfg.start, cfg.end);
    ASSERT_EQ(scores.size(), 3u);
    EXPECT_EQ(scores.front().ticker1, "AAA");
    EXPECT_EQ(scores.front().ticker2, "BBB");
    EXPECT_LT(scores.front().pvalue, 1e-8);

    const fs::path pairs_path = out_dir() / report::PAIRS_FILE;
    report::write_text_file(pairs_path, report::pairs_csv(scores));
    auto whitelist = PairWhitelist::load_csv(pairs_path, cfg.screener.pval_max);
    ASSERT_TRUE(whitelist.has_value());
    EXPECT_EQ(whitelist->size(), 1u);
    EXPECT_TRUE(whitelist->contains("BBB", "AAA"));

    // Walk-forward restricted to the whitelist.
    const WalkForwardEngine engine(cfg, std::move(whitelist));
    const auto res = engine.run(universe);

    ASSERT_EQ(res.cycles.size(), 4u);
    EXPECT_EQ(res.pairs_selected, 4u);
    EXPECT_EQ(res.pnl.size(), 80u);
    EXPECT_EQ(res.equity.size(), res.pnl.size());
    for (const auto& cyc : res.cycles) {
        EXPECT_EQ(cyc.rejections.at(screen::RejectReason::NotWhitelisted), 2u);
    }
    const auto it = res.pair_stats.find(TickerPair{"AAA", "BBB"});
    ASSERT_NE(it, res.pair_stats.end());
    EXPECT_EQ(it->second.cycles, 4u);

    // Artifacts.
    const auto paths = report::write_walk_forward(out_dir(), cfg, res);
    ASSERT_EQ(paths.size(), 3u);

    const std::string equity = read_file(out_dir() / report::EQUITY_FILE);
    EXPECT_EQ(equity.rfind("date,portfolio_ret,equity\n", 0), 0u);
    EXPECT_EQ(line_count(equity), 81u);

    const std::string summary = read_file(out_dir() / report::SUMMARY_FILE);
    EXPECT_EQ(line_count(summary), 2u);
    EXPECT_NE(summary.find(",80,4,4\n"), std::string::npos) << summary;

    const std::string stats = read_file(out_dir() / report::PAIR_STATS_FILE);
    EXPECT_EQ(stats.rfind("t1,t2,ret_sum,ret_cnt,cycles\nAAA,BBB,", 0), 0u) << stats;
}

TEST_F(PipelineTest, MissingTickerIsSkipped) {
    const auto cfg = config();
    const CsvPriceLoader loader(data_dir());
    const auto universe = load_universe(loader, {"AAA", "ZZZ", "BBB"}, cfg.start, cfg.end);
    EXPECT_EQ(universe.size(), 2u);
    EXPECT_EQ(universe.count("ZZZ"), 0u);
}
