#include <gtest/gtest.h>
#include "statarb/errors.hpp"
#include "statarb/price_loader.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

using namespace statarb;
namespace fs = std::filesystem;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("statarb_" + name)) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

    void write(const std::string& file, const std::string& content) const {
        std::ofstream out(path_ / file);
        out << content;
    }

private:
    fs::path path_;
};

/// In-memory loader; tickers absent from the map are Missing-Data.
class MapLoader final : public PriceLoader {
public:
    explicit MapLoader(std::map<std::string, PriceSeries> data) : data_(std::move(data)) {}

    PriceSeries load(const std::string& ticker, Date start, Date end) const override {
        const auto it = data_.find(ticker);
        if (it == data_.end()) {
            throw StatArbError(ErrorKind::MissingData, "no data for " + ticker);
        }
        return it->second.slice(start, end);
    }

private:
    std::map<std::string, PriceSeries> data_;
};

}  // namespace

// ─── parse_price_csv ─────────────────────────────────────────────────────────

TEST(ParsePriceCsv, ParsesLogPricesSorted) {
    const std::string csv =
        "date,permno,prc,vol\n"
        "2024-01-03,1,110.0,100\n"
        "2024-01-02,1,100.0,100\n";
    const auto s = parse_price_csv(csv, "AAA");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.ticker, "AAA");
    EXPECT_EQ(s.dates[0], Date::from_ymd(2024, 1, 2));
    EXPECT_EQ(s.dates[1], Date::from_ymd(2024, 1, 3));
    EXPECT_DOUBLE_EQ(s.log_prices[0], std::log(100.0));
    EXPECT_DOUBLE_EQ(s.log_prices[1], std::log(110.0));
}

TEST(ParsePriceCsv, ColumnOrderAndCaseIgnored) {
    const std::string csv =
        "PRC,Date\n"
        "50,2024-02-01\n";
    const auto s = parse_price_csv(csv, "X");
    ASSERT_EQ(s.size(), 1u);
    EXPECT_DOUBLE_EQ(s.log_prices[0], std::log(50.0));
}

TEST(ParsePriceCsv, DropsBadRows) {
    const std::string csv =
        "date,prc\n"
        "2024-01-02,100\n"
        "not-a-date,100\n"
        "2024-01-03,\n"
        "2024-01-04,-5\n"
        "2024-01-05,0\n"
        "2024-01-08,nan\n"
        "2024-01-09,inf\n"
        "2024-01-10,12abc\n"
        "2024-01-11,101\n";
    const auto s = parse_price_csv(csv, "X");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.dates[0], Date::from_ymd(2024, 1, 2));
    EXPECT_EQ(s.dates[1], Date::from_ymd(2024, 1, 11));
}

TEST(ParsePriceCsv, DuplicateDatesKeepFirst) {
    const std::string csv =
        "date,prc\n"
        "2024-01-02,100\n"
        "2024-01-02,200\n";
    const auto s = parse_price_csv(csv, "X");
    ASSERT_EQ(s.size(), 1u);
    EXPECT_DOUBLE_EQ(s.log_prices[0], std::log(100.0));
}

TEST(ParsePriceCsv, MissingColumnsYieldEmpty) {
    EXPECT_TRUE(parse_price_csv("date,close\n2024-01-02,1\n", "X").empty());
    EXPECT_TRUE(parse_price_csv("", "X").empty());
}

TEST(ParsePriceCsv, WindowsLineEndings) {
    const auto s = parse_price_csv("date,prc\r\n2024-01-02,10\r\n", "X");
    ASSERT_EQ(s.size(), 1u);
}

// ─── canonicalize ────────────────────────────────────────────────────────────

TEST(Canonicalize, SortsDedupesAndDropsNonFinite) {
    PriceSeries s{
        .ticker     = "X",
        .dates      = {Date{3}, Date{1}, Date{2}, Date{1}},
        .log_prices = {3.0, 1.0, NAN, 9.0},
    };
    canonicalize(s);
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.dates[0], Date{1});
    EXPECT_DOUBLE_EQ(s.log_prices[0], 1.0);
    EXPECT_EQ(s.dates[1], Date{3});
}

// ─── CsvPriceLoader ──────────────────────────────────────────────────────────

TEST(CsvPriceLoader, LoadsAndRestrictsRange) {
    TempDir dir("loader_range");
    dir.write("AAA_dsf_1y.csv",
              "date,prc\n2024-01-02,10\n2024-01-03,11\n2024-01-04,12\n");
    CsvPriceLoader loader(dir.path());

    const auto s = loader.load("AAA", Date::from_ymd(2024, 1, 3), Date::from_ymd(2024, 1, 31));
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.dates.front(), Date::from_ymd(2024, 1, 3));
}

TEST(CsvPriceLoader, MissingFileThrowsMissingDataNamingPath) {
    TempDir dir("loader_missing");
    CsvPriceLoader loader(dir.path());
    try {
        (void)loader.load("ZZZ", Date::from_ymd(2024, 1, 1), Date::from_ymd(2024, 12, 31));
        FAIL() << "expected StatArbError";
    } catch (const StatArbError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::MissingData);
        const std::string msg = ex.what();
        EXPECT_NE(msg.find("ZZZ_dsf_1y.csv"), std::string::npos);
        EXPECT_NE(msg.find("2024-01-01"), std::string::npos);
        EXPECT_NE(msg.find("2024-12-31"), std::string::npos);
    }
}

TEST(CsvPriceLoader, DiscoverTickersSorted) {
    TempDir dir("loader_discover");
    dir.write("MSFT_dsf_1y.csv", "date,prc\n");
    dir.write("AAPL_dsf_1y.csv", "date,prc\n");
    dir.write("notes.txt", "x");
    CsvPriceLoader loader(dir.path());

    const auto tickers = loader.discover_tickers();
    ASSERT_EQ(tickers.size(), 2u);
    EXPECT_EQ(tickers[0], "AAPL");
    EXPECT_EQ(tickers[1], "MSFT");
}

TEST(CsvPriceLoader, DiscoverInMissingDirectoryIsEmpty) {
    CsvPriceLoader loader(fs::temp_directory_path() / "statarb_does_not_exist_dir");
    EXPECT_TRUE(loader.discover_tickers().empty());
}

// ─── load_universe ───────────────────────────────────────────────────────────

TEST(LoadUniverse, SkipsMissingAndEmptyTickers) {
    PriceSeries a{.ticker = "A", .dates = {Date{10}, Date{11}}, .log_prices = {1.0, 1.1}};
    PriceSeries late{.ticker = "L", .dates = {Date{500}}, .log_prices = {2.0}};
    MapLoader loader({{"A", a}, {"L", late}});

    const auto u = load_universe(loader, {"A", "L", "MISSING"}, Date{0}, Date{100});
    ASSERT_EQ(u.size(), 1u);
    EXPECT_EQ(u.count("A"), 1u);
}

TEST(LoadUniverse, NothingUsableIsFatal) {
    MapLoader loader({});
    try {
        (void)load_universe(loader, {"X", "Y"}, Date{0}, Date{100});
        FAIL() << "expected StatArbError";
    } catch (const StatArbError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::MissingData);
    }
}
