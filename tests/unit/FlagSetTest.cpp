/**
 * @file FlagSetTest.cpp
 * @brief Unit tests for the flag registry
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <structflag/flag/FlagSet.hpp>

using namespace StructFlag;
using namespace std::chrono_literals;

class FlagSetTest : public ::testing::Test {
  protected:
    void SetUp() override {
        flags_ = std::make_unique<FlagSet>("test");
        flags_->setOutput(out_);

        ASSERT_TRUE(flags_->boolVar(&verbose_, "verbose", false, "enable logging", ec_));
        ASSERT_TRUE(flags_->boolVar(&x_, "x", true, "short bool", ec_));
        ASSERT_TRUE(flags_->intVar(&n_, "n", 5, "count", ec_));
        ASSERT_TRUE(flags_->int64Var(&big_, "big", 0, "big number", ec_));
        ASSERT_TRUE(flags_->uintVar(&workers_, "workers", 4, "worker count", ec_));
        ASSERT_TRUE(flags_->uint64Var(&limit_, "limit", 0, "byte limit", ec_));
        ASSERT_TRUE(flags_->float64Var(&ratio_, "ratio", 0.5, "sample ratio", ec_));
        ASSERT_TRUE(flags_->durationVar(&timeout_, "timeout", Duration::zero(), "timeout", ec_));
        ASSERT_TRUE(flags_->stringVar(&name_, "name", "bob", "a `user` name", ec_));
    }

    std::ostringstream out_;
    std::error_code ec_;
    std::unique_ptr<FlagSet> flags_;

    bool verbose_ = true;
    bool x_ = false;
    int n_ = 0;
    int64_t big_ = 1;
    unsigned workers_ = 0;
    uint64_t limit_ = 1;
    double ratio_ = 0;
    Duration timeout_{1};
    std::string name_;
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(FlagSetTest, RegistrationStoresDefaults) {
    EXPECT_FALSE(verbose_);
    EXPECT_TRUE(x_);
    EXPECT_EQ(n_, 5);
    EXPECT_EQ(big_, 0);
    EXPECT_EQ(workers_, 4u);
    EXPECT_EQ(limit_, 0u);
    EXPECT_DOUBLE_EQ(ratio_, 0.5);
    EXPECT_EQ(timeout_, Duration::zero());
    EXPECT_EQ(name_, "bob");
}

TEST_F(FlagSetTest, LookupReportsDefaults) {
    const Flag* flag = flags_->lookup("name");
    ASSERT_NE(flag, nullptr);
    EXPECT_EQ(flag->name, "name");
    EXPECT_EQ(flag->usage, "a `user` name");
    EXPECT_EQ(flag->defValue, "bob");
    EXPECT_EQ(flags_->lookup("ratio")->defValue, "0.5");
    EXPECT_EQ(flags_->lookup("timeout")->defValue, "0s");
    EXPECT_EQ(flags_->lookup("missing"), nullptr);
}

TEST_F(FlagSetTest, DuplicateNameRejected) {
    int other = 7;
    EXPECT_FALSE(flags_->intVar(&other, "n", 1, "again", ec_));
    EXPECT_EQ(ec_, std::errc::file_exists);
    EXPECT_EQ(n_, 5);
    EXPECT_NE(out_.str().find("test flag redefined: n"), std::string::npos);
    EXPECT_EQ(flags_->lookup("n")->usage, "count");
}

TEST_F(FlagSetTest, InvalidNamesRejected) {
    int v = 0;
    for (const char* name : {"", "-dash", "a=b"}) {
        EXPECT_FALSE(flags_->intVar(&v, name, 1, "", ec_)) << name;
        EXPECT_EQ(ec_, std::errc::invalid_argument) << name;
    }
    EXPECT_FALSE(FlagSet::isValidName("=x"));
    EXPECT_TRUE(FlagSet::isValidName("db-port"));
}

// =============================================================================
// Parsing
// =============================================================================

TEST_F(FlagSetTest, NoArguments) {
    EXPECT_FALSE(flags_->parsed());
    ASSERT_TRUE(flags_->parse(std::vector<std::string>{}, ec_));
    EXPECT_TRUE(flags_->parsed());
    EXPECT_EQ(flags_->nFlag(), 0u);
    EXPECT_EQ(flags_->nArg(), 0u);
    EXPECT_EQ(n_, 5);
}

TEST_F(FlagSetTest, EveryValueSyntax) {
    std::vector<std::string> args = {"-verbose",     "--n=42",        "-big",  "-9000000000",
                                     "--workers",    "8",             "-limit=18446744073709551615",
                                     "-ratio=1e-3",  "-timeout=1m30s", "-name", "alice smith"};
    ASSERT_TRUE(flags_->parse(args, ec_)) << ec_.message() << "\n" << out_.str();

    EXPECT_TRUE(verbose_);
    EXPECT_EQ(n_, 42);
    EXPECT_EQ(big_, -9000000000);
    EXPECT_EQ(workers_, 8u);
    EXPECT_EQ(limit_, UINT64_MAX);
    EXPECT_DOUBLE_EQ(ratio_, 0.001);
    EXPECT_EQ(timeout_, 90s);
    EXPECT_EQ(name_, "alice smith");
    EXPECT_EQ(flags_->nFlag(), 8u);
}

TEST_F(FlagSetTest, BoolFlagForms) {
    ASSERT_TRUE(flags_->parse({"-x=false", "--verbose=T"}, ec_));
    EXPECT_FALSE(x_);
    EXPECT_TRUE(verbose_);
}

TEST_F(FlagSetTest, BoolFlagDoesNotConsumeNextArgument) {
    ASSERT_TRUE(flags_->parse({"-verbose", "false"}, ec_));
    EXPECT_TRUE(verbose_);
    ASSERT_EQ(flags_->nArg(), 1u);
    EXPECT_EQ(flags_->arg(0), "false");
}

TEST_F(FlagSetTest, StopsAtFirstNonFlag) {
    ASSERT_TRUE(flags_->parse({"-n=1", "input.txt", "-n=2"}, ec_));
    EXPECT_EQ(n_, 1);
    EXPECT_EQ(flags_->args(), (std::vector<std::string>{"input.txt", "-n=2"}));
    EXPECT_EQ(flags_->arg(1), "-n=2");
    EXPECT_EQ(flags_->arg(2), "");
}

TEST_F(FlagSetTest, DoubleDashTerminates) {
    ASSERT_TRUE(flags_->parse({"-n=1", "--", "-n=2"}, ec_));
    EXPECT_EQ(n_, 1);
    EXPECT_EQ(flags_->args(), (std::vector<std::string>{"-n=2"}));
}

TEST_F(FlagSetTest, SingleDashIsAnArgument) {
    ASSERT_TRUE(flags_->parse({"-", "-n=2"}, ec_));
    EXPECT_EQ(n_, 5);
    EXPECT_EQ(flags_->nArg(), 2u);
}

TEST_F(FlagSetTest, EmptyStringValue) {
    ASSERT_TRUE(flags_->parse({"-name="}, ec_));
    EXPECT_EQ(name_, "");
    EXPECT_TRUE(flags_->isSet("name"));
}

TEST_F(FlagSetTest, ParseArgvSkipsProgramName) {
    std::vector<std::string> storage = {"prog", "-n", "3", "rest"};
    std::vector<char*> argv;
    for (auto& s : storage)
        argv.push_back(s.data());

    ASSERT_TRUE(flags_->parse(static_cast<int>(argv.size()), argv.data(), ec_));
    EXPECT_EQ(n_, 3);
    EXPECT_EQ(flags_->args(), (std::vector<std::string>{"rest"}));
}

// =============================================================================
// Parse Errors
// =============================================================================

TEST_F(FlagSetTest, UndefinedFlag) {
    EXPECT_FALSE(flags_->parse({"-nope"}, ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);
    EXPECT_NE(out_.str().find("flag provided but not defined: -nope"), std::string::npos);
    EXPECT_NE(out_.str().find("Usage of test:"), std::string::npos);
}

TEST_F(FlagSetTest, HelpRequested) {
    EXPECT_FALSE(flags_->parse({"-help"}, ec_));
    EXPECT_EQ(ec_, std::errc::operation_canceled);
    EXPECT_NE(out_.str().find("Usage of test:"), std::string::npos);

    EXPECT_FALSE(flags_->parse({"-h"}, ec_));
    EXPECT_EQ(ec_, std::errc::operation_canceled);
}

TEST_F(FlagSetTest, BadSyntax) {
    for (const char* arg : {"---n", "-=1", "--=1"}) {
        EXPECT_FALSE(flags_->parse({arg}, ec_)) << arg;
        EXPECT_EQ(ec_, std::errc::invalid_argument) << arg;
    }
    EXPECT_NE(out_.str().find("bad flag syntax: ---n"), std::string::npos);
}

TEST_F(FlagSetTest, MissingValue) {
    EXPECT_FALSE(flags_->parse({"-n"}, ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);
    EXPECT_NE(out_.str().find("flag needs an argument: -n"), std::string::npos);
}

TEST_F(FlagSetTest, InvalidValues) {
    EXPECT_FALSE(flags_->parse({"-n=abc"}, ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);
    EXPECT_NE(out_.str().find("invalid value \"abc\" for flag -n: parse error"),
              std::string::npos);
    EXPECT_EQ(n_, 5);

    EXPECT_FALSE(flags_->parse({"-timeout=5"}, ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);

    EXPECT_FALSE(flags_->parse({"-verbose=maybe"}, ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);
    EXPECT_NE(out_.str().find("invalid boolean value \"maybe\" for -verbose"), std::string::npos);
}

TEST_F(FlagSetTest, OutOfRangeValue) {
    EXPECT_FALSE(flags_->parse({"-n=3000000000"}, ec_));
    EXPECT_EQ(ec_, std::errc::result_out_of_range);
    EXPECT_NE(out_.str().find("value out of range"), std::string::npos);
}

TEST_F(FlagSetTest, CustomUsage) {
    int calls = 0;
    flags_->setUsage([&calls]() { ++calls; });
    EXPECT_FALSE(flags_->parse({"-nope"}, ec_));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(out_.str().find("Usage of"), std::string::npos);
}

// =============================================================================
// Inspection
// =============================================================================

TEST_F(FlagSetTest, SetMarksFlag) {
    EXPECT_FALSE(flags_->isSet("n"));
    ASSERT_TRUE(flags_->set("n", "11", ec_));
    EXPECT_EQ(n_, 11);
    EXPECT_TRUE(flags_->isSet("n"));
    EXPECT_EQ(flags_->lookup("n")->value->toString(), "11");
    EXPECT_EQ(flags_->lookup("n")->defValue, "5");

    EXPECT_FALSE(flags_->set("missing", "1", ec_));
    EXPECT_EQ(ec_, std::errc::invalid_argument);
    EXPECT_FALSE(flags_->set("n", "x", ec_));
    EXPECT_EQ(n_, 11);
}

TEST_F(FlagSetTest, VisitOrder) {
    ASSERT_TRUE(flags_->parse({"-x", "-n=1", "-big=2"}, ec_));

    std::vector<std::string> all;
    flags_->visitAll([&all](const Flag& f) { all.push_back(f.name); });
    EXPECT_EQ(all, (std::vector<std::string>{"big", "limit", "n", "name", "ratio", "timeout",
                                             "verbose", "workers", "x"}));

    std::vector<std::string> set;
    flags_->visit([&set](const Flag& f) { set.push_back(f.name); });
    EXPECT_EQ(set, (std::vector<std::string>{"big", "n", "x"}));
}

TEST(FlagSetDefaultsTest, PrintDefaultsLayout) {
    FlagSet flags("app");
    std::error_code ec;
    bool verbose = false;
    bool x = false;
    int n = 0;
    std::string name;
    std::string empty;
    Duration timeout{};

    ASSERT_TRUE(flags.boolVar(&verbose, "verbose", false, "enable logging", ec));
    ASSERT_TRUE(flags.boolVar(&x, "x", true, "short", ec));
    ASSERT_TRUE(flags.intVar(&n, "n", 5, "count\nof things", ec));
    ASSERT_TRUE(flags.stringVar(&name, "name", "bob", "a `user` name", ec));
    ASSERT_TRUE(flags.stringVar(&empty, "path", "", "a path", ec));
    ASSERT_TRUE(flags.durationVar(&timeout, "timeout", 30s, "request timeout", ec));

    std::ostringstream os;
    flags.printDefaults(os);
    EXPECT_EQ(os.str(), "  -n int\n"
                        "    \tcount\n"
                        "    \tof things (default 5)\n"
                        "  -name user\n"
                        "    \ta user name (default \"bob\")\n"
                        "  -path string\n"
                        "    \ta path\n"
                        "  -timeout duration\n"
                        "    \trequest timeout (default 30s)\n"
                        "  -verbose\n"
                        "    \tenable logging\n"
                        "  -x\tshort (default true)\n");
}

// =============================================================================
// Custom Values
// =============================================================================

namespace {

/// Comma-separated list, appended on every occurrence
class ListValue : public FlagValue {
  public:
    explicit ListValue(std::vector<std::string>* items) : items_(items) {}

    std::string toString() const override {
        std::string out;
        for (size_t i = 0; i < items_->size(); ++i)
            out += (i ? "," : "") + (*items_)[i];
        return out;
    }

    bool set(const std::string& s, std::error_code& ec) override {
        ec.clear();
        items_->push_back(s);
        return true;
    }

    const char* typeName() const override { return "list"; }
    std::string zeroString() const override { return ""; }

  private:
    std::vector<std::string>* items_;
};

} // namespace

TEST(FlagSetCustomValueTest, VarAcceptsAnyFlagValue) {
    FlagSet flags("custom");
    std::error_code ec;
    std::vector<std::string> tags;

    ASSERT_TRUE(flags.var(std::make_unique<ListValue>(&tags), "tag", "repeatable tag", ec));
    ASSERT_TRUE(flags.parse({"-tag=a", "-tag", "b"}, ec));
    EXPECT_EQ(tags, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(flags.lookup("tag")->value->toString(), "a,b");

    EXPECT_FALSE(flags.var(nullptr, "empty", "", ec));
    EXPECT_EQ(ec, std::errc::invalid_argument);
}
