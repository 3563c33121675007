#include "lintignore/core/range_manager.hpp"
#include "lintignore/errors.hpp"
#include "lintignore/parsers/directive_matcher.hpp"
#include "support/fake_file_accessor.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <map>
#include <thread>

namespace lintignore {

using ::testing::_;
using ::testing::Return;

class MockCacheStore : public ICacheStore {
public:
    MOCK_METHOD(std::optional<std::string>, load, (const FileIdentity&, const std::string&), (override));
    MOCK_METHOD(bool, save, (const FileIdentity&, const std::string&, const std::string&), (override));
};

// Keeps blobs in memory, keyed like DirectoryCacheStore
class MemoryCacheStore : public ICacheStore {
public:
    auto load(const FileIdentity& file, const std::string& fingerprint)
        -> std::optional<std::string> override {
        auto it = entries_.find(file);
        if (it == entries_.end() || it->second.first != fingerprint) {
            return std::nullopt;
        }
        return it->second.second;
    }

    auto save(const FileIdentity& file, const std::string& fingerprint, const std::string& blob)
        -> bool override {
        entries_[file] = {fingerprint, blob};
        return true;
    }

    auto size() const -> size_t { return entries_.size(); }

private:
    std::map<FileIdentity, std::pair<std::string, std::string>> entries_;
};

class RangeManagerTest : public ::testing::Test {
protected:
    static auto rule(const std::string& analyzer, std::optional<std::string> rule_name = std::nullopt)
        -> RuleId {
        return RuleId{.analyzer = analyzer, .rule = std::move(rule_name)};
    }

    auto at(size_t line) -> Range { return line_range(std::nullopt, line); }

    FakeFileAccessor accessor_;
    DirectiveMatcher matcher_;
    RangeManager manager_{accessor_, nullptr, matcher_};
};

TEST_F(RangeManagerTest, InlineDirectiveWithRuleQualifier)
{
    accessor_.add_sparse_file("a.py", 5, {{5, "x = 1  # ignore flake8(E501)"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(5), rule("flake8", "E501")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(5), rule("flake8", "E302")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(4), rule("flake8", "E501")));
}

TEST_F(RangeManagerTest, BoundedStartStopRegion)
{
    accessor_.add_sparse_file("b.py", 15,
                              {{2, "# start ignoring pylint"}, {10, "# stop ignoring pylint"}});

    EXPECT_TRUE(manager_.is_ignored("b.py", at(7), rule("pylint")));
    EXPECT_FALSE(manager_.is_ignored("b.py", at(12), rule("pylint")));
    EXPECT_FALSE(manager_.is_ignored("b.py", at(7), rule("mypy")));
    EXPECT_FALSE(manager_.is_ignored("b.py", at(1), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("b.py", at(2), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("b.py", at(10), rule("pylint")));
}

TEST_F(RangeManagerTest, LaterQueryFirstStillBoundsRegion)
{
    accessor_.add_sparse_file("b.py", 15,
                              {{2, "# start ignoring pylint"}, {10, "# stop ignoring pylint"}});

    EXPECT_FALSE(manager_.is_ignored("b.py", at(12), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("b.py", at(7), rule("pylint")));
}

TEST_F(RangeManagerTest, OpenRegionExtendsToEndOfFile)
{
    accessor_.add_sparse_file("c.py", 1000, {{1, "# start ignoring all"}});

    EXPECT_TRUE(manager_.is_ignored("c.py", at(1000), rule("anything", "X1")));
    EXPECT_TRUE(manager_.is_ignored("c.py", at(400), rule("mypy")));
}

TEST_F(RangeManagerTest, QueryPastEndOfFileMarksFileComplete)
{
    accessor_.add_sparse_file("c.py", 10, {{1, "# start ignoring all"}});

    EXPECT_TRUE(manager_.is_ignored("c.py", at(5000), rule("mypy")));

    auto state = manager_.snapshot("c.py");
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->complete);
}

TEST_F(RangeManagerTest, FarPastEndQueryReadsFileOnce)
{
    accessor_.add_sparse_file("a.py", 10, {{2, "# start ignoring mypy"}, {6, "# stop ignoring mypy"}});

    EXPECT_FALSE(manager_.is_ignored("a.py", at(400000000), rule("mypy")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(99999999999ULL), rule("pylint")));
    EXPECT_LE(accessor_.lines_read(), 10);
    EXPECT_LE(accessor_.line_requests(), 12);

    auto state = manager_.snapshot("a.py");
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->complete);
    EXPECT_TRUE(manager_.is_ignored("a.py", at(4), rule("mypy")));
}

TEST_F(RangeManagerTest, WholeFileQuery)
{
    accessor_.add_sparse_file("d.py", 30, {{22, "value = 3  # ignore mypy"}});
    accessor_.add_sparse_file("clean.py", 30, {});

    EXPECT_TRUE(manager_.is_ignored("d.py", whole_file_range(), rule("mypy")));
    EXPECT_FALSE(manager_.is_ignored("d.py", whole_file_range(), rule("pylint")));
    EXPECT_FALSE(manager_.is_ignored("clean.py", whole_file_range(), rule("mypy")));
}

TEST_F(RangeManagerTest, WholeFileQueryAnswersFromKnownIntervals)
{
    accessor_.add_sparse_file("d.py", 500, {{3, "# start ignoring pylint"}});

    EXPECT_TRUE(manager_.is_ignored("d.py", at(3), rule("pylint")));
    accessor_.reset_counters();

    EXPECT_TRUE(manager_.is_ignored("d.py", whole_file_range(), rule("pylint")));
    EXPECT_EQ(accessor_.lines_read(), 0);
}

TEST_F(RangeManagerTest, EmptyTargetsSuppressEveryAnalyzer)
{
    accessor_.add_sparse_file("e.py", 20, {{4, "# start ignoring"}, {12, "# stop ignoring"}});

    for (size_t line = 4; line <= 12; ++line) {
        EXPECT_TRUE(manager_.is_ignored("e.py", at(line), rule("flake8", "E501"))) << line;
        EXPECT_TRUE(manager_.is_ignored("e.py", at(line), rule("mypy"))) << line;
    }
    EXPECT_FALSE(manager_.is_ignored("e.py", at(13), rule("mypy")));
}

TEST_F(RangeManagerTest, FileWithoutDirectivesIgnoresNothing)
{
    accessor_.add_sparse_file("clean.py", 50, {{10, "print('ignore me')"}});

    for (size_t line = 1; line <= 50; line += 7) {
        EXPECT_FALSE(manager_.is_ignored("clean.py", at(line), rule("flake8")));
    }
}

TEST_F(RangeManagerTest, RepeatedQueryDoesNotRescan)
{
    accessor_.add_sparse_file("a.py", 40, {{2, "# start ignoring pylint"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(20), rule("pylint")));
    EXPECT_EQ(accessor_.lines_read(), 20);

    EXPECT_TRUE(manager_.is_ignored("a.py", at(20), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(15), rule("pylint")));
    EXPECT_EQ(accessor_.lines_read(), 20);
}

TEST_F(RangeManagerTest, LaterQueryReadsOnlyPastWatermark)
{
    accessor_.add_sparse_file("a.py", 100, {});

    EXPECT_FALSE(manager_.is_ignored("a.py", at(20), rule("mypy")));
    accessor_.reset_counters();

    EXPECT_FALSE(manager_.is_ignored("a.py", at(30), rule("mypy")));
    EXPECT_EQ(accessor_.lines_read(), 10);
}

TEST_F(RangeManagerTest, InlineOnQueriedLineShortCircuits)
{
    accessor_.add_sparse_file("a.py", 100, {{80, "call()  # ignore"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(80), rule("flake8")));
    EXPECT_EQ(accessor_.lines_read(), 1);

    // Answered from the recorded interval
    EXPECT_TRUE(manager_.is_ignored("a.py", at(80), rule("mypy")));
    EXPECT_EQ(accessor_.lines_read(), 1);

    auto state = manager_.snapshot("a.py");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->watermark, 0);
    EXPECT_EQ(state->probed_lines.count(80), 1);
}

TEST_F(RangeManagerTest, ProbedLineIsNotReadAgainByFullScan)
{
    accessor_.add_sparse_file("a.py", 100, {{80, "call()  # ignore mypy"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(80), rule("mypy")));
    accessor_.reset_counters();

    EXPECT_FALSE(manager_.is_ignored("a.py", at(90), rule("mypy")));
    EXPECT_EQ(accessor_.lines_read(), 89);

    auto state = manager_.snapshot("a.py");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->watermark, 90);
    EXPECT_TRUE(state->probed_lines.empty());
    ASSERT_EQ(state->intervals.size(), 1);
    EXPECT_EQ(state->intervals[0].start_line, 80);
}

TEST_F(RangeManagerTest, InlineWinsOverEnclosingRegion)
{
    accessor_.add_sparse_file("a.py", 20, {{2, "# start ignoring pylint"}, {5, "x  # ignore mypy"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(5), rule("mypy")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(5), rule("pylint")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(6), rule("mypy")));
}

TEST_F(RangeManagerTest, IndependentRegionsPerTargetSet)
{
    accessor_.add_sparse_file("a.py", 30,
                              {{2, "# start ignoring pylint"},
                               {4, "# start ignoring mypy"},
                               {8, "# stop ignoring pylint"},
                               {20, "# stop ignoring mypy"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(6), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(6), rule("mypy")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(12), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(12), rule("mypy")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(25), rule("mypy")));
}

TEST_F(RangeManagerTest, StopDiscoveredLaterClosesEarlierStart)
{
    accessor_.add_sparse_file("a.py", 60, {{3, "# start ignoring flake8"}, {40, "# stop ignoring flake8"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(10), rule("flake8")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(50), rule("flake8")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(30), rule("flake8")));

    auto state = manager_.snapshot("a.py");
    ASSERT_TRUE(state.has_value());
    ASSERT_EQ(state->intervals.size(), 1);
    EXPECT_EQ(state->intervals[0].end_line, 40);
}

TEST_F(RangeManagerTest, StopForSomeTargetsKeepsTheOthers)
{
    accessor_.add_sparse_file("a.py", 30,
                              {{2, "# start ignoring pylint flake8"},
                               {10, "# stop ignoring pylint"},
                               {20, "# stop ignoring flake8"}});

    EXPECT_FALSE(manager_.is_ignored("a.py", at(15), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(15), rule("flake8", "E501")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(5), rule("pylint")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(25), rule("flake8")));
    EXPECT_FALSE(manager_.is_ignored("a.py", at(25), rule("pylint")));
}

TEST_F(RangeManagerTest, TrailingCommentWordsDoNotKeepRegionOpen)
{
    accessor_.add_sparse_file("a.py", 20,
                              {{2, "# start ignoring pylint  legacy code"}, {8, "# stop ignoring pylint"}});

    EXPECT_FALSE(manager_.is_ignored("a.py", at(12), rule("pylint")));
    EXPECT_TRUE(manager_.is_ignored("a.py", at(5), rule("pylint")));
}

TEST_F(RangeManagerTest, StopWithoutStartIsHarmless)
{
    accessor_.add_sparse_file("a.py", 10, {{3, "# stop ignoring pylint"}});

    EXPECT_FALSE(manager_.is_ignored("a.py", at(5), rule("pylint")));
}

TEST_F(RangeManagerTest, MultiLineRangeMustFitInsideRegion)
{
    accessor_.add_sparse_file("a.py", 30, {{2, "# start ignoring pylint"}, {10, "# stop ignoring pylint"}});

    auto inside = make_range(std::nullopt, {.line = 4, .column = 1}, {.line = 9, .column = 3});
    auto straddling = make_range(std::nullopt, {.line = 8, .column = 1}, {.line = 14, .column = 3});

    EXPECT_TRUE(manager_.is_ignored("a.py", inside, rule("pylint")));
    EXPECT_FALSE(manager_.is_ignored("a.py", straddling, rule("pylint")));
}

TEST_F(RangeManagerTest, DiagnosticOverload)
{
    accessor_.add_sparse_file("a.py", 5, {{5, "x = 1  # ignore flake8(E501)"}});

    Diagnostic diagnostic{.file = "a.py",
                          .affected_code = make_range("a.py", {.line = 5, .column = 80},
                                                      {.line = 5, .column = 80}),
                          .analyzer = "flake8",
                          .rule = "E501",
                          .severity = "warning",
                          .message = "line too long"};
    EXPECT_TRUE(manager_.is_ignored(diagnostic));

    diagnostic.rule = "E302";
    EXPECT_FALSE(manager_.is_ignored(diagnostic));
}

TEST_F(RangeManagerTest, MissingFileThrowsAndCommitsNothing)
{
    accessor_.add_sparse_file("ok.py", 5, {{2, "# ignore"}});

    EXPECT_THROW(manager_.is_ignored("missing.py", at(3), rule("mypy")), FileAccessError);
    EXPECT_FALSE(manager_.snapshot("missing.py").has_value());
    EXPECT_TRUE(manager_.is_ignored("ok.py", at(2), rule("mypy")));

    auto tracked = manager_.tracked_files();
    ASSERT_EQ(tracked.size(), 1);
    EXPECT_EQ(tracked[0], "ok.py");
}

// Source that fails on one line, to interrupt a scan midway
class FailingAccessor : public IFileAccessor {
public:
    size_t failing_line = 0;

    auto open(const FileIdentity& file) -> std::unique_ptr<ILineSource> override {
        return std::make_unique<Source>(file, failing_line);
    }
    auto fingerprint(const FileIdentity&) -> std::string override { return "fp"; }

private:
    class Source : public ILineSource {
    public:
        Source(FileIdentity file, size_t failing_line) : file_(std::move(file)), failing_line_(failing_line) {}

        auto line(size_t number) -> std::optional<std::string> override {
            if (number == failing_line_) {
                throw FileAccessError(file_, "device error");
            }
            if (number == 1) {
                return "# start ignoring mypy";
            }
            return number <= 50 ? std::optional<std::string>("") : std::nullopt;
        }
        auto line_count() -> size_t override { return 50; }

    private:
        FileIdentity file_;
        size_t failing_line_;
    };
};

TEST_F(RangeManagerTest, ReadErrorMidScanLeavesStateUntouched)
{
    FailingAccessor failing;
    RangeManager manager(failing, nullptr, matcher_);

    EXPECT_TRUE(manager.is_ignored("f.py", at(10), rule("mypy")));

    failing.failing_line = 15;
    EXPECT_THROW(manager.is_ignored("f.py", at(20), rule("mypy")), FileAccessError);

    auto state = manager.snapshot("f.py");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->watermark, 10);

    failing.failing_line = 0;
    EXPECT_TRUE(manager.is_ignored("f.py", at(20), rule("mypy")));
}

TEST_F(RangeManagerTest, InvalidateForgetsFile)
{
    accessor_.add_sparse_file("a.py", 10, {{2, "# ignore"}});
    EXPECT_TRUE(manager_.is_ignored("a.py", at(2), rule("mypy")));

    accessor_.add_sparse_file("a.py", 10, {});
    manager_.invalidate("a.py");

    EXPECT_FALSE(manager_.snapshot("a.py").has_value());
    EXPECT_FALSE(manager_.is_ignored("a.py", at(2), rule("mypy")));
}

TEST_F(RangeManagerTest, SnapshotRoundTripGivesSameAnswers)
{
    accessor_.add_sparse_file("a.py", 60,
                              {{2, "# start ignoring pylint flake8(E501)"},
                               {9, "x = 1  # ignore mypy"},
                               {20, "# stop ignoring flake8(E501) pylint"},
                               {33, "# start ignoring"},
                               {45, "y = 2  # ignore flake8"}});

    MemoryCacheStore cache;
    RangeManager first(accessor_, &cache, matcher_);
    EXPECT_TRUE(first.is_ignored("a.py", at(45), rule("flake8")));
    EXPECT_FALSE(first.is_ignored("a.py", at(25), rule("pylint")));
    EXPECT_EQ(first.persist(), 1);
    EXPECT_EQ(cache.size(), 1);

    RangeManager warm(accessor_, &cache, matcher_);
    RangeManager cold(accessor_, nullptr, matcher_);

    const std::vector<RuleId> rules{rule("pylint"), rule("flake8", "E501"), rule("flake8", "W291"),
                                    rule("mypy")};
    for (size_t line = 1; line <= 60; ++line) {
        for (const auto& rule_id : rules) {
            EXPECT_EQ(warm.is_ignored("a.py", at(line), rule_id),
                      cold.is_ignored("a.py", at(line), rule_id))
                << "line " << line << " analyzer " << rule_id.analyzer;
        }
    }
    EXPECT_EQ(warm.is_ignored("a.py", whole_file_range(), rule("mypy")),
              cold.is_ignored("a.py", whole_file_range(), rule("mypy")));
}

TEST_F(RangeManagerTest, WarmStartSkipsCoveredLines)
{
    accessor_.add_sparse_file("a.py", 60, {{2, "# start ignoring pylint"}});

    MemoryCacheStore cache;
    {
        RangeManager first(accessor_, &cache, matcher_);
        EXPECT_TRUE(first.is_ignored("a.py", at(40), rule("pylint")));
        first.persist();
    }
    accessor_.reset_counters();

    RangeManager warm(accessor_, &cache, matcher_);
    EXPECT_TRUE(warm.is_ignored("a.py", at(30), rule("pylint")));
    EXPECT_EQ(accessor_.lines_read(), 0);
    EXPECT_EQ(accessor_.opens(), 0);
}

TEST_F(RangeManagerTest, CorruptSnapshotFallsBackToScanning)
{
    accessor_.add_sparse_file("a.py", 10, {{2, "# start ignoring pylint"}});

    MockCacheStore cache;
    EXPECT_CALL(cache, load("a.py", _)).WillOnce(Return(std::optional<std::string>("not a snapshot")));

    RangeManager manager(accessor_, &cache, matcher_);
    EXPECT_TRUE(manager.is_ignored("a.py", at(5), rule("pylint")));
    EXPECT_EQ(accessor_.lines_read(), 5);
}

TEST_F(RangeManagerTest, StaleSnapshotIsIgnored)
{
    accessor_.add_sparse_file("a.py", 10, {});

    // A snapshot that claims line 5 is ignored, recorded for other content
    FileSnapshot stale{.fingerprint = "old-content", .watermark = 10, .complete = true};
    stale.intervals.push_back(IgnoreInterval{.origin = DirectiveKind::INLINE, .start_line = 5,
                                             .end_line = 5, .targets = {}});

    MockCacheStore cache;
    EXPECT_CALL(cache, load("a.py", _)).WillOnce(Return(serialize_snapshot(stale)));

    RangeManager manager(accessor_, &cache, matcher_);
    EXPECT_FALSE(manager.is_ignored("a.py", at(5), rule("mypy")));
}

TEST_F(RangeManagerTest, PersistSavesEveryResolvedFile)
{
    accessor_.add_sparse_file("a.py", 10, {});
    accessor_.add_sparse_file("b.py", 10, {{1, "# ignore"}});

    MockCacheStore cache;
    EXPECT_CALL(cache, load(_, _)).WillRepeatedly(Return(std::nullopt));
    EXPECT_CALL(cache, save("a.py", accessor_.fingerprint("a.py"), _)).WillOnce(Return(true));
    EXPECT_CALL(cache, save("b.py", accessor_.fingerprint("b.py"), _)).WillOnce(Return(false));

    RangeManager manager(accessor_, &cache, matcher_);
    manager.is_ignored("a.py", at(3), rule("mypy"));
    manager.is_ignored("b.py", at(1), rule("mypy"));

    EXPECT_EQ(manager.persist(), 1);
}

TEST_F(RangeManagerTest, NoFingerprintWithoutCache)
{
    accessor_.add_sparse_file("a.py", 100, {{3, "x = 1  # ignore mypy"}});

    EXPECT_TRUE(manager_.is_ignored("a.py", at(3), rule("mypy")));
    EXPECT_EQ(accessor_.fingerprints(), 0);
    EXPECT_EQ(accessor_.lines_read(), 1);

    MemoryCacheStore cache;
    RangeManager cached(accessor_, &cache, matcher_);
    EXPECT_TRUE(cached.is_ignored("a.py", at(3), rule("mypy")));
    EXPECT_EQ(accessor_.fingerprints(), 1);
}

TEST_F(RangeManagerTest, PersistWithoutCacheIsANoOp)
{
    accessor_.add_sparse_file("a.py", 10, {});
    manager_.is_ignored("a.py", at(3), rule("mypy"));

    EXPECT_EQ(manager_.persist(), 0);
}

TEST_F(RangeManagerTest, ConcurrentQueriesAgree)
{
    constexpr size_t kFiles = 4;
    constexpr size_t kLines = 200;
    for (size_t i = 0; i < kFiles; ++i) {
        accessor_.add_sparse_file("f" + std::to_string(i) + ".py", kLines,
                                  {{10, "# start ignoring pylint"}, {100, "# stop ignoring pylint"}});
    }

    std::atomic<size_t> mismatches{0};
    std::vector<std::thread> workers;
    for (size_t worker = 0; worker < 8; ++worker) {
        workers.emplace_back([&, worker] {
            for (size_t step = 0; step < kLines; ++step) {
                size_t line = (step * 37 + worker * 11) % kLines + 1;
                auto file = "f" + std::to_string((worker + step) % kFiles) + ".py";
                bool expected = line >= 10 && line <= 100;
                if (manager_.is_ignored(file, at(line), rule("pylint")) != expected) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(manager_.tracked_files().size(), kFiles);
}

} // namespace lintignore
