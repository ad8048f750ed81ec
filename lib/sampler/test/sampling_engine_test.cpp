#include <lib/sampler/src/sampling_engine.h>
#include <lib/util/src/errors.h>

#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>

#include <memory>
#include <set>
#include <sstream>

namespace
{

using procrate::Counter;
using procrate::IoCounter;
using procrate::RawProcessRecord;
using procrate::ReadScope;
using procrate::SamplerConfig;

// What the fake /proc looks like at the next read
struct Script
{
    double uptime{1000.0};
    double time{10.0};
    std::map<pid_t, RawProcessRecord> processes;
    std::set<pid_t> vanishing;  // listed, but gone by the time they are read
    bool enumeration_fails{false};
    int list_calls{0};
};

class ScriptedProvider
{
   public:
    explicit ScriptedProvider(std::shared_ptr<Script> script) : script_{std::move(script)} {}

    double read_uptime() const
    {
        if (script_->enumeration_fails)
        {
            throw procrate::EnumerationFailure("uptime unreadable");
        }
        return script_->uptime;
    }

    std::vector<pid_t> list_processes() const
    {
        ++script_->list_calls;
        std::vector<pid_t> pids;
        for (const auto& entry : script_->processes)
        {
            pids.push_back(entry.first);
        }
        return pids;
    }

    double capture_time() const { return script_->time; }

    std::optional<RawProcessRecord> read_process(pid_t pid, ReadScope scope, double /*uptime*/) const
    {
        auto it = script_->processes.find(pid);
        if (it == script_->processes.end() || script_->vanishing.count(pid) > 0)
        {
            return std::nullopt;
        }
        auto record = it->second;
        if (scope == ReadScope::Full)
        {
            record.details.emplace();
            record.details->comm = "proc" + std::to_string(pid);
            record.details->memory.resident = 10;
            record.details->memory.size = 25;
        }
        return record;
    }

   private:
    std::shared_ptr<Script> script_;
};

using Engine = procrate::SamplingEngine<ScriptedProvider>;

RawProcessRecord record(uint64_t start_time, int64_t utime, int64_t stime)
{
    RawProcessRecord r;
    r.start_time = start_time;
    for (auto& c : r.counters)
    {
        c = 0;
    }
    r.counters[procrate::index_of(Counter::UTime)] = utime;
    r.counters[procrate::index_of(Counter::STime)] = stime;
    return r;
}

class SamplingEngineTest : public ::testing::Test
{
   protected:
    Engine make_engine(SamplerConfig config = {}) { return Engine{config, ScriptedProvider{script}}; }

    std::shared_ptr<Script> script = std::make_shared<Script>();
};

TEST_F(SamplingEngineTest, EndToEnd)
{
    script->time = 10.0;
    script->processes[7] = record(500, 200, 100);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes[7] = record(500, 260, 130);
    auto deltas = engine.sample();

    ASSERT_EQ(deltas.size(), 1);
    const auto& delta = deltas.at(7);
    EXPECT_DOUBLE_EQ(delta.rate(Counter::UTime), 12.0);
    EXPECT_DOUBLE_EQ(delta.rate(Counter::STime), 6.0);
    EXPECT_DOUBLE_EQ(delta.ttime, 18.0);
    EXPECT_EQ(delta.details.comm, "proc7");
}

TEST_F(SamplingEngineTest, SampleBeforeInitialize)
{
    script->processes[7] = record(500, 200, 100);
    auto engine = make_engine();
    EXPECT_FALSE(engine.initialized());
    EXPECT_THROW(engine.sample(), procrate::UninitializedUse);
}

TEST_F(SamplingEngineTest, RollingBaseline)
{
    script->time = 10.0;
    script->processes[7] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes[7] = record(500, 150, 0);
    EXPECT_DOUBLE_EQ(engine.sample().at(7).rate(Counter::UTime), 10.0);

    // diffed against 150 at t=15, not against the initial 100 at t=10
    script->time = 20.0;
    script->processes[7] = record(500, 175, 0);
    EXPECT_DOUBLE_EQ(engine.sample().at(7).rate(Counter::UTime), 5.0);
}

TEST_F(SamplingEngineTest, InitializeAgainStartsOver)
{
    auto stream = std::make_shared<std::ostringstream>();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*stream);
    auto logger = procrate::Logger();
    logger->sinks().push_back(sink);

    script->time = 10.0;
    script->processes[7] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();
    EXPECT_EQ(stream->str().find("already initialized"), std::string::npos);

    script->time = 14.0;
    script->processes[7] = record(500, 140, 0);
    engine.initialize();
    logger->sinks().pop_back();
    EXPECT_NE(stream->str().find("[warning] Engine already initialized"), std::string::npos) << stream->str();
    EXPECT_DOUBLE_EQ(engine.baseline()->timestamp, 14.0);

    // diffed against the second baseline
    script->time = 15.0;
    script->processes[7] = record(500, 150, 0);
    EXPECT_DOUBLE_EQ(engine.sample().at(7).rate(Counter::UTime), 10.0);
}

TEST_F(SamplingEngineTest, BaselineKeepsCountersOnly)
{
    script->processes[7] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();
    script->time = 15.0;
    script->processes[7] = record(500, 150, 0);
    engine.sample();

    const auto& baseline = engine.baseline();
    ASSERT_TRUE(baseline.has_value());
    EXPECT_DOUBLE_EQ(baseline->timestamp, 15.0);
    const auto& stored = baseline->processes.at(7);
    EXPECT_EQ(stored.counters[procrate::index_of(Counter::UTime)], 150);
    EXPECT_FALSE(stored.details.has_value());
}

TEST_F(SamplingEngineTest, FailedSampleKeepsBaseline)
{
    script->time = 10.0;
    script->processes[7] = record(500, 150, 0);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes[7] = record(500, 100, 0);
    EXPECT_THROW(engine.sample(), procrate::IntegrityError);

    script->time = 20.0;
    script->processes[7] = record(500, 250, 0);
    EXPECT_DOUBLE_EQ(engine.sample().at(7).rate(Counter::UTime), 10.0);
}

TEST_F(SamplingEngineTest, ReusedPid)
{
    script->uptime = 60.0;
    script->processes[7] = record(500, 9000, 9000);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes[7] = record(1000, 250, 100);
    auto delta = engine.sample().at(7);
    EXPECT_EQ(delta.identity.start_time, 1000);
    EXPECT_DOUBLE_EQ(delta.rate(Counter::UTime), 5.0);
    EXPECT_DOUBLE_EQ(delta.rate(Counter::STime), 2.0);
}

TEST_F(SamplingEngineTest, NewAndExitedProcesses)
{
    script->uptime = 60.0;
    script->processes[7] = record(500, 100, 0);
    script->processes[8] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes.erase(8);
    script->processes[9] = record(1000, 100, 0);
    auto deltas = engine.sample();
    EXPECT_EQ(deltas.size(), 2);
    EXPECT_EQ(deltas.count(8), 0);
    EXPECT_DOUBLE_EQ(deltas.at(9).rate(Counter::UTime), 2.0);
    EXPECT_EQ(engine.baseline()->processes.count(8), 0);
}

TEST_F(SamplingEngineTest, ProcessVanishesMidScan)
{
    script->processes[7] = record(500, 100, 0);
    script->processes[8] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes[7] = record(500, 150, 0);
    script->vanishing.insert(8);
    auto deltas = engine.sample();
    ASSERT_EQ(deltas.size(), 1);
    EXPECT_DOUBLE_EQ(deltas.at(7).rate(Counter::UTime), 10.0);
}

TEST_F(SamplingEngineTest, EnumerationFailure)
{
    script->enumeration_fails = true;
    auto engine = make_engine();
    EXPECT_THROW(engine.initialize(), procrate::EnumerationFailure);
    EXPECT_FALSE(engine.initialized());
}

TEST_F(SamplingEngineTest, FixedPidList)
{
    script->processes[7] = record(500, 100, 0);
    script->processes[8] = record(500, 100, 0);
    SamplerConfig config;
    config.pids = std::vector<std::string>{"8", "12"};
    auto engine = make_engine(config);
    engine.initialize();

    script->time = 15.0;
    auto deltas = engine.sample();
    ASSERT_EQ(deltas.size(), 1);
    EXPECT_EQ(deltas.count(8), 1);
    EXPECT_EQ(script->list_calls, 0);
}

TEST_F(SamplingEngineTest, InvalidPidList)
{
    SamplerConfig config;
    config.pids = std::vector<std::string>{"8", "init"};
    EXPECT_THROW(make_engine(config), procrate::ConfigurationError);
}

TEST_F(SamplingEngineTest, MemoryConversion)
{
    script->processes[7] = record(500, 100, 0);

    auto pages = make_engine();
    EXPECT_EQ(pages.raw().processes.at(7).details->memory.resident, 10);

    SamplerConfig config;
    config.pages_to_bytes = 4096;
    auto bytes = make_engine(config);
    auto snapshot = bytes.raw();
    EXPECT_EQ(snapshot.processes.at(7).details->memory.resident, 40960);
    EXPECT_EQ(snapshot.processes.at(7).details->memory.size, 25 * 4096);
}

TEST_F(SamplingEngineTest, RawDoesNotTouchBaseline)
{
    script->processes[7] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    script->processes[7] = record(500, 150, 0);
    auto snapshot = engine.raw();
    EXPECT_DOUBLE_EQ(snapshot.timestamp, 15.0);
    EXPECT_DOUBLE_EQ(engine.baseline()->timestamp, 10.0);
    EXPECT_DOUBLE_EQ(engine.sample().at(7).rate(Counter::UTime), 10.0);
}

TEST_F(SamplingEngineTest, IoIsBestEffort)
{
    auto first = record(500, 100, 0);
    first.io[procrate::index_of(IoCounter::ReadBytes)] = 4096;
    script->processes[7] = first;
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    auto second = record(500, 100, 0);
    second.io[procrate::index_of(IoCounter::ReadBytes)] = 4096 + 5 * 1024;
    second.io[procrate::index_of(IoCounter::WriteBytes)] = 1 << 20;
    script->processes[7] = second;
    auto delta = engine.sample().at(7);
    EXPECT_DOUBLE_EQ(delta.rate(IoCounter::ReadBytes), 1024.0);
    EXPECT_DOUBLE_EQ(delta.rate(IoCounter::WriteBytes), 0.0);
}

TEST_F(SamplingEngineTest, MissingCoreCounterIsFatal)
{
    script->processes[7] = record(500, 100, 0);
    auto engine = make_engine();
    engine.initialize();

    script->time = 15.0;
    auto broken = record(500, 150, 0);
    broken.counters[procrate::index_of(Counter::MajFlt)].reset();
    script->processes[7] = broken;
    EXPECT_THROW(engine.sample(), procrate::MissingField);
}

TEST(SamplingEngine, ProcFixture)
{
    SamplerConfig config;
    config.files.path = "lib/procfs/test/resources/proc";
    procrate::SamplingEngine<> engine{config};
    engine.initialize();
    // pid 77 has no stat file and is skipped
    EXPECT_EQ(engine.baseline()->processes.size(), 2);

    auto deltas = engine.sample();
    ASSERT_EQ(deltas.size(), 2);
    // same counters on both reads
    EXPECT_DOUBLE_EQ(deltas.at(1).rate(Counter::UTime), 0.0);
    EXPECT_EQ(deltas.at(1).details.comm, "systemd");
    EXPECT_EQ(deltas.at(42).details.comm, "my (weird) proc");
}

}  // namespace
