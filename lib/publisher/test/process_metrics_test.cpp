#include <lib/publisher/src/process_metrics.h>

#include <spectator/registry.h>
#include <libs/writer/writer_wrapper/writer_test_helper.h>

#include <gtest/gtest.h>

#include <absl/strings/str_split.h>

#include <set>

namespace
{

using procrate::Counter;
using procrate::DeltaMap;
using procrate::DeltaRecord;
using procrate::IoCounter;
using procrate::ProcessMetrics;

// A published line looks like "g,60:proc.cpu,cmd=nginx,id=user,pid=7:12.000000\n"
// with tags in no particular order
struct Published
{
    std::string name;
    std::set<std::string> tags;
    std::string value;
};

std::vector<Published> parse_messages(const std::vector<std::string>& messages)
{
    std::vector<Published> result;
    for (const auto& msg : messages)
    {
        auto first = msg.find(':');
        auto last = msg.rfind(':');
        std::vector<std::string> id = absl::StrSplit(msg.substr(first + 1, last - first - 1), ',');
        Published p;
        p.name = id.front();
        p.tags.insert(id.begin() + 1, id.end());
        p.value = msg.substr(last + 1);
        result.push_back(std::move(p));
    }
    return result;
}

std::string value_of(const std::vector<Published>& published, const std::string& name,
                     std::set<std::string> tags)
{
    for (const auto& p : published)
    {
        if (p.name == name && p.tags == tags)
        {
            return p.value;
        }
    }
    return "not found";
}

DeltaRecord nginx()
{
    DeltaRecord d;
    d.identity = {7, 500};
    d.details.comm = "nginx";
    d.rates[procrate::index_of(Counter::UTime)] = 12.0;
    d.rates[procrate::index_of(Counter::STime)] = 6.0;
    d.rates[procrate::index_of(Counter::MinFlt)] = 3.5;
    d.ttime = 18.0;
    d.io_rates[procrate::index_of(IoCounter::RChar)] = 1024.0;
    d.io_rates[procrate::index_of(IoCounter::SyscW)] = 2.25;
    d.details.memory.resident = 40960;
    d.details.memory.size = 81920;
    return d;
}

TEST(ProcessMetrics, Update)
{
    auto config = Config(WriterConfig(WriterTypes::Memory));
    auto r = Registry(config);
    ProcessMetrics metrics{&r};

    auto memoryWriter = static_cast<MemoryWriter*>(WriterTestHelper::GetImpl());
    memoryWriter->Clear();
    DeltaMap deltas;
    deltas.emplace(7, nginx());
    metrics.update(deltas);

    auto messages = memoryWriter->GetMessages();
    EXPECT_EQ(messages.size(), 18);
    auto published = parse_messages(messages);

    EXPECT_EQ(value_of(published, "proc.cpu", {"pid=7", "cmd=nginx", "id=user"}), "12.000000\n");
    EXPECT_EQ(value_of(published, "proc.cpu", {"pid=7", "cmd=nginx", "id=system"}), "6.000000\n");
    EXPECT_EQ(value_of(published, "proc.cpu", {"pid=7", "cmd=nginx", "id=total"}), "18.000000\n");
    EXPECT_EQ(value_of(published, "proc.cpu", {"pid=7", "cmd=nginx", "id=childUser"}), "0.000000\n");
    EXPECT_EQ(value_of(published, "proc.faults", {"pid=7", "cmd=nginx", "id=minor"}), "3.500000\n");
    EXPECT_EQ(value_of(published, "proc.io.bytes", {"pid=7", "cmd=nginx", "id=read"}), "1024.000000\n");
    EXPECT_EQ(value_of(published, "proc.io.syscalls", {"pid=7", "cmd=nginx", "id=write"}), "2.250000\n");
    EXPECT_EQ(value_of(published, "proc.mem.resident", {"pid=7", "cmd=nginx"}), "40960.000000\n");
    EXPECT_EQ(value_of(published, "proc.mem.virtual", {"pid=7", "cmd=nginx"}), "81920.000000\n");
}

TEST(ProcessMetrics, GaugesHaveTtl)
{
    auto config = Config(WriterConfig(WriterTypes::Memory));
    auto r = Registry(config);
    ProcessMetrics metrics{&r};

    auto memoryWriter = static_cast<MemoryWriter*>(WriterTestHelper::GetImpl());
    memoryWriter->Clear();
    DeltaMap deltas;
    deltas.emplace(7, nginx());
    metrics.update(deltas);

    for (const auto& msg : memoryWriter->GetMessages())
    {
        EXPECT_EQ(msg.rfind("g,60:proc.", 0), 0) << msg;
    }
}

TEST(ProcessMetrics, NothingToPublish)
{
    auto config = Config(WriterConfig(WriterTypes::Memory));
    auto r = Registry(config);
    ProcessMetrics metrics{&r};

    auto memoryWriter = static_cast<MemoryWriter*>(WriterTestHelper::GetImpl());
    memoryWriter->Clear();
    metrics.update({});
    EXPECT_TRUE(memoryWriter->GetMessages().empty());
}

}  // namespace
