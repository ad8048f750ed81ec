#include <lib/config/src/agent_config.h>
#include <lib/logger/src/logger.h>
#include <lib/publisher/src/process_metrics.h>
#include <lib/sampler/src/sampling_engine.h>
#include <lib/util/src/errors.h>
#include <lib/util/src/util.h>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <backward.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spectator/registry.h>

#include <condition_variable>
#include <csignal>
#include <getopt.h>
#include <mutex>

using procrate::AgentConfig;
using procrate::Logger;
using Engine = procrate::SamplingEngine<>;

struct terminator
{
    terminator() noexcept = default;

    // returns false if killed:
    template <class R, class P>
    bool wait_for(std::chrono::duration<R, P> const& time)
    {
        if (time.count() <= 0)
        {
            Logger()->warn("waiting for zero ticks!");
            return true;
        }
        std::unique_lock<std::mutex> lock(m);
        return !cv.wait_for(lock, time, [&] { return terminate; });
    }
    void kill()
    {
        std::unique_lock<std::mutex> lock(m);
        terminate = true;
        cv.notify_all();
    }

   private:
    std::condition_variable cv;
    std::mutex m;
    bool terminate = false;
};

terminator runner;

static void handle_signal(int signal)
{
    const char* name;
    switch (signal)
    {
        case SIGINT:
            name = "SIGINT";
            break;
        case SIGTERM:
            name = "SIGTERM";
            break;
        default:
            name = "Unknown";
    }

    Logger()->info("Caught {}, cleaning up", name);
    runner.kill();
}

static void init_signals()
{
    struct sigaction sa
    {
    };
    sa.sa_handler = &handle_signal;
    sa.sa_flags = SA_RESETHAND;  // remove the handler after the first signal
    sigfillset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void print_snapshot(const procrate::Snapshot& snapshot)
{
    fmt::print("uptime={:.2f} timestamp={:.3f} processes={}\n", snapshot.uptime, snapshot.timestamp,
               snapshot.processes.size());
    for (const auto& [pid, record] : snapshot.processes)
    {
        const auto& d = *record.details;
        fmt::print("{} {} state={} ppid={} owner={} actime={} threads={} size={} resident={} cmd=\"{}\"\n", pid,
                   d.comm, d.state, d.ppid, d.owner, d.actime, d.num_threads, d.memory.size, d.memory.resident,
                   d.cmdline);
        for (size_t i = 0; i < procrate::kNumCounters; ++i)
        {
            fmt::print("  {}={}\n", procrate::kCounterNames[i], record.counters[i].value_or(0));
        }
        for (size_t i = 0; i < procrate::kNumIoCounters; ++i)
        {
            if (record.io[i])
            {
                fmt::print("  {}={}\n", procrate::kIoCounterNames[i], *record.io[i]);
            }
        }
    }
}

static bool dump_raw(const procrate::SamplerConfig& config)
try
{
    Engine engine{config};
    print_snapshot(engine.raw());
    return true;
}
catch (const std::exception& e)
{
    Logger()->error("Exception: {} in dump_raw", e.what());
    return false;
}

static bool sample_once(Engine* engine, procrate::ProcessMetrics* metrics)
try
{
    auto deltas = engine->sample();
    metrics->update(deltas);
    for (const auto& [pid, delta] : deltas)
    {
        Logger()->debug("pid={} cmd={} ttime={:.2f} utime={:.2f} stime={:.2f}", pid, delta.details.comm,
                        delta.ttime, delta.rate(procrate::Counter::UTime), delta.rate(procrate::Counter::STime));
    }
    return true;
}
catch (const procrate::EnumerationFailure& e)
{
    // /proc may be briefly unavailable; try again next interval
    Logger()->warn("Skipping sample: {}", e.what());
    return true;
}
catch (const std::exception& e)
{
    Logger()->error("Exception: {} in sample_once", e.what());
    return false;
}

static int collect_process_metrics(Registry* registry, const AgentConfig& config)
try
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::seconds;
    using std::chrono::system_clock;

    Engine engine{config.sampler};
    procrate::ProcessMetrics metrics{registry};
    engine.initialize();
    Logger()->info("Sampling every {}s", config.interval_seconds);

    auto next_run = system_clock::now() + seconds(config.interval_seconds);
    std::chrono::nanoseconds time_to_sleep = next_run - system_clock::now();
    while (runner.wait_for(time_to_sleep))
    {
        auto start = system_clock::now();
        if (!sample_once(&engine, &metrics))
        {
            return EXIT_FAILURE;
        }
        auto elapsed = duration_cast<milliseconds>(system_clock::now() - start);
        Logger()->debug("Published process metrics (delay={})", elapsed);

        next_run += seconds(config.interval_seconds);
        time_to_sleep = next_run - system_clock::now();
    }
    return EXIT_SUCCESS;
}
catch (const std::exception& e)
{
    Logger()->error("Exception: {} in collect_process_metrics", e.what());
    return EXIT_FAILURE;
}

struct agent_options
{
    std::string cfg_file;
    std::string log_dir;
    std::optional<std::vector<std::string>> pids;
    std::optional<int> interval_seconds;
    std::optional<uint64_t> pages_to_bytes;
    std::unordered_map<std::string, std::string> extra_tags;
    bool raw{false};
    bool verbose{false};
};

static constexpr const char* const kDefaultCfgFile = procrate::AgentConfigConstants::DefaultPath;

static void usage(const char* progname)
{
    fprintf(stderr,
            "Usage: %s [-c cfg_file] [-p pid,pid] [-i seconds] [-b factor] [-l log_dir] [-t tags] [-r] [-v]\n"
            "\t-c\tUse cfg_file as the configuration file. Default %s\n"
            "\t-p\tOnly sample these pids instead of every process\n"
            "\t-i\tSeconds between samples\n"
            "\t-b\tMultiply statm sizes by factor (page size gives bytes, 0 keeps pages)\n"
            "\t-l\tLog to a rotating file under log_dir instead of stderr\n"
            "\t-t tags\tAdd extra tags to every metric.\n"
            "\t\tExpects a string of the form key=val,key2=val2\n"
            "\t-r\tPrint one raw snapshot and exit\n"
            "\t-v\tBe very verbose\n",
            progname, kDefaultCfgFile);
    exit(EXIT_FAILURE);
}

static int parse_options(int& argc, char* const argv[], agent_options* result)
{
    result->verbose = std::getenv("VERBOSE_AGENT") != nullptr;

    int ch;
    while ((ch = getopt(argc, argv, "c:p:i:b:l:t:rv")) != -1)
    {
        switch (ch)
        {
            case 'c':
                result->cfg_file = optarg;
                break;
            case 'p':
            {
                std::vector<std::string> pids = absl::StrSplit(optarg, ',', absl::SkipEmpty());
                result->pids = std::move(pids);
                break;
            }
            case 'i':
            {
                int seconds;
                if (!absl::SimpleAtoi(optarg, &seconds) || seconds <= 0)
                {
                    fprintf(stderr, "Invalid value for -i: %s\n", optarg);
                    usage(argv[0]);
                }
                result->interval_seconds = seconds;
                break;
            }
            case 'b':
            {
                uint64_t factor;
                if (!absl::SimpleAtoi(optarg, &factor))
                {
                    fprintf(stderr, "Invalid value for -b: %s\n", optarg);
                    usage(argv[0]);
                }
                result->pages_to_bytes = factor;
                break;
            }
            case 'l':
                result->log_dir = optarg;
                break;
            case 't':
                result->extra_tags = procrate::parse_tags(optarg);
                break;
            case 'r':
                result->raw = true;
                break;
            case 'v':
                result->verbose = true;
                break;
            case '?':
            default:
                usage(argv[0]);
        }
    }
    if (result->cfg_file.empty())
    {
        result->cfg_file = kDefaultCfgFile;
    }
    return optind;
}

int main(int argc, char* const argv[])
{
    agent_options options{};
    parse_options(argc, argv, &options);

    if (!options.log_dir.empty())
    {
        procrate::log_manager().UseFileLogger(options.log_dir);
    }
    auto logger = Logger();
    if (options.verbose)
    {
        procrate::log_manager().SetLevel(spdlog::level::debug);
    }

    auto maybe_config = AgentConfig::FromConfigFile(options.cfg_file.c_str());
    if (!maybe_config)
    {
        logger->error("Unable to load config file {}", options.cfg_file);
        return EXIT_FAILURE;
    }
    auto config = std::move(*maybe_config);
    if (options.pids)
    {
        config.sampler.pids = options.pids;
    }
    if (options.interval_seconds)
    {
        config.interval_seconds = *options.interval_seconds;
    }
    if (options.pages_to_bytes)
    {
        config.sampler.pages_to_bytes = *options.pages_to_bytes;
    }

    try
    {
        procrate::validate_config(config.sampler);
    }
    catch (const procrate::ConfigurationError& e)
    {
        logger->error("Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    if (options.raw)
    {
        return dump_raw(config.sampler) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    init_signals();
    backward::SignalHandling sh;
    auto common_tags = options.extra_tags;
    common_tags["xatlas.process"] = "procrate-agent";
    auto cfg = Config(WriterConfig(WriterTypes::Unix), common_tags);
    Registry registry{cfg};

    logger->info("Start gathering process metrics");
    auto status = collect_process_metrics(&registry, config);
    logger->info("Shutting down");
    return status;
}
