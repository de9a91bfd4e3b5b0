#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "loglens/core/Errors.hpp"
#include "loglens/engine/EngineConfig.hpp"
#include "loglens/engine/Pipeline.hpp"
#include "loglens/expr/ExpressionEngine.hpp"
#include "loglens/input/FileReader.hpp"
#include "loglens/input/LineParser.hpp"
#include "loglens/metrics/StandardMetrics.hpp"
#include "loglens/report/CsvReporter.hpp"
#include "loglens/utils/ConfigLoader.hpp"
#include "loglens/utils/Logger.hpp"
#include "loglens/utils/StringUtils.hpp"
#include "loglens/utils/TimeUtils.hpp"

using namespace LogLens;

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string inputFile;
    std::string configFile;
    std::string resultsCsv;
    std::string anomaliesCsv;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> errors;
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    auto takeValue = [&](int &i, const std::string &flag, std::string &target) {
        if (i + 1 < argc)
        {
            target = argv[++i];
        }
        else
        {
            opts.errors.push_back(flag + " requires a value");
        }
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
            takeValue(i, arg, opts.configFile);
        else if (arg == "--results")
            takeValue(i, arg, opts.resultsCsv);
        else if (arg == "--anomalies")
            takeValue(i, arg, opts.anomaliesCsv);
        else if (arg == "--verbose" || arg == "-v")
            opts.verbose = true;
        else if (arg == "--help" || arg == "-h")
            opts.help = true;
        else if (arg == Input::FileReader::kStdin || (!arg.empty() && arg[0] != '-'))
            opts.inputFile = arg;
        else
            opts.errors.push_back("unknown option " + arg);
    }

    return opts;
}

static void printUsage(const char *progName)
{
    std::cout
        << "Usage: " << progName << " [OPTIONS] input.log\n"
        << "       " << progName << " [OPTIONS] -          (read standard input)\n\n"
        << "OPTIONS:\n"
        << "  -c, --config FILE        Metric and anomaly configuration (key = value)\n"
        << "      --results FILE       Write every metric result as CSV\n"
        << "      --anomalies FILE     Write detected anomalies as CSV\n"
        << "  -v, --verbose            Debug logging\n"
        << "  -h, --help               Show this help\n\n"
        << "Without a configuration the standard metrics are computed\n"
        << "(error_count, warning_rate, events_by_source, events_by_level)\n"
        << "with anomaly detection on error_count and warning_rate.\n";
}

static Engine::EngineConfig defaultConfig()
{
    Engine::EngineConfig config;
    config.metrics.push_back(Metrics::errorCountMetric());
    config.metrics.push_back(Metrics::warningRateMetric());
    config.metrics.push_back(Metrics::eventsBySourceMetric());
    config.metrics.push_back(Metrics::eventsByLevelMetric());

    Anomaly::DetectorConfig errors;
    errors.metricName = "error_count";
    config.detectors.push_back(errors);

    Anomaly::DetectorConfig warnings;
    warnings.metricName = "warning_rate";
    config.detectors.push_back(warnings);
    return config;
}

static Engine::EngineConfig loadConfig(const CliOptions &opts, Utils::Logger &logger)
{
    if (opts.configFile.empty())
    {
        logger.info("No configuration given, using standard metrics");
        return defaultConfig();
    }

    Utils::ConfigLoader loader;
    if (!loader.loadFromFile(opts.configFile))
    {
        throw Core::ConfigurationError("cannot read '" + opts.configFile + "'");
    }
    if (loader.malformedLines() > 0)
    {
        logger.warn("Skipped " + std::to_string(loader.malformedLines()) + " malformed configuration lines");
    }

    Expr::ExpressionEngine compiler;
    auto config = Engine::EngineConfig::fromLoader(loader, compiler);
    if (config.metrics.empty())
    {
        logger.info("Configuration defines no metrics, using standard metrics");
        auto defaults = defaultConfig();
        config.metrics = std::move(defaults.metrics);
        if (config.detectors.empty())
        {
            config.detectors = std::move(defaults.detectors);
        }
    }
    return config;
}

static void printAnomaly(const Anomaly::AnomalyRecord &a)
{
    std::cout << "[" << Utils::formatTimestamp(a.timestamp) << "] "
              << Utils::toUpper(Anomaly::toString(a.severity)) << " "
              << a.explanation
              << " (z=" << Utils::formatNumber(a.zScore) << ")\n";
}

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (!opts.errors.empty() || opts.inputFile.empty())
    {
        for (const auto &e : opts.errors)
            std::cerr << "Error: " << e << "\n";
        if (opts.inputFile.empty())
            std::cerr << "Error: input file required.\n";
        std::cerr << "\n";
        printUsage(argv[0]);
        return 1;
    }

    auto &logger = Utils::getLogger();
    if (opts.verbose)
        logger.setLevel(Utils::LogLevel::DEBUG);

    logger.info("Starting LogLens");
    logger.info("Input: " + opts.inputFile);

    try
    {
        auto config = loadConfig(opts, logger);
        if (config.logLevel && !opts.verbose)
            logger.setLevel(*config.logLevel);
        if (!config.logFile.empty() && !logger.setFile(config.logFile))
            logger.warn("Cannot open log file '" + config.logFile + "', logging to console only");

        Engine::Pipeline pipeline(std::move(config));
        Report::CsvReporter reporter;

        std::size_t resultCount = 0;
        pipeline.setResultSink([&](const Metrics::MetricResult &r) {
            ++resultCount;
            reporter.addResult(r);
        });
        pipeline.setAnomalySink([&](const Anomaly::AnomalyRecord &a) {
            logger.warn("Anomaly: " + a.explanation);
            reporter.addAnomaly(a);
            printAnomaly(a);
        });

        Input::FileReader reader(opts.inputFile);
        if (!reader.isOpen())
        {
            logger.error("Cannot open input file: " + opts.inputFile);
            return 1;
        }

        const auto wallStart = std::chrono::steady_clock::now();

        Input::LineParser parser;
        const auto readStats = parser.readAll(reader, [&](Core::Event event) { pipeline.process(event); });
        pipeline.finish();

        const double wallSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - wallStart).count();

        const auto procStats = pipeline.processor().statistics();

        std::cout << "\n=== LogLens summary ===\n"
                  << "Lines read:          " << readStats.lines << " (" << reader.bytesRead() << " bytes)\n"
                  << "Events parsed:       " << readStats.events << "\n"
                  << "Malformed lines:     " << readStats.malformed << "\n"
                  << "Metric results:      " << resultCount << "\n"
                  << "Anomalies:           " << reporter.anomalyCount() << "\n"
                  << "Evaluation errors:   " << procStats.evaluationErrors << "\n"
                  << "Late events dropped: " << procStats.lateEventsDropped << "\n"
                  << "Groups evicted:      " << procStats.groupsEvicted << "\n"
                  << "Elapsed:             " << Utils::formatNumber(wallSeconds) << " s\n";

        std::cout << "\nLatest values:\n";
        const auto latest = pipeline.processor().getAllMetrics();
        for (const auto &name : pipeline.processor().metricNames())
        {
            auto it = latest.find(name);
            if (it == latest.end())
            {
                std::cout << "  " << name << ": (no data)\n";
                continue;
            }
            const auto &r = it->second;
            if (r.value)
            {
                std::cout << "  " << name << ": " << Utils::formatNumber(*r.value) << "\n";
                continue;
            }
            std::cout << "  " << name << ": " << r.groupedValues.size() << " groups\n";
        }

        bool ok = true;
        if (!opts.resultsCsv.empty())
            ok = reporter.saveResults(opts.resultsCsv) && ok;
        if (!opts.anomaliesCsv.empty())
            ok = reporter.saveAnomalies(opts.anomaliesCsv) && ok;

        logger.info("Done");
        return ok ? 0 : 1;
    }
    catch (const Core::ConfigurationError &e)
    {
        logger.error(e.what());
        return 2;
    }
    catch (const std::exception &e)
    {
        logger.critical(std::string("Fatal: ") + e.what());
        return 1;
    }
}
