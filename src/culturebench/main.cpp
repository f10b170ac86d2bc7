#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "BenchmarkConfiguration.h"
#include "BenchmarkRunner.h"
#include "ParallelExecutors.h"
#include "reporting/MarkdownReporter.h"
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace culturebench;

void printUsage(const po::options_description& desc) {
    std::cout << "Cultural Language Benchmark - annotation aggregation and agreement report\n\n";
    std::cout << "Usage: culturebench [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Report over the default data layout\n";
    std::cout << "  culturebench\n\n";
    std::cout << "  # Label the report and use four worker threads\n";
    std::cout << "  culturebench --epoch epoch_1 --threads 4\n\n";
    std::cout << "  # Custom dimensions and bootstrap settings\n";
    std::cout << "  culturebench --config benchmark.json --output-file reports/epoch_1.md\n";
}

std::shared_ptr<concurrency::IParallelExecutor> makeExecutor(unsigned int threads) {
    if (threads == 1)
        return std::make_shared<concurrency::SingleThreadExecutor>();
    // 0 selects the hardware concurrency
    return std::make_shared<concurrency::ThreadPoolExecutor<>>(threads);
}

int runReport(const po::variables_map& vm, std::ostream& out) {
    BenchmarkConfiguration config = BenchmarkConfiguration::createDefault();
    if (vm.count("config")) {
        const std::string configPath = vm["config"].as<std::string>();
        if (!config.loadFromFile(configPath)) {
            std::cerr << "Error: " << config.getLastError() << std::endl;
            return 1;
        }
        out << "Configuration:   " << configPath << std::endl;
    }
    if (vm.count("threads"))
        config.setThreads(vm["threads"].as<unsigned int>());

    BenchmarkPaths paths;
    paths.annotationsDir = fs::absolute(vm["annotations-dir"].as<std::string>()).string();
    paths.resultsDir = fs::absolute(vm["results-dir"].as<std::string>()).string();
    const fs::path outputFile = fs::absolute(vm["output-file"].as<std::string>());

    out << "Annotations dir: " << paths.annotationsDir << std::endl;
    out << "Results dir:     " << paths.resultsDir << std::endl;
    out << "Output file:     " << outputFile.string() << std::endl;

    if (outputFile.has_parent_path())
        fs::create_directories(outputFile.parent_path());

    const std::string epochLabel = vm.count("epoch") ? vm["epoch"].as<std::string>() : "all";

    BenchmarkRunner runner(config, out, makeExecutor(config.getThreads()));
    auto report = runner.generateReport(paths, epochLabel, utils::getCurrentUtcTimestamp());

    std::string content;
    if (report) {
        content = *report;
    } else {
        content = reporting::MarkdownReporter::renderNoAnnotationsMessage(paths.annotationsDir);
        out << content << std::endl;
    }

    std::ofstream file(outputFile.string());
    if (!file) {
        std::cerr << "Error: cannot write " << outputFile.string() << std::endl;
        return 1;
    }
    file << content;

    out << "\nReport written to " << outputFile.string() << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("annotations-dir", po::value<std::string>()->default_value("data/annotations"),
             "Directory containing pairwise/ and rubric/ annotation JSON files")
            ("results-dir", po::value<std::string>()->default_value("data/results"),
             "Directory containing model result JSON files")
            ("output-file,o", po::value<std::string>()->default_value("reports/benchmark_report.md"),
             "Output path for the Markdown report")
            ("epoch", po::value<std::string>(), "Optional epoch label (e.g. 'epoch_1')")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("threads,t", po::value<unsigned int>(), "Worker threads (1 = inline, 0 = hardware concurrency)")
            ("log-file", po::value<std::string>(), "Mirror console output to this file");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (vm.count("log-file")) {
            const std::string logPath = vm["log-file"].as<std::string>();
            std::ofstream logFile(logPath);
            if (!logFile) {
                std::cerr << "Error: cannot open log file " << logPath << std::endl;
                return 1;
            }
            utils::TeeStream tee(std::cout, logFile);
            return runReport(vm, tee);
        }

        return runReport(vm, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
