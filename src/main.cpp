#include "cosmic/config/MeasurementLoader.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/core/Options.hpp"
#include "cosmic/parser/ParserProvider.hpp"
#include "cosmic/report/ExcelReport.hpp"
#include "cosmic/utils/Logger.hpp"

#include <getopt.h>

#include <iostream>
#include <string>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

struct CliArguments {
    std::string config;
    std::string output = "cosmic_measurement.xlsx";
    cosmic::core::ParserOptions parser;
    cosmic::core::LogOptions log;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout
        << "Usage: " << program << " <config> [options]\n"
        << "\n"
        << "COSMIC Function Point calculator: reads a measurement definition (YAML or JSON)\n"
        << "and writes an Excel report.\n"
        << "\n"
        << "Options:\n"
        << "  -o, --output <file>    Path for the generated workbook (default: cosmic_measurement.xlsx)\n"
        << "      --parser <name>    auto | builtin | yaml-cpp (default: auto)\n"
        << "      --log-level <lvl>  trace | debug | info | warn | error (default: warn)\n"
        << "      --log-file <path>  Also write the log to this file\n"
        << "  -h, --help             Show this help\n";
}

/**
 * @return 0 继续执行，否则为退出码
 */
int parseArgs(int argc, char* argv[], CliArguments& args) {
    enum LongOnly { OPT_PARSER = 1000, OPT_LOG_LEVEL, OPT_LOG_FILE };

    static const char* shortOpts = "ho:";
    static struct option longOpts[] = {{"help", no_argument, nullptr, 'h'},
                                       {"output", required_argument, nullptr, 'o'},
                                       {"parser", required_argument, nullptr, OPT_PARSER},
                                       {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
                                       {"log-file", required_argument, nullptr, OPT_LOG_FILE},
                                       {nullptr, 0, nullptr, 0}};

    // 命令行只输出警告及以上，除非显式指定
    args.log.level = cosmic::Logger::Level::WARN;

    while (true) {
        int idx = 0;
        int opt = getopt_long(argc, argv, shortOpts, longOpts, &idx);
        if (opt == -1) {
            break;
        }

        switch (opt) {
            case 'h':
                args.help = true;
                return EXIT_OK;
            case 'o':
                args.output = optarg;
                break;
            case OPT_PARSER:
                if (!cosmic::parser::ParserProvider::parseBackendName(optarg, args.parser.backend)) {
                    std::cerr << "Unknown parser '" << optarg << "'. Expected auto, builtin or yaml-cpp.\n";
                    return EXIT_USAGE;
                }
                break;
            case OPT_LOG_LEVEL:
                if (!cosmic::Logger::parseLevel(optarg, args.log.level)) {
                    std::cerr << "Unknown log level '" << optarg << "'.\n";
                    return EXIT_USAGE;
                }
                break;
            case OPT_LOG_FILE:
                args.log.path = optarg;
                break;
            case '?':
            default:
                // getopt 已输出错误信息
                return EXIT_USAGE;
        }
    }

    if (optind >= argc) {
        std::cerr << "Missing configuration file argument.\n";
        return EXIT_USAGE;
    }
    if (argc - optind > 1) {
        std::cerr << "Unexpected argument '" << argv[optind + 1] << "'.\n";
        return EXIT_USAGE;
    }
    args.config = argv[optind];
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    CliArguments args;
    int status = parseArgs(argc, argv, args);
    if (status != EXIT_OK) {
        printUsage(argv[0]);
        return status;
    }
    if (args.help) {
        printUsage(argv[0]);
        return EXIT_OK;
    }

    auto& logger = cosmic::Logger::getInstance();
    logger.initialize(args.log.path, args.log.level, args.log.console);

    int exit_code = EXIT_OK;
    try {
        cosmic::core::Path config_path(args.config);
        cosmic::model::SystemMeasurement measurement = cosmic::config::loadMeasurement(config_path, args.parser);

        cosmic::report::ExcelReport report(measurement);
        cosmic::core::Path written = report.exportTo(cosmic::core::Path(args.output));

        std::cout << "Excel report generated at: " << written.absolute().string() << std::endl;
    } catch (const cosmic::core::CosmicException& e) {
        COSMIC_LOG_ERROR("{}", e.getDetailedMessage());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = EXIT_ERROR;
    } catch (const std::exception& e) {
        COSMIC_LOG_CRITICAL("Unexpected error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = EXIT_ERROR;
    }

    logger.shutdown();
    return exit_code;
}
