// apps/downloader/data_downloader.cpp

#include <signal.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include "data_ngin/core/config_store.hpp"
#include "data_ngin/core/logger.hpp"
#include "data_ngin/core/time_utils.hpp"
#include "data_ngin/data/http_client.hpp"
#include "data_ngin/data/polygon_gateway.hpp"
#include "data_ngin/download/batch_orchestrator.hpp"
#include "data_ngin/download/outcome_report.hpp"
#include "data_ngin/storage/lean_store_writer.hpp"

using namespace data_ngin;

namespace {

// Set by SIGINT/SIGTERM; the orchestrator stops starting new instruments
CancellationToken g_cancel;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel.cancel();
    }
}

void print_usage(const char* program_name) {
    std::cout
        << "Usage: " << program_name << " --app <name> [options]\n"
        << "\n"
        << "Apps:\n"
        << "  polygondatadownloader, polygondl, polygon   Download historical data\n"
        << "\n"
        << "Options:\n"
        << "  --tickers <T1,T2,...>      Comma separated tickers (required)\n"
        << "  --security-type <type>     Equity, Forex, Crypto, Option, Index... (default Equity)\n"
        << "  --resolution <res>         Tick, Second, Minute, Hour, Daily (default Minute)\n"
        << "  --market <market>          Market name (default usa)\n"
        << "  --from-date <date>         yyyyMMdd-HH:mm:ss (required)\n"
        << "  --to-date <date>           yyyyMMdd-HH:mm:ss (default now)\n"
        << "  --parameters <file>        JSON run parameters, overridden by the options above\n"
        << "  --config <file>            Configuration file (default config.json)\n"
        << "  --help                     Show this message\n"
        << "\n"
        << "Example:\n"
        << "  " << program_name
        << " --app polygondl --tickers AAPL,MSFT --resolution Minute"
        << " --from-date 20240101-00:00:00 --to-date 20240102-00:00:00\n";
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_tickers(const std::string& list) {
    std::vector<std::string> tickers;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        tickers.push_back(item);
    }
    return tickers;
}

/**
 * @brief Parse "--key value" pairs; "--help" takes no value
 */
Result<std::map<std::string, std::string>> parse_arguments(int argc, char* argv[]) {
    static const std::set<std::string> known = {"app",    "tickers",   "security-type",
                                                "resolution", "market", "from-date",
                                                "to-date", "parameters", "config"};
    std::map<std::string, std::string> options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options["help"] = "";
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            return make_error<std::map<std::string, std::string>>(
                ErrorCode::CONFIGURATION_ERROR, "Unexpected argument '" + arg + "'", "CLI");
        }
        std::string key = arg.substr(2);
        if (known.count(key) == 0) {
            return make_error<std::map<std::string, std::string>>(
                ErrorCode::CONFIGURATION_ERROR, "Unknown option '" + arg + "'", "CLI");
        }
        if (i + 1 >= argc) {
            return make_error<std::map<std::string, std::string>>(
                ErrorCode::CONFIGURATION_ERROR, "Missing value for '" + arg + "'", "CLI");
        }
        options[key] = argv[++i];
    }
    return Result<std::map<std::string, std::string>>(std::move(options));
}

bool is_downloader_app(const std::string& app) {
    const std::string name = lower(app);
    return name == "polygondatadownloader" || name == "polygondl" || name == "polygon";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 0;
    }

    auto parsed = parse_arguments(argc, argv);
    if (parsed.is_error()) {
        std::cerr << "ERROR: " << parsed.error()->what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    const auto& options = parsed.value();

    if (options.count("help")) {
        print_usage(argv[0]);
        return 0;
    }

    auto app = options.find("app");
    if (app == options.end()) {
        std::cerr << "ERROR: --app is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (!is_downloader_app(app->second)) {
        std::cerr << "ERROR: Unrecognized --app value '" << app->second << "'" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Configuration
        auto config_entry = options.find("config");
        ConfigStore config(config_entry != options.end() ? config_entry->second : "config.json");
        auto loaded = config.load_config();
        if (loaded.is_error()) {
            if (loaded.error()->code() != ErrorCode::FILE_NOT_FOUND ||
                config_entry != options.end()) {
                std::cerr << "ERROR: " << loaded.error()->to_string() << std::endl;
                return 1;
            }
            // A missing default config file is fine, every setting has a default
            config.load_json(nlohmann::json::object());
        }

        // Logger
        Logger::reset_for_tests();
        LoggerConfig logger_config;
        logger_config.filename_prefix = "data_downloader";
        logger_config.from_json(config.section("logging"));

        if (config.get_with_default<bool>("download", "debug_mode", false)) {
            logger_config.min_level = LogLevel::DEBUG;
        }
        const std::string results_folder =
            config.get_with_default<std::string>("download", "results_destination_folder", "");
        if (!results_folder.empty()) {
            logger_config.log_directory = results_folder;
            if (logger_config.destination == LogDestination::CONSOLE) {
                logger_config.destination = LogDestination::BOTH;
            }
        }

        auto& logger = Logger::instance();
        logger.initialize(logger_config);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("DataDownloader");

        // Run parameters: a parameters file first, then command line overrides
        DownloadParameters params;
        params.max_concurrency = config.get_with_default<size_t>("download", "max_concurrency", 1);

        bool have_tickers = false;
        bool have_start = false;
        auto parameters_file = options.find("parameters");
        if (parameters_file != options.end()) {
            auto file_loaded = params.load_from_file(parameters_file->second);
            if (file_loaded.is_error()) {
                std::cerr << "ERROR: " << file_loaded.error()->to_string() << std::endl;
                return 1;
            }
            have_tickers = !params.tickers.empty();
            have_start = params.range_start != Timestamp{};
            INFO("Loaded run parameters from " << parameters_file->second);
        }

        auto tickers = options.find("tickers");
        if (tickers != options.end()) {
            params.tickers = split_tickers(tickers->second);
            have_tickers = true;
        }
        if (!have_tickers) {
            std::cerr << "ERROR: --tickers is required for PolygonDataDownloader" << std::endl;
            return 1;
        }

        auto from_date = options.find("from-date");
        if (from_date != options.end()) {
            auto range_start = core::parse_exact(from_date->second);
            if (range_start.is_error()) {
                std::cerr << "ERROR: " << range_start.error()->what() << std::endl;
                return 1;
            }
            params.range_start = range_start.value();
            have_start = true;
        }
        if (!have_start) {
            std::cerr << "ERROR: --from-date is required" << std::endl;
            return 1;
        }

        auto to_date = options.find("to-date");
        if (to_date != options.end()) {
            auto range_end = core::parse_exact(to_date->second);
            if (range_end.is_error()) {
                std::cerr << "ERROR: " << range_end.error()->what() << std::endl;
                return 1;
            }
            params.range_end = range_end.value();
        }

        if (options.count("security-type"))
            params.security_type = options.at("security-type");
        if (options.count("resolution"))
            params.resolution = options.at("resolution");
        if (options.count("market"))
            params.market = options.at("market");

        // Collaborators
        PolygonConfig polygon_config;
        polygon_config.from_json(config.section("polygon"));
        auto http = std::make_shared<CurlHttpClient>(polygon_config.timeout_seconds);
        auto gateway = std::make_shared<PolygonGateway>(polygon_config, http);

        const std::string data_folder =
            config.get_with_default<std::string>("download", "data_folder", "./data");
        auto writer = std::make_shared<LeanStoreWriter>(data_folder);

        INFO("Downloading " << params.tickers.size() << " ticker(s) from " << gateway->name()
                            << " into " << writer->root().string());

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        BatchOrchestrator orchestrator(gateway, writer);
        auto run_result = orchestrator.run(params, &g_cancel);
        if (run_result.is_error()) {
            ERROR(run_result.error()->to_string());
            std::cerr << "ERROR: " << run_result.error()->what() << std::endl;
            return 1;
        }

        OutcomeReport report(run_result.take_value());
        for (const auto& outcome : report.outcomes()) {
            switch (outcome.status) {
                case OutcomeStatus::WRITTEN:
                    INFO(outcome.instrument << ": " << outcome.detail);
                    break;
                case OutcomeStatus::NO_DATA:
                    WARN(outcome.instrument << ": no data (" << outcome.detail << ")");
                    break;
                default:
                    ERROR(outcome.instrument << ": " << to_string(outcome.status) << " ("
                                             << outcome.detail << ")");
                    break;
            }
        }

        if (g_cancel.is_cancelled()) {
            WARN("Run cancelled after " << report.outcomes().size() << " instrument(s)");
        }

        OutcomeSummary summary = report.summarize();
        INFO("Summary: " << summary.written << " written, " << summary.no_data << " no data, "
                         << summary.rejected << " rejected, " << summary.failed << " failed");

        if (!results_folder.empty()) {
            auto params_path =
                (std::filesystem::path(results_folder) / "parameters.json").string();
            auto params_saved = params.save_to_file(params_path);
            if (params_saved.is_error()) {
                ERROR("Failed to save run parameters: " << params_saved.error()->what());
            }

            auto path = (std::filesystem::path(results_folder) / "report.json").string();
            auto saved = report.save(path);
            if (saved.is_error()) {
                ERROR("Failed to save report: " << saved.error()->what());
            } else {
                INFO("Report saved to " << path);
            }
        }

        return report.exit_code();

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
