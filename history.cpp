#include <iostream>
#include <string>

#include "src/history/history_ledger.hpp"
#include "src/report/report_sink.hpp"
#include "src/utils/config.hpp"

//// ./build/history [--config config.ini] [--user name] [--limit n] [--offset n] [--stats]
//// Replays the report files into a ledger and prints a history page or stats.

int main(int argc, char** argv) {
    std::string config_file = "config.ini";
    std::string user;
    long limit = 0;
    long offset = 0;
    bool show_stats = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg == "--user" && i + 1 < argc) {
                user = argv[++i];
            } else if (arg == "--limit" && i + 1 < argc) {
                limit = std::stol(argv[++i]);
            } else if (arg == "--offset" && i + 1 < argc) {
                offset = std::stol(argv[++i]);
            } else if (arg == "--stats") {
                show_stats = true;
            } else {
                std::cerr << "Unknown argument: " << arg << std::endl;
                return 1;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config file] [--user name] [--limit n] [--offset n] [--stats]" << std::endl;
        return 1;
    }
    if (limit < 0 || offset < 0) {
        std::cerr << "limit and offset must not be negative" << std::endl;
        return 1;
    }

    Config config;
    config.load(config_file);

    ReportSink reports(config.users_path, config.unknown_archive_path);
    HistoryLedger ledger(static_cast<size_t>(config.history_capacity));
    for (const auto& event : reports.loadHistory()) {
        ledger.append(event);
    }

    if (show_stats) {
        std::cout << ledger.stats().toJSON().dump(2) << std::endl;
    } else {
        size_t page_size = limit > 0 ? static_cast<size_t>(limit)
                                     : static_cast<size_t>(config.history_default_limit);
        std::cout << ledger.query(page_size, user, static_cast<size_t>(offset)).toJSON().dump(2) << std::endl;
    }
    return 0;
}
