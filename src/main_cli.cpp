#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include <oceangraph/config/layout_settings.h>
#include <oceangraph/db/settings_store.h>
#include <oceangraph/db/sqlite_connection.h>
#include <oceangraph/graph/graph_manager.h>
#include <oceangraph/graph/graph_serialization.h>

using std::cerr;
using std::endl;
using std::string;

namespace {

struct CliOptions {
    string records_path;
    string settings_path = ":memory:";
    std::optional<int> max_ticks;
    bool include_positions = true;
};

void PrintUsage() {
    cerr << "Usage: oceangraph_cli <records.json> [--settings <db>] [--ticks <n>] [--no-positions]" << endl;
}

CliOptions ParseArgs(int argc, char** argv) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "--settings" && i + 1 < argc) {
            options.settings_path = argv[++i];
        } else if (arg == "--ticks" && i + 1 < argc) {
            options.max_ticks = std::stoi(argv[++i]);
            if (*options.max_ticks < 0) {
                throw std::invalid_argument("--ticks must not be negative");
            }
        } else if (arg == "--no-positions") {
            options.include_positions = false;
        } else if (!arg.empty() && arg[0] != '-' && options.records_path.empty()) {
            options.records_path = arg;
        } else {
            throw std::invalid_argument("Unrecognised argument: " + arg);
        }
    }
    if (options.records_path.empty()) {
        throw std::invalid_argument("Missing records file");
    }
    return options;
}

} // end anonymous namespace

int main(int argc, char** argv) {
    try {
        CliOptions options;
        try {
            options = ParseArgs(argc, argv);
        } catch (const std::exception& e) {
            cerr << "Error: " << e.what() << endl;
            PrintUsage();
            return 2;
        }

        oceangraph::db::SQLiteConnection connection(options.settings_path);
        oceangraph::db::SettingsStore settings(connection);

        oceangraph::graph::GraphManager manager(oceangraph::config::LoadBuilderParams(settings),
                                                oceangraph::config::LoadLayoutParams(settings));

        std::ifstream input(options.records_path);
        if (!input) {
            throw std::runtime_error("Cannot open records file: " + options.records_path);
        }
        nlohmann::json records_json = nlohmann::json::parse(input);
        manager.Regenerate(oceangraph::graph::RecordsFromJson(records_json));

        int ticks = 0;
        while (manager.IsLayoutRunning() && (!options.max_ticks || ticks < *options.max_ticks)) {
            manager.Tick();
            ++ticks;
        }

        const auto& snapshot = manager.GetSnapshot();
        cerr << "Built " << snapshot.nodes.size() << " nodes and " << snapshot.edges.size()
             << " edges; layout ran " << ticks << " ticks (alpha " << manager.GetLayout().Alpha() << ")" << endl;

        std::cout << manager.ExportJson(options.include_positions).dump(2) << std::endl;
    } catch (const std::exception& e) {
        cerr << "Fatal Error: " << e.what() << endl;
        return 1;
    }
    return 0;
}
