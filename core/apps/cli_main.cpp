// sandscrape: run one candidate program in the sandbox and print the
// result as JSON.
//
//   sandscrape run  <program.py> <url>
//   sandscrape scan <program.py>

#include "config/runtime_config.hpp"
#include "engine/execution_engine.hpp"
#include "policy/prescan.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace sandscrape;

namespace {

void usage() {
    std::cerr << "usage:\n"
              << "  sandscrape run  <program.py> <url>\n"
              << "  sandscrape scan <program.py>\n";
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot read " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

int runCommand(const RuntimeConfig& cfg, const std::string& path, const std::string& url) {
    ExecutionEngine engine(makeDefaultPolicy(), cfg.engine);

    CandidateProgram program;
    program.source = readFile(path);

    ExecutionResult result = engine.execute(program, url);
    std::cout << result.toJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return result.ok() ? 0 : 1;
}

int scanCommand(const std::string& path) {
    ExecutionPolicy policy = makeDefaultPolicy();
    std::vector<std::string> hits = PreScanner(policy).findAll(readFile(path));
    for (const auto& hit : hits) {
        std::cout << "denied token: '" << hit << "'\n";
    }
    return hits.empty() ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // Results go to stdout; logs stay on stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("sandscrape"));

    if (argc < 2) {
        usage();
        return 2;
    }
    std::string command = argv[1];

    try {
        RuntimeConfig cfg = loadRuntimeConfigFromEnvironment();
        configureLogging(cfg.log_level);

        if (command == "run" && argc == 4) return runCommand(cfg, argv[2], argv[3]);
        if (command == "scan" && argc == 3) return scanCommand(argv[2]);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }

    usage();
    return 2;
}
