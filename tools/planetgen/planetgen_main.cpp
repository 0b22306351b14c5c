// tools/planetgen/planetgen_main.cpp
#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "logging/Log.h"
#include "worldgen/AlgorithmRegistry.hpp"
#include "worldgen/Errors.hpp"
#include "worldgen/Export.hpp"
#include "worldgen/StagesConfig.hpp"
#include "worldgen/TileClass.hpp"
#include "worldgen/WorldGen.hpp"

using std::string;
namespace wg = orbis::worldgen;

namespace {

// Exit codes
constexpr int kOk             = 0;
constexpr int kUsage          = 1;
constexpr int kConfigError    = 2;
constexpr int kNonConvergence = 3;
constexpr int kInternal       = 4;

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// --- utilities ---------------------------------------------------------------

std::map<string, string> parse_kv(int argc, char** argv) {
    std::map<string,string> kv;
    for (int i=2;i<argc;++i) {
        string a = argv[i];
        auto eq = a.find('=');
        if (eq != string::npos) {
            kv[a.substr(0,eq)] = a.substr(eq+1);
        } else if (a.rfind("--",0)==0 && i+1<argc) {
            kv[a] = argv[++i];
        } else {
            throw UsageError("unexpected argument '" + a + "'");
        }
    }
    return kv;
}

template <typename T, typename F>
T parse_number(const std::map<string,string>& kv, const char* key, F&& conv) {
    const string& s = kv.at(key);
    try {
        std::size_t used = 0;
        T v = conv(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::logic_error&) {
        throw UsageError(string(key) + ": '" + s + "' is not a valid number");
    }
}

void print_usage() {
    std::cerr <<
      "Usage:\n"
      "  planetgen generate [--config <planet.json>] [--out <export.json>] [--level <n>]\n"
      "                     [--algorithm <name>] [--seed <n>] [--log-level <level>]\n"
      "  planetgen algorithms [--dir <directory>] [--category <name>]\n";
}

void init_logging(const wg::StagesRuntimeConfig& cfg, const std::map<string,string>& kv) {
    orbis::logsys::LogOptions opts;
    opts.level = orbis::logsys::parse_level(kv.count("--log-level") ? kv.at("--log-level") : cfg.log.level);
    opts.file = cfg.log.file;
    orbis::logsys::init(opts);
}

// --- commands ----------------------------------------------------------------

int cmd_generate(const std::map<string,string>& kv) {
    const string cfgPath = kv.count("--config") ? kv.at("--config") : wg::StagesConfig::default_path().string();
    wg::StagesRuntimeConfig cfg = wg::StagesConfig::load(cfgPath);

    if (kv.count("--level"))
        cfg.grid.level = parse_number<int>(kv, "--level", [](const string& s, std::size_t* n) { return std::stoi(s, n); });
    if (kv.count("--seed"))
        cfg.terrain.seed = parse_number<std::uint64_t>(kv, "--seed", [](const string& s, std::size_t* n) { return std::stoull(s, n); });
    if (kv.count("--algorithm"))
        cfg.terrain.name = kv.at("--algorithm");
    wg::StagesConfig::validate(cfg);

    init_logging(cfg, kv);

    const wg::JsonAlgorithmSource source(cfg.algorithms.directory);
    auto registry = std::make_shared<const wg::AlgorithmRegistry>(source, cfg.algorithms.category);

    wg::PlanetGenerator gen(cfg, registry);
    gen.setClimateObserver([](const wg::ClimateProgress& p) {
        if (p.season == 0 && p.cycle % 10 == 0)
            spdlog::info("Climate: cycle {}, last delta {}", p.cycle, p.last_delta);
        return true;
    });

    const wg::Planet planet = gen.generate();
    std::cout << wg::format_statistics(wg::gather_statistics(planet));

    if (kv.count("--out"))
        wg::write_export(planet, kv.at("--out"));
    return kOk;
}

int cmd_algorithms(const std::map<string,string>& kv) {
    const string dir = kv.count("--dir") ? kv.at("--dir") : wg::AlgorithmsConfig{}.directory;
    const string category = kv.count("--category") ? kv.at("--category") : wg::AlgorithmsConfig{}.category;

    const wg::JsonAlgorithmSource source(dir);
    const wg::AlgorithmRegistry registry(source, category);
    for (const auto& name : registry.names())
        std::cout << name << "\n";
    return kOk;
}

} // namespace

// --- entry -------------------------------------------------------------------

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return kUsage;
    }

    const string cmd = argv[1];
    try {
        const auto kv = parse_kv(argc, argv);
        if (cmd == "generate")   return cmd_generate(kv);
        if (cmd == "algorithms") return cmd_algorithms(kv);
        throw UsageError("unknown command '" + cmd + "'");
    } catch (const UsageError& e) {
        std::cerr << "planetgen: " << e.what() << "\n";
        print_usage();
        return kUsage;
    } catch (const wg::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kConfigError;
    } catch (const wg::NonConvergenceError& e) {
        spdlog::error("{} after {} cycles", e.what(), e.cycles());
        if (e.best_so_far())
            std::cout << wg::format_statistics(wg::gather_statistics(*e.best_so_far()));
        return kNonConvergence;
    } catch (const std::exception& e) {
        spdlog::critical("Internal error: {}", e.what());
        return kInternal;
    }
}
