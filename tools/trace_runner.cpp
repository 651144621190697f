// trace_runner - headless driver for the Trace generator
//
// Seeds (or loads) a generator, prints a run of outputs, and can rewind the
// same run with PreviousULong() to verify the step inverse end to end.
//
// Usage:
//   trace_runner [options]
//     --seed <hex|dec>     Seed (default: 0xC0FFEE)
//     --random             Use a random state instead of --seed
//     --count <n>          Values to generate (default: 16)
//     --mode <m>           ulong|float|double (default: ulong)
//     --rewind             Rewind the run and verify the values match
//     --load <file>        Start from a JSON state file (overrides --seed)
//     --save <file>        Write the final state as JSON
//     --serialize          Print the final state in string form
//     --json               Output as JSON instead of plain text
//     --quiet              Only output the final summary line
//     -h, --help           Print usage

#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "core/Bits.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "rng/StateFile.hpp"
#include "rng/TraceRandom.hpp"

namespace {

enum class OutputMode {
    ULong,
    Float,
    Double,
};

struct RunnerArgs {
    uint64_t seed = cfg::kDefaultRunnerSeed;
    bool randomState = false;
    int count = cfg::kDefaultRunnerCount;
    OutputMode mode = OutputMode::ULong;
    bool rewind = false;
    std::string loadPath;
    std::string savePath;
    bool serialize = false;
    bool json = false;
    bool quiet = false;
    bool help = false;
    bool bad = false;
};

bool ParseSeed(const char* str, uint64_t& out) {
    // Accept 0x prefix for hex, otherwise decimal.
    char* end = nullptr;
    out = static_cast<uint64_t>(std::strtoull(str, &end, 0));
    return end != str && *end == '\0';
}

bool ParseMode(const char* str, OutputMode& out) {
    if (std::strcmp(str, "ulong") == 0) { out = OutputMode::ULong; return true; }
    if (std::strcmp(str, "float") == 0) { out = OutputMode::Float; return true; }
    if (std::strcmp(str, "double") == 0) { out = OutputMode::Double; return true; }
    return false;
}

const char* ModeName(OutputMode m) {
    switch (m) {
        case OutputMode::ULong:  return "ulong";
        case OutputMode::Float:  return "float";
        case OutputMode::Double: return "double";
    }
    return "unknown";
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            if (!ParseSeed(argv[++i], args.seed)) {
                LOG_ERROR("Invalid seed: {}", argv[i]);
                args.bad = true;
            }
        } else if (std::strcmp(argv[i], "--random") == 0) {
            args.randomState = true;
        } else if ((std::strcmp(argv[i], "--count") == 0) && i + 1 < argc) {
            args.count = std::atoi(argv[++i]);
            if (args.count < 0) args.count = 0;
        } else if ((std::strcmp(argv[i], "--mode") == 0) && i + 1 < argc) {
            if (!ParseMode(argv[++i], args.mode)) {
                LOG_ERROR("Unknown mode: {}", argv[i]);
                args.bad = true;
            }
        } else if (std::strcmp(argv[i], "--rewind") == 0) {
            args.rewind = true;
        } else if ((std::strcmp(argv[i], "--load") == 0) && i + 1 < argc) {
            args.loadPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--save") == 0) && i + 1 < argc) {
            args.savePath = argv[++i];
        } else if (std::strcmp(argv[i], "--serialize") == 0) {
            args.serialize = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        } else {
            LOG_ERROR("Unknown or incomplete option: {}", argv[i]);
            args.bad = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "trace_runner - headless driver for the Trace generator\n"
        "\n"
        "Usage: trace_runner [options]\n"
        "  --seed <hex|dec>     Seed (default: 0xC0FFEE)\n"
        "  --random             Use a random state instead of --seed\n"
        "  --count <n>          Values to generate (default: 16)\n"
        "  --mode <m>           ulong|float|double (default: ulong)\n"
        "  --rewind             Rewind the run and verify the values match\n"
        "  --load <file>        Start from a JSON state file\n"
        "  --save <file>        Write the final state as JSON\n"
        "  --serialize          Print the final state in string form\n"
        "  --json               Output as JSON\n"
        "  --quiet              Only final summary line\n"
        "  -h, --help           This message\n"
    );
}

std::string FormatValue(OutputMode mode, uint64_t raw) {
    char buf[48];
    switch (mode) {
        case OutputMode::ULong:
            std::snprintf(buf, sizeof(buf), "0x%016" PRIX64, raw);
            break;
        case OutputMode::Float: {
            // Same bits NextSparseFloat() takes from this step's output.
            const uint32_t bits = static_cast<uint32_t>(raw >> 41) | cfg::kFloatOneBits;
            std::snprintf(buf, sizeof(buf), "%.9g",
                          static_cast<double>(core::FloatFromBits(bits) - 1.0f));
            break;
        }
        case OutputMode::Double: {
            const uint64_t bits = (raw >> 12) | cfg::kDoubleOneBits;
            std::snprintf(buf, sizeof(buf), "%.17g", core::DoubleFromBits(bits) - 1.0);
            break;
        }
    }
    return std::string(buf);
}

}  // namespace

int main(int argc, char* argv[]) {
    Log::Init(cfg::kLogFile);
    CrashHandler::Init();

    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        Log::Shutdown();
        return 0;
    }
    if (args.bad) {
        PrintUsage();
        Log::Shutdown();
        return 1;
    }

    // --- Init generator ---
    rng::TraceRandom gen = args.randomState ? rng::TraceRandom() : rng::TraceRandom(args.seed);
    if (!args.loadPath.empty()) {
        if (!rng::LoadStateFromFile(gen, args.loadPath.c_str())) {
            Log::Shutdown();
            return 1;
        }
        LOG_INFO("Loaded state from {}", args.loadPath);
    }
    const rng::TraceState initial = gen.State();

    // --- Generate ---
    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    std::vector<uint64_t> raw;
    raw.reserve(static_cast<size_t>(args.count));
    for (int i = 0; i < args.count; ++i) {
        raw.push_back(gen.NextULong());
    }

    const auto wallEnd = Clock::now();
    const double wallUs = std::chrono::duration<double, std::micro>(wallEnd - wallStart).count();
    const rng::TraceState afterRun = gen.State();

    // --- Rewind and verify ---
    bool rewindOk = true;
    int mismatches = 0;
    if (args.rewind) {
        for (int i = args.count - 1; i >= 0; --i) {
            if (gen.PreviousULong() != raw[static_cast<size_t>(i)]) {
                ++mismatches;
            }
        }
        rewindOk = (mismatches == 0) && (gen.State() == initial);
        if (!rewindOk) {
            LOG_ERROR("Rewind mismatch: {} value(s) differ, state restored: {}",
                      mismatches, gen.State() == initial);
        }
        // Leave the generator where the forward run ended.
        for (int i = 0; i < args.count; ++i) {
            gen.NextULong();
        }
    }

    bool saveOk = true;
    if (!args.savePath.empty()) {
        saveOk = rng::SaveStateToFile(gen, args.savePath.c_str());
        if (saveOk) {
            LOG_INFO("Saved state to {}", args.savePath);
        }
    }

    // --- Output ---
    const char* rewindStatus = !args.rewind ? "skipped" : (rewindOk ? "OK" : "FAILED");
    if (args.json) {
        std::printf("{\n");
        std::printf("  \"tag\": \"%s\",\n", gen.DefaultTag().c_str());
        std::printf("  \"seed\": \"0x%016" PRIX64 "\",\n", args.seed);
        std::printf("  \"mode\": \"%s\",\n", ModeName(args.mode));
        std::printf("  \"count\": %d,\n", args.count);
        std::printf("  \"values\": [");
        for (size_t i = 0; i < raw.size(); ++i) {
            const std::string v = FormatValue(args.mode, raw[i]);
            if (args.mode == OutputMode::ULong) {
                std::printf("%s\"%s\"", i ? ", " : "", v.c_str());
            } else {
                std::printf("%s%s", i ? ", " : "", v.c_str());
            }
        }
        std::printf("],\n");
        std::printf("  \"rewind\": \"%s\",\n", rewindStatus);
        std::printf("  \"stream\": \"0x%016" PRIX64 "\",\n", afterRun.f);
        if (args.serialize) {
            std::printf("  \"serialized\": \"%s\",\n", gen.StringSerialize().c_str());
        }
        std::printf("  \"wall_us\": %.2f\n", wallUs);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("seed=0x%016" PRIX64 "  mode=%-6s  count=%-8d  rewind=%-7s  wall=%.2fus\n",
                    args.seed, ModeName(args.mode), args.count, rewindStatus, wallUs);
    } else {
        std::printf("=== Trace Runner ===\n");
        std::printf("tag:     %s\n", gen.DefaultTag().c_str());
        std::printf("seed:    0x%016" PRIX64 "\n", args.seed);
        std::printf("stream:  0x%016" PRIX64 "\n", afterRun.f);
        std::printf("mode:    %s\n", ModeName(args.mode));
        for (size_t i = 0; i < raw.size(); ++i) {
            std::printf("%6zu  %s\n", i, FormatValue(args.mode, raw[i]).c_str());
        }
        std::printf("rewind:  %s\n", rewindStatus);
        if (args.serialize) {
            std::printf("state:   %s\n", gen.StringSerialize().c_str());
        }
        std::printf("wall:    %.2f us\n", wallUs);
    }

    Log::Shutdown();
    return (rewindOk && saveOk) ? 0 : 1;
}
