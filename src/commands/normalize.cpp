#include "commands/normalize.hpp"

#include "agents/AgentRunner.hpp"
#include "io/JsonIO.hpp"
#include "normalize/JsonLocator.hpp"
#include "pipeline/Pipeline.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static size_t get_arg_size(int argc, char** argv, const std::string& key, size_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        const long long v = std::stoll(s);
        return v < 0 ? def : (size_t)v;
    } catch (const std::exception&) {
        return def;
    }
}

static int normalize_usage() {
    std::cerr
        << "usage:\n"
        << "  jobjumper normalize --kind <match|fit|research|prep|resume|document> [options]\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  raw model output, default: stdin\n"
        << "  --out <path>                 default: stdout\n"
        << "  --policy <propagate|default> default: per kind (prep substitutes defaults)\n"
        << "  --max_sources <n>            default: 10\n"
        << "  --max_voices <n>             default: 5\n"
        << "  --verbose                    print locate diagnostics to stderr\n";
    return 1;
}

int cmd_normalize(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return normalize_usage();

    const std::string kind = get_arg(argc, argv, "--kind", "");
    const std::string in_path = get_arg(argc, argv, "--in", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");
    const bool verbose = has_flag(argc, argv, "--verbose");

    agents::Feature feature = agents::Feature::MatchScore;
    if (!agents::parse_feature(kind, feature)) {
        std::cerr << "error: missing or unknown --kind: '" << kind << "'\n";
        normalize_usage();
        return 2;
    }

    pipeline::PipelineOptions opt = agents::default_options(feature);
    const std::string policy = get_arg(argc, argv, "--policy", "");
    if (!policy.empty() && !pipeline::parse_policy(policy, opt.on_failure)) {
        std::cerr << "error: --policy must be 'propagate' or 'default'\n";
        return 2;
    }
    opt.limits.max_sources = get_arg_size(argc, argv, "--max_sources", opt.limits.max_sources);
    opt.limits.max_employee_voices = get_arg_size(argc, argv, "--max_voices", opt.limits.max_employee_voices);

    std::string raw;
    try {
        raw = io::read_text(in_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (verbose) {
        const normalize::LocateResult loc = normalize::locate(raw);
        std::cerr << "[normalize] kind=" << agents::feature_name(feature)
                  << " policy=" << pipeline::policy_str(opt.on_failure)
                  << " input_bytes=" << raw.size()
                  << " locate=" << (loc.ok() ? "ok" : normalize::parse_error_str(loc.error));
        if (!loc.ok()) std::cerr << " (" << loc.detail << ")";
        std::cerr << "\n";
    }

    try {
        const nlohmann::json out = agents::run_feature(feature, raw, opt);
        io::write_json(out_path, out);
    } catch (const pipeline::StructuralFailure& e) {
        std::cerr << "error: could not recover a result, try again (" << e.what() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (!out_path.empty() && out_path != "-") std::cout << "OUT_NORMALIZE: " << out_path << "\n";
    return 0;
}
