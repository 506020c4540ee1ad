#include "commands/agent.hpp"

#include "agents/AgentRunner.hpp"
#include "io/JsonIO.hpp"
#include "llm/MockLLMClient.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

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

static int agent_usage() {
    std::cerr
        << "usage:\n"
        << "  jobjumper agent --kind <match|fit|research|prep|resume|document> --mock <dir> --id <request_id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --prompt <str>               forwarded to the model client (mock ignores it)\n"
        << "  --out <path>                 default: stdout\n"
        << "  --policy <propagate|default> default: per kind\n"
        << "  --verbose\n";
    return 1;
}

int cmd_agent(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return agent_usage();

    const std::string kind = get_arg(argc, argv, "--kind", "");
    const std::string mock_dir = get_arg(argc, argv, "--mock", "");
    const std::string request_id = get_arg(argc, argv, "--id", "");
    const std::string prompt = get_arg(argc, argv, "--prompt", "");
    const std::string out_path = get_arg(argc, argv, "--out", "");
    const bool verbose = has_flag(argc, argv, "--verbose");

    agents::Feature feature = agents::Feature::MatchScore;
    if (!agents::parse_feature(kind, feature)) {
        std::cerr << "error: missing or unknown --kind: '" << kind << "'\n";
        agent_usage();
        return 2;
    }
    if (mock_dir.empty() || request_id.empty()) {
        std::cerr << "error: --mock and --id are required\n";
        agent_usage();
        return 2;
    }

    pipeline::PipelineOptions opt = agents::default_options(feature);
    const std::string policy = get_arg(argc, argv, "--policy", "");
    if (!policy.empty() && !pipeline::parse_policy(policy, opt.on_failure)) {
        std::cerr << "error: --policy must be 'propagate' or 'default'\n";
        return 2;
    }

    llm::MockLLMClient client(mock_dir);
    if (verbose) {
        const fs::path p = client.path_for(request_id);
        std::cerr << "[agent] kind=" << agents::feature_name(feature)
                  << " policy=" << pipeline::policy_str(opt.on_failure)
                  << " mock=" << p.string()
                  << (fs::exists(p) ? "" : " (missing: treated as no model output)") << "\n";
    }

    agents::AgentRunner runner(client);
    try {
        io::write_json(out_path, runner.run(feature, request_id, prompt, opt));
    } catch (const pipeline::StructuralFailure& e) {
        std::cerr << "error: could not recover a result, try again (" << e.what() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (!out_path.empty() && out_path != "-") std::cout << "OUT_AGENT: " << out_path << "\n";
    return 0;
}
