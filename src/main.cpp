#include <iostream>
#include <string>
#include <vector>
#include "run_cmd.hpp"
#include "status.hpp"

static void print_usage() {
    std::cout << "Usage: evoloop <command> [options]\n\n"
              << "Commands:\n"
              << "  run -m MSG [--type T] [--model M] [--budget USD]\n"
              << "      [--image PATH] [--effort low|medium|high|xhigh]\n"
              << "                              Run one task through the agent loop\n"
              << "  cost MODEL PROMPT COMPLETION [CACHED]\n"
              << "                              Estimate the cost of one call\n"
              << "  status                      Show configuration and spend\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "run") {
        evoloop::RunOptions opts;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-m" || args[i] == "--message") && i + 1 < args.size()) {
                opts.message = args[++i];
            } else if (args[i] == "--type" && i + 1 < args.size()) {
                opts.type = args[++i];
            } else if (args[i] == "--model" && i + 1 < args.size()) {
                opts.model = args[++i];
            } else if (args[i] == "--budget" && i + 1 < args.size()) {
                try {
                    opts.budget_usd = std::stod(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid --budget value: " << args[i] << "\n";
                    return 1;
                }
            } else if (args[i] == "--image" && i + 1 < args.size()) {
                opts.image_path = args[++i];
            } else if (args[i] == "--effort" && i + 1 < args.size()) {
                opts.reasoning_effort = args[++i];
            }
        }
        return evoloop::cmd_run(opts);
    }
    else if (cmd == "cost") {
        return evoloop::cmd_cost(args);
    }
    else if (cmd == "status") {
        return evoloop::cmd_status();
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
