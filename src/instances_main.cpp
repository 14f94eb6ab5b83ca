#include "config.hpp"
#include "instance_manager.hpp"
#include "process_probe.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char **argv) {
    Config config = LoadConfig();
    const std::vector<std::string> args = ApplyCommandLine(config, argc, argv);
    SetLogLevel(config.log_level);

    auto probe = MakeProcessProbe();
    ProcessInstanceManager manager(config, *probe, std::cout);
    return manager.Run(args.empty() ? std::string() : args.front());
}
