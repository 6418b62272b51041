#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "node.hpp"
#include "transport.hpp"
#include "workloads.hpp"

static std::string parse_string(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i] && i + 1 < argc) return argv[i + 1];
    }
    return def;
}

int main(int argc, char** argv)
{
    const std::string workload_name = parse_string(argc, argv, "-workload", "");
    const std::string config_path = parse_string(argc, argv, "-config", "");

    WorkloadType type;
    if (!parse_workload(workload_name, type)) {
        std::cerr << "Usage: " << argv[0]
                  << " -workload <echo|unique-ids|broadcast|counter|seq-kv-counter> [-config <file.json>]\n";
        return 2;
    }

    NodeConfig cfg = load_config(config_path);

    Logger logger;
    logger.set_verbose(cfg.logging.verbose);
    if (!cfg.logging.message_log_file.empty() && !logger.open_message_log(cfg.logging.message_log_file)) {
        logger.warn("could not open message log '" + cfg.logging.message_log_file + "'");
    }

    StdioTransport transport;
    Node node(transport, cfg, logger);
    auto workload = make_workload(type, node);
    logger.debug(std::string("starting ") + workload->type_name() + " node");

    transport.start();

    try {
        node.run();
    } catch (const FatalError& e) {
        logger.error(std::string("fatal: ") + e.what());
        logger.close();
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("unrecoverable: ") + e.what());
        logger.close();
        return 1;
    }

    logger.close();
    return 0;
}
