/**
 * @file rdfpg_admin.cpp
 * @brief Schema lifecycle, statistics and pattern dumps for one store
 */

#include <store/triple_store.hpp>
#include <config/store_config.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace RdfPg;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " (--config \"user=... dbname=...\" | --config-file <json>)"
              << " --identifier <id> <command>\n";
    std::cerr << "\nCommands:\n"
              << "  init                 create the store, or empty it if present\n"
              << "  destroy              drop every table and index of the store\n"
              << "  exists               exit 0 if the store exists, 2 otherwise\n"
              << "  stats                per-partition statement counts\n"
              << "  contexts             list the contexts of the store\n"
              << "  count [context]      number of statements, optionally in one context\n"
              << "  dump [s p o]         matching triples; '-' is a wildcard\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " --config \"user=postgres dbname=rdf\" --identifier kb1 init\n";
    std::cerr << "  " << prog << " --config-file store.json --identifier kb1 dump - "
              << RDF_TYPE << " -\n";
}

// "-" is a wildcard, <...> a URI, _:x a blank node, anything else a plain literal
TermPattern parse_position(const std::string& arg) {
    if (arg == "-") return TermPattern::any();
    if (arg.size() >= 2 && arg.front() == '<' && arg.back() == '>') {
        return Term::uri(arg.substr(1, arg.size() - 2));
    }
    if (arg.rfind("_:", 0) == 0) return Term::bnode(arg.substr(2));
    if (arg.find("://") != std::string::npos) return Term::uri(arg);
    return Term::literal(arg);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_string;
    std::string config_file;
    std::string identifier;
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_string = argv[++i];
        } else if (arg == "--config-file" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--identifier" && i + 1 < argc) {
            identifier = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            Logger::set_level(Logger::Level::Debug);
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            command.push_back(arg);
        }
    }

    if (command.empty() || identifier.empty() || (config_string.empty() == config_file.empty())) {
        usage(argv[0]);
        return 1;
    }

    const std::string& cmd = command[0];

    try {
        StoreConfig config = config_file.empty() ? StoreConfig::parse(config_string)
                                                 : StoreConfig::load_file(config_file);
        TripleStore store(identifier);

        if (cmd == "destroy") {
            size_t failures = store.destroy(config);
            std::cout << "Destroyed " << identifier << " (" << store.tables().prefix << ")";
            if (failures) std::cout << ", " << failures << " statements failed";
            std::cout << "\n";
            return failures ? 1 : 0;
        }

        StoreStatus status = store.open(config, cmd == "init");

        if (cmd == "init") {
            if (status != StoreStatus::Valid) {
                Logger::error("Store " + identifier + " could not be created");
                return 1;
            }
            std::cout << "Initialized " << identifier << " (" << store.tables().prefix << ")\n";
            return 0;
        }

        if (cmd == "exists") {
            bool present = status == StoreStatus::Valid;
            std::cout << identifier << (present ? " exists" : " does not exist") << "\n";
            return present ? 0 : 2;
        }

        if (status != StoreStatus::Valid) {
            Logger::error("No store named " + identifier + " (" + store.tables().prefix + ")");
            return 1;
        }

        if (cmd == "stats") {
            StoreStatistics stats = store.statistics();
            std::cout << store.describe() << "\n"
                      << "\n=== Partitions ===\n"
                      << "  asserted: " << stats.asserted_statements << "\n"
                      << "  type:     " << stats.type_statements << "\n"
                      << "  literal:  " << stats.literal_statements << "\n"
                      << "  quoted:   " << stats.quoted_statements << "\n"
                      << "  total:    " << stats.total() << "\n"
                      << "  contexts: " << stats.contexts << "\n";
        } else if (cmd == "contexts") {
            for (const auto& graph : store.contexts()) {
                std::cout << graph.identifier.to_string() << "\n";
            }
        } else if (cmd == "count") {
            TermPattern context = command.size() > 1 ? TermPattern(Graph::named(command[1]))
                                                     : TermPattern::any();
            std::cout << store.count(context) << "\n";
        } else if (cmd == "dump") {
            TriplePattern pattern;
            if (command.size() > 1) pattern.subject = parse_position(command[1]);
            if (command.size() > 2) pattern.predicate = parse_position(command[2]);
            if (command.size() > 3) pattern.object = parse_position(command[3]);

            size_t n = 0;
            TripleCursor cursor = store.triples(pattern);
            while (auto match = cursor.next()) {
                const Triple& t = match->triple;
                for (const auto& graph : match->contexts) {
                    std::cout << t.subject.to_string() << " " << t.predicate.to_string() << " "
                              << t.object.to_string() << " " << graph.identifier.to_string() << " .\n";
                }
                ++n;
            }
            std::cerr << n << " triples\n";
        } else {
            std::cerr << "Unknown command: " << cmd << "\n";
            usage(argv[0]);
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
