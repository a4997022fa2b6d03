/*
 * @FileName   : quintBuild.cpp
 * @CreateAt   : 2026/9/25
 * @Description: command-line tool loading an N-Triples / N-Quads / INSERT DATA file into a store.
 */

#include <string>
#include <iostream>

#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>

#include "common/error.hpp"
#include "common/utils.hpp"
#include "database/quint_store.hpp"
#include "parser/sparql_parser.hpp"

namespace opt = boost::program_options;

static const auto _ = []{
    spdlog::set_pattern("[%l]\t%v");
    return 0;
}();

int main(int argc, char *argv[]) {
    opt::options_description desc("quintBuild");
    desc.add_options()
            ("endpoint,e", opt::value<std::string>()->default_value("sqlite:quint.db"), "store endpoint")
            ("data,d", opt::value<std::string>(), "RDF data file")
            ("graph,g", opt::value<std::string>(), "graph IRI of triples without a graph")
            ("debug", "log generated SQL")
            ("help,h", "produce help message");

    opt::variables_map vm;
    try {
        opt::store(opt::parse_command_line(argc, argv, desc), vm);
        opt::notify(vm);
    } catch (const opt::error &e) {
        spdlog::error("{}", e.what());
        std::cerr << desc << std::endl;
        return 1;
    }

    if (vm.count("help") || !vm.count("data")) {
        std::cout << desc << std::endl;
        return 1;
    }
    if (vm.count("debug")) {
        spdlog::set_level(spdlog::level::debug);
    }

    std::string endpoint = vm["endpoint"].as<std::string>();
    std::string datafile = vm["data"].as<std::string>();
    quint::Term graph = vm.count("graph") ? quint::Term::namedNode(vm["graph"].as<std::string>())
                                          : quint::Term::defaultGraph();

    try {
        quint::SparqlParser parser;
        quint::QuintList quints;
        double used_time = 0;
        std::tie(quints, used_time) = quint::timeit([&] {
            return parser.parseData(quint::readFile(datafile), graph);
        });
        spdlog::info("parsed {} quints from '{}' in {} ms.", quints.size(), datafile, used_time);

        auto store = quint::QuintStoreBuilder::Create(endpoint);
        store->open();
        used_time = quint::timeitVoid([&] { store->multiPut(quints); });
        spdlog::info("loaded into <{}>, used time: {} ms.", endpoint, used_time);

        auto stats = store->stats();
        spdlog::info("{} rows, {} graphs.", stats.total_count, stats.graph_count);
        store->close();
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
