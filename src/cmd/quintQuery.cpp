/*
 * @FileName   : quintQuery.cpp
 * @CreateAt   : 2026/9/25
 * @Description: command-line tool running SELECT / ASK queries against a store.
 *               Without --query it reads query file paths from stdin until `exit`.
 */

#include <string>
#include <iostream>

#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>

#include "common/error.hpp"
#include "common/utils.hpp"
#include "database/quint_store.hpp"
#include "parser/sparql_parser.hpp"
#include "query/optimized_engine.hpp"

namespace opt = boost::program_options;

static const auto _ = []{
    spdlog::set_pattern("[%l]\t%v");
    return 0;
}();

void execute_query(quint::OptimizedEngine &engine, const std::string &sparql) {
    auto form = quint::SparqlParser::classify(sparql);
    if (form == quint::ASK_QUERY) {
        bool answer = engine.queryBoolean(sparql);
        spdlog::info("Query time: {} ms.", engine.getQueryTime());
        std::cout << (answer ? "true" : "false") << std::endl;
        return;
    }
    if (form != quint::SELECT_QUERY) {
        throw quint::UnsupportedQueryError("only SELECT and ASK queries can be run here");
    }

    auto result = engine.queryBindings(sparql);
    spdlog::info("Query time: {} ms.", engine.getQueryTime());
    if (result.empty()) {
        spdlog::info("[Empty Result]");
        return;
    }
    spdlog::info("{} result(s).", result.size());

    const auto &variables = result.variables();
    std::cout << "\n=============================================================\n";
    for (const auto &variable : variables) {
        std::cout << "?" << variable << "\t";
    }
    std::cout << std::endl;

    for (const auto &row : result) {
        for (const auto &variable : variables) {
            auto it = row.find(variable);
            std::cout << (it == row.end() ? "" : it->second.toString()) << "\t";
        }
        std::cout << std::endl;
    }
}

/* false when the query could not be run */
bool run_query_file(quint::OptimizedEngine &engine, const std::string &query_file) {
    try {
        execute_query(engine, quint::readFile(query_file));
        return true;
    } catch (const quint::UnsupportedQueryError &e) {
        spdlog::error("unsupported query: {}", e.what());
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
    }
    return false;
}

int main(int argc, char **argv) {
    std::ios::sync_with_stdio(false);

    opt::options_description desc("quintQuery");
    desc.add_options()
            ("endpoint,e", opt::value<std::string>()->default_value("sqlite:quint.db"), "store endpoint")
            ("query,q", opt::value<std::string>(), "SPARQL query file")
            ("debug", "log planner decisions and generated SQL")
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

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 1;
    }
    if (vm.count("debug")) {
        spdlog::set_level(spdlog::level::debug);
    }

    std::shared_ptr<quint::QuintStore> store;
    try {
        store = quint::QuintStoreBuilder::Create(vm["endpoint"].as<std::string>());
        double used_time = quint::timeitVoid([&] { store->open(); });
        spdlog::info("<{}> opened, used {} ms.", vm["endpoint"].as<std::string>(), used_time);
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    quint::OptimizedEngine engine(store);
    int status = 0;
    if (vm.count("query")) {
        status = run_query_file(engine, vm["query"].as<std::string>()) ? 0 : 1;
    } else {
        std::string query_file;
        for (;;) {
            std::cout << "\nquery >  " << std::flush;
            if (!(std::cin >> query_file)) break;
            if (query_file == "exit" || query_file == "quit" || query_file == "q") {
                break;
            }
            run_query_file(engine, query_file);
        }
    }

    store->close();
    return status;
}
