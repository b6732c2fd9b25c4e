/*
 * File: src/demo_main.cpp
 * Project: Demo HTTP Service
 * Purpose: Main server binary: GET /, /health, /info, /metrics
 * Notes:
 *  - Config from LISTEN_HOST/PORT/APP_ENV, then --host/--port/--env/--threads
 *  - Exit 1 when the port cannot be bound, 2 on bad usage
 *  - SIGINT/SIGTERM close the listener and stop the loop
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "demo_http.hpp"
#include "demo_state.hpp"

int main(int argc, char **argv)
{
    ServiceConfig cfg = config_from_env();
    try
    {
        if (!parse_args(argc, argv, cfg))
        {
            std::cout << usage(argv[0]);
            return 0;
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "demo_server: " << e.what() << "\n"
                  << usage(argv[0]);
        return 2;
    }

    try
    {
        boost::asio::io_context ioc{static_cast<int>(cfg.threads)};
        ServiceState state{cfg};

        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(cfg.host), cfg.port};
        HttpServer http{ioc, ep, state};

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code &ec, int sig)
                           {
            if (ec) return;
            std::cout << "demo_server: signal " << sig << ", shutting down after "
                      << state.requests.value() << " requests\n";
            http.stop();
            ioc.stop(); });

        std::cout << "demo_server listening http=" << cfg.host << ":" << http.port()
                  << " env=" << cfg.environment << " threads=" << cfg.threads << std::endl;

        std::vector<std::thread> workers;
        workers.reserve(cfg.threads - 1);
        for (unsigned i = 1; i < cfg.threads; ++i)
            workers.emplace_back([&ioc]
                                 { ioc.run(); });
        ioc.run();
        for (auto &t : workers)
            t.join();
    }
    catch (const std::exception &e)
    {
        std::cerr << "demo_server: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
