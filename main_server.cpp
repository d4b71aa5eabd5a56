/**
 * # build the server
 * cmake -S . -B build && cmake --build build --target zerotrace_server
 * sudo ./build/zerotrace_server --iface=eth0
 *
 * Examples with options:
 *   sudo ./build/zerotrace_server --iface=eth0 --port=8080 --max-hops=30 --timeout-ms=1000
 *   sudo ./build/zerotrace_server --iface=ens3 --logfile=trace.jsonl --errlog=diag.txt --report
 */

#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "diag_logger.hpp"
#include "json_log.hpp"
#include "trace_config.hpp"
#include "trace_errors.hpp"
#include "trace_server.hpp"
#include "zero_trace.hpp"

using namespace std;
using namespace zt;

static TraceServer *g_server = nullptr;

static void on_signal(int)
{
    if (g_server)
        g_server->stop();
}

static void print_usage(const char *argv0)
{
    cerr << "Usage:\n"
         << "  " << argv0 << " --iface=NAME [--port=8080] [--max-hops=30] [--min-ttl=1]\n"
         << "      [--timeout-ms=1000] [--logfile=logFile.jsonl] [--errlog=errlog.txt] [--report]\n"
         << "\nNotes:\n"
         << "  - Raw ICMP capture is required (needs sudo or CAP_NET_RAW).\n"
         << "  - --iface must be the interface client traffic arrives on.\n"
         << "  - --report sends each trace result back to the client as JSON.\n";
}

int main(int argc, char *argv[])
{
    ios::sync_with_stdio(false);

    ServerConfig cfg;
    try
    {
        cfg = parse_server_args(vector<string>(argv + 1, argv + argc));
    }
    catch (const exception &e)
    {
        cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    JsonLineLogger records(cfg.logfile);
    if (!records.ok())
    {
        cerr << "Error: couldn't open log file: " << cfg.logfile << "\n";
        return 1;
    }
    DiagLogger diag(cfg.errlog);
    DiagLogger *dptr = diag.ok() ? &diag : nullptr;
    if (!diag.ok())
        cerr << "Warning: couldn't open err log file: " << cfg.errlog << "\n";

    try
    {
        ZeroTrace engine(cfg.trace, &records, dptr);
        TraceServer server(cfg, engine, records, dptr);
        server.listen();

        g_server = &server;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        cout << "[zerotrace] listening on :" << cfg.port << " iface=" << cfg.trace.interface_name << "\n";
        cout.flush();
        server.serve();
        g_server = nullptr;
        return 0;
    }
    catch (const ConfigurationError &e)
    {
        cerr << "Configuration error: " << e.what() << '\n';
        return 2;
    }
    catch (const exception &e)
    {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
