#include "trace_config.hpp"

#include <stdexcept>

namespace zt {

namespace {

int parse_int(const std::string& flag, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("bad value for " + flag + ": '" + value + "'");
    }
    if (used != value.size())
        throw std::invalid_argument("bad value for " + flag + ": '" + value + "'");
    return v;
}

bool take(const std::string& arg, const std::string& flag, std::string& value) {
    if (arg.rfind(flag, 0) != 0)
        return false;
    value = arg.substr(flag.size());
    return true;
}

} // namespace

void TraceConfig::validate() const {
    if (interface_name.empty())
        throw std::invalid_argument("interface name is required");
    if (min_ttl < 1 || min_ttl > kMaxTtl)
        throw std::invalid_argument("min TTL must be within 1.." + std::to_string(kMaxTtl));
    if (max_hops < min_ttl || max_hops > kMaxTtl)
        throw std::invalid_argument("max hops must be within min TTL.." + std::to_string(kMaxTtl));
    if (hop_timeout.count() <= 0)
        throw std::invalid_argument("hop timeout must be positive");
    if (reap_interval.count() <= 0 || reap_grace.count() < 0)
        throw std::invalid_argument("bad reaper settings");
}

ServerConfig parse_server_args(const std::vector<std::string>& args) {
    ServerConfig cfg;
    std::string v;
    for (const auto& a : args) {
        if (take(a, "--iface=", v))            cfg.trace.interface_name = v;
        else if (take(a, "--port=", v))        cfg.port = parse_int("--port", v);
        else if (take(a, "--max-hops=", v))    cfg.trace.max_hops = parse_int("--max-hops", v);
        else if (take(a, "--min-ttl=", v))     cfg.trace.min_ttl = parse_int("--min-ttl", v);
        else if (take(a, "--timeout-ms=", v))  cfg.trace.hop_timeout = std::chrono::milliseconds(parse_int("--timeout-ms", v));
        else if (take(a, "--logfile=", v))     cfg.logfile = v;
        else if (take(a, "--errlog=", v))      cfg.errlog = v;
        else if (a == "--report")              cfg.report = true;
        else throw std::invalid_argument("unknown argument: " + a);
    }
    if (cfg.port < 1 || cfg.port > 65535)
        throw std::invalid_argument("port must be within 1..65535");
    if (cfg.logfile.empty())
        throw std::invalid_argument("--logfile must not be empty");
    cfg.trace.validate();
    return cfg;
}

} // namespace zt
