#pragma once

#include "ProbeFactory.hpp"

#include <string>

struct BalancerOptions {
    // per-probe timeout as a share of the round interval, in (0, 1]
    double probe_timeout_fraction = 0.5;

    std::string rpc_method = "web3_clientVersion";

    ProbeFactory probe_factory = make_probe;
};
