#include "core/context.h"
#include <utility>

namespace chaosforge {

namespace {

Config validated(Config cfg) {
    cfg.validate();
    return cfg;
}

}  // namespace

ChaosContext::ChaosContext(Config cfg, EventSink& sink)
    : config(validated(std::move(cfg))),
      resources(config.max_cpu, config.max_mem),
      events(sink) {}

}  // namespace chaosforge
