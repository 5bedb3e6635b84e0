#pragma once
#include <memory>
#include "DispatchingResourceHandler.hpp"
#include "../../config/Config.hpp"

namespace MdResource {

// Assembles the handler chain described by config.
// Order: file handler, then data handler. strict_mode yields a chain that
// reads nothing.
std::unique_ptr<DispatchingResourceHandler> BuildHandlerChain(const Config& config);

}
