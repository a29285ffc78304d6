#pragma once

#ifndef RMQCONF_VERSION
#define RMQCONF_VERSION "0.0.0-dev"
#endif

namespace rmqconf::version {

constexpr const char* VERSION = RMQCONF_VERSION;

}  // namespace rmqconf::version
