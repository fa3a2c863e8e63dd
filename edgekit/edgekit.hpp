#pragma once

//
// ... edgekit header files
//
#include <edgekit/config.hpp>
#include <edgekit/data.hpp>
#include <edgekit/data/log.hpp>

namespace edgekit {
  using ::edgekit::data::detail::Log_level;
  using ::edgekit::data::detail::Logger;

} // end of namespace edgekit
