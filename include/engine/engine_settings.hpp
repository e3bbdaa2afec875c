#ifndef MEDIAVAULT_ENGINE_SETTINGS_HPP
#define MEDIAVAULT_ENGINE_SETTINGS_HPP

#include <cstddef>
#include <string>
#include <boost/log/trivial.hpp>

namespace mediavault {
namespace engine {

// Options recognized by the engine itself. Application settings live in the
// persisted config map instead.
struct EngineSettings {
  // Decoded payloads kept in memory; 0 keeps everything
  std::size_t cache_capacity{64};
  // Threads running chunk reads and writes
  std::size_t io_threads{4};
  // Log file; empty keeps the default console output
  std::string log_file;
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
};

} // namespace engine
} // namespace mediavault

#endif // MEDIAVAULT_ENGINE_SETTINGS_HPP
