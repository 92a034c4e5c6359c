#include "vbg/error.h"

#include "vbg/string.h"

namespace vbg {

malformed_registry::malformed_registry(const std::string& message,
                                       const std::string& location)
    : error("malformed registry: " + message + " at " + location),
      message_(message),
      location_(location) {}

cyclic_type_dependency::cyclic_type_dependency(std::vector<std::string> cycle)
    : error("cyclic type dependency: " + join(" -> ", cycle)),
      cycle_(std::move(cycle)) {}

dangling_reference::dangling_reference(const std::string& name,
                                       const std::string& referrer)
    : error("dangling reference: " + referrer + " references " + name +
            " which was filtered out"),
      name_(name),
      referrer_(referrer) {}

emission_failure::emission_failure(const std::string& path,
                                   const std::string& cause)
    : error("emission failure: " + path + ": " + cause), path_(path) {}

}  // namespace vbg
