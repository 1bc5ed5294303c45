#include "ids.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace issueflow::util {

std::string GenerateIssueId(const std::string& prefix) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::ostringstream oss;
  oss << prefix << '-' << std::hex << std::setw(6) << std::setfill('0') << (rng() & 0xFFFFFF);
  return oss.str();
}

std::string ChildIssueId(const std::string& parent_id, uint64_t child_number) {
  return parent_id + "." + std::to_string(child_number);
}

} // namespace issueflow::util
