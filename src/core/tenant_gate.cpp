#include <dwn/core/tenant_gate.hpp>

#include <algorithm>
#include <set>

namespace dwn::core {

tenant_gate_t allow_all_tenants() {
  return [](std::string_view) { return true; };
}

tenant_gate_t allow_listed_tenants(std::vector<std::string> tenants) {
  auto served = std::set<std::string, std::less<>>{
      std::make_move_iterator(std::begin(tenants)),
      std::make_move_iterator(std::end(tenants))};
  return [served = std::move(served)](const std::string_view tenant) {
    return served.contains(tenant);
  };
}

}  // namespace dwn::core
