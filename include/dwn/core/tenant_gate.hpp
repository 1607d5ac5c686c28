#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dwn::core {

/// Decides whether this node serves a tenant.
using tenant_gate_t = std::function<bool(std::string_view tenant)>;

tenant_gate_t allow_all_tenants();

/// Serves exactly the listed tenants. An empty list serves nobody.
tenant_gate_t allow_listed_tenants(std::vector<std::string> tenants);

}  // namespace dwn::core
