#include <dwn/core/conflict_resolver.hpp>

namespace dwn::core {

namespace {

resolution_result admit(const std::vector<message_version>& existing,
                        const std::optional<std::size_t> newest_existing,
                        const bool keep_anchor) {
  auto result = resolution_result{};
  result.outcome = resolution_t::accept;
  result.newest_existing = newest_existing;
  for (const auto& version : existing) {
    if (keep_anchor && version.is_initial_write) {
      result.prune.tombstone = version.message_cid;
      continue;
    }
    result.prune.remove.push_back(version.message_cid);
  }
  return result;
}

}  // namespace

bool outranks(const message_version& lhs, const message_version& rhs) {
  if (lhs.date_created != rhs.date_created) {
    return lhs.date_created > rhs.date_created;
  }
  return lhs.message_cid > rhs.message_cid;
}

std::optional<std::size_t> newest(const std::vector<message_version>& versions) {
  auto best = std::optional<std::size_t>{};
  for (std::size_t i = 0; i < versions.size(); ++i) {
    if (!best || outranks(versions[i], versions[*best])) {
      best = i;
    }
  }
  return best;
}

resolution_result resolve(const std::vector<message_version>& existing,
                          const message_version& incoming) {
  auto newest_existing = newest(existing);

  if (incoming.is_delete &&
      (!newest_existing || existing[*newest_existing].is_delete)) {
    auto result = resolution_result{};
    result.outcome = resolution_t::not_found;
    result.newest_existing = newest_existing;
    return result;
  }

  if (newest_existing && !outranks(incoming, existing[*newest_existing])) {
    auto result = resolution_result{};
    result.outcome = resolution_t::conflict;
    result.newest_existing = newest_existing;
    return result;
  }

  return admit(existing, newest_existing, true);
}

resolution_result resolve_configuration(
    const std::vector<message_version>& existing,
    const message_version& incoming) {
  auto newest_existing = newest(existing);
  if (newest_existing && !outranks(incoming, existing[*newest_existing])) {
    auto result = resolution_result{};
    result.outcome = resolution_t::conflict;
    result.newest_existing = newest_existing;
    return result;
  }
  return admit(existing, newest_existing, false);
}

}  // namespace dwn::core
